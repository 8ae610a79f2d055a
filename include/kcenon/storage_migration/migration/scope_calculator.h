/**
 * @file scope_calculator.h
 * @brief Enumerates a source backend into a migration scope
 */

#ifndef KCENON_STORAGE_MIGRATION_MIGRATION_SCOPE_CALCULATOR_H
#define KCENON_STORAGE_MIGRATION_MIGRATION_SCOPE_CALCULATOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "kcenon/storage_migration/core/cancellation_token.h"
#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/migration/migration_types.h"
#include "kcenon/storage_migration/storage/storage_backend.h"

namespace kcenon::storage_migration {

class job_store;

/**
 * @brief Scope calculator
 *
 * Pages through the source listing; no more than one page is held in
 * memory at a time. calculate() only counts, build_manifest() also
 * streams every page into the job store as the job's manifest snapshot.
 */
class scope_calculator {
public:
    struct settings {
        std::size_t page_size = 1000;
        uint64_t assumed_throughput_bytes_per_second = 1024 * 1024;
    };

    explicit scope_calculator(settings config);

    /**
     * @brief Count objects and bytes under @p prefix (read-only)
     */
    [[nodiscard]] auto calculate(storage_backend& source, const std::string& prefix,
                                 const cancellation_token* token = nullptr) const
        -> result<migration_scope>;

    /**
     * @brief Enumerate the source into the manifest of a pending job
     *
     * Stops with operation_cancelled when @p token is triggered between
     * pages; the partial manifest stays unfinalized.
     */
    [[nodiscard]] auto build_manifest(storage_backend& source, job_store& store,
                                      const job_id& id, const std::string& prefix,
                                      const cancellation_token* token = nullptr) const
        -> result<migration_scope>;

    /**
     * @brief Scope summary for the given totals
     */
    [[nodiscard]] auto summarize(uint64_t file_count, uint64_t total_bytes) const
        -> migration_scope;

    [[nodiscard]] static auto format_size(uint64_t bytes) -> std::string;

    [[nodiscard]] static auto format_duration(double seconds) -> std::string;

private:
    template <typename PageSink>
    auto enumerate(storage_backend& source, const std::string& prefix,
                   const cancellation_token* token, PageSink&& sink) const
        -> result<migration_scope>;

    settings settings_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_MIGRATION_SCOPE_CALCULATOR_H
