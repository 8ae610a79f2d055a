/**
 * @file copy_worker.h
 * @brief Copy/verify worker loop of a migration job
 *
 * A worker repeatedly claims one pending record, streams the object from
 * the source backend to the target backend in bounded blocks while hashing
 * it, verifies the checksums and reports the result through the progress
 * tracker. Stop requests are honoured between files only.
 */

#ifndef KCENON_STORAGE_MIGRATION_MIGRATION_COPY_WORKER_H
#define KCENON_STORAGE_MIGRATION_MIGRATION_COPY_WORKER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/storage_migration/config/engine_config.h"
#include "kcenon/storage_migration/core/cancellation_token.h"
#include "kcenon/storage_migration/core/job_id.h"
#include "kcenon/storage_migration/core/retry_policy.h"
#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/migration/migration_types.h"
#include "kcenon/storage_migration/storage/storage_backend.h"

namespace kcenon::storage_migration {

class job_store;
class progress_tracker;

/**
 * @brief Per-job settings shared by all workers of the job
 */
struct copy_settings {
    /// Backoff between attempts
    retry_policy retry;

    /// Attempts per file, first attempt included
    std::size_t max_attempts = 3;

    std::size_t buffer_size = 256 * 1024;

    bool verify_integrity = true;
    unverified_checksum_mode unverified_mode = unverified_checksum_mode::compute;

    bool continue_on_error = true;
    uint64_t abort_threshold = 0;

    [[nodiscard]] auto computes_checksums() const noexcept -> bool {
        return verify_integrity || unverified_mode == unverified_checksum_mode::compute;
    }

    [[nodiscard]] static auto from(const migration_options& options, const engine_config& config)
        -> copy_settings;
};

/**
 * @brief Resources shared by the workers of one job
 *
 * Owned by the job's supervisor; it outlives every worker it launches.
 */
struct copy_context {
    job_id id;
    std::string workspace_id;
    storage_backend* source = nullptr;
    storage_backend* target = nullptr;
    job_store* store = nullptr;
    progress_tracker* tracker = nullptr;
    cancellation_token* token = nullptr;
    copy_settings settings;
};

/**
 * @brief Outcome of one copy attempt that reached finalize()
 */
struct copy_attempt {
    uint64_t bytes_copied = 0;
    std::string source_checksum;
    std::string target_checksum;
};

/**
 * @brief Copy/verify worker
 *
 * Each worker owns its stream buffer; workers of the same job only share
 * the job store and the cancellation token.
 */
class copy_worker {
public:
    explicit copy_worker(const copy_context& context);

    /**
     * @brief Claim and process records until none are left or a stop is requested
     * @return Number of records brought to a terminal state
     */
    auto run() -> uint64_t;

    /**
     * @brief Stream one object from source to target and verify it
     *
     * A read or write failure aborts the target writer so no partial
     * object becomes visible. The size read must equal the manifest size,
     * otherwise the object is not finalized.
     */
    [[nodiscard]] auto copy_once(const file_migration_record& record) -> result<copy_attempt>;

private:
    enum class file_outcome { terminal, released, stop };

    auto process(file_migration_record record) -> file_outcome;

    void report_failure(file_migration_record& record, const error& err, std::size_t attempt);
    void raise_fatal(const migration_error_entry& entry, const std::string& reason);

    [[nodiscard]] auto make_entry(const file_migration_record& record, const error& err,
                                  std::size_t attempt) const -> migration_error_entry;

    const copy_context& ctx_;
    std::vector<std::byte> buffer_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_MIGRATION_COPY_WORKER_H
