/**
 * @file engine_config.h
 * @brief Configuration of the storage migration engine
 */

#ifndef KCENON_STORAGE_MIGRATION_CONFIG_ENGINE_CONFIG_H
#define KCENON_STORAGE_MIGRATION_CONFIG_ENGINE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "kcenon/storage_migration/core/retry_policy.h"
#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/migration/migration_types.h"

namespace kcenon::storage_migration {

/**
 * @brief Checksum behaviour when a job runs with verify_integrity off
 */
enum class unverified_checksum_mode {
    compute,  ///< Compute and record checksums for audit, ignore mismatches
    skip      ///< Do not hash at all
};

/**
 * @brief Engine-wide configuration
 */
struct engine_config {
    /// Root of persisted job state and workspace configuration
    std::filesystem::path state_directory;

    /// Options applied when startMigration is called without overrides
    migration_options default_options;

    /// Backoff between attempts; max_attempts is taken from the job options
    retry_policy retry;

    /// Throughput assumed for scope estimates before any is observed
    uint64_t assumed_throughput_bytes_per_second = 1024 * 1024;

    /// Entries requested per listing page
    std::size_t list_page_size = 1000;

    /// Bytes moved per read/write call while streaming an object
    std::size_t stream_buffer_size = 256 * 1024;

    /// Errors kept on the job snapshot
    std::size_t max_error_entries = 100;

    /// Counter updates between rewrites of the job header
    std::size_t checkpoint_interval = 10;

    /// A job whose heartbeat is older than this is considered orphaned
    std::chrono::milliseconds owner_lease{30000};

    /// Interval at which a supervising coordinator refreshes heartbeats
    std::chrono::milliseconds heartbeat_interval{5000};

    unverified_checksum_mode checksum_when_unverified = unverified_checksum_mode::compute;

    /// Base64 32-byte key; stored provider configs are sealed when set
    std::optional<std::string> encryption_key_base64;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Builder for engine_config
 *
 * @code
 * auto config = engine_config_builder()
 *     .with_state_directory("/var/lib/storage-migration")
 *     .with_concurrency(8)
 *     .build();
 * @endcode
 */
class engine_config_builder {
public:
    engine_config_builder() = default;

    auto with_state_directory(std::filesystem::path dir) -> engine_config_builder&;
    auto with_default_options(const migration_options& options) -> engine_config_builder&;
    auto with_concurrency(std::size_t workers) -> engine_config_builder&;
    auto with_retry_policy(const retry_policy& policy) -> engine_config_builder&;
    auto with_assumed_throughput(uint64_t bytes_per_second) -> engine_config_builder&;
    auto with_list_page_size(std::size_t entries) -> engine_config_builder&;
    auto with_stream_buffer_size(std::size_t bytes) -> engine_config_builder&;
    auto with_max_error_entries(std::size_t entries) -> engine_config_builder&;
    auto with_checkpoint_interval(std::size_t updates) -> engine_config_builder&;
    auto with_owner_lease(std::chrono::milliseconds lease) -> engine_config_builder&;
    auto with_heartbeat_interval(std::chrono::milliseconds interval) -> engine_config_builder&;
    auto with_unverified_checksums(unverified_checksum_mode mode) -> engine_config_builder&;
    auto with_encryption_key(std::string base64_key) -> engine_config_builder&;

    /**
     * @brief Validate and return the configuration
     */
    [[nodiscard]] auto build() const -> result<engine_config>;

private:
    engine_config config_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_CONFIG_ENGINE_CONFIG_H
