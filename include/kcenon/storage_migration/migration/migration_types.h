/**
 * @file migration_types.h
 * @brief Data model of a storage migration job
 */

#ifndef KCENON_STORAGE_MIGRATION_MIGRATION_MIGRATION_TYPES_H
#define KCENON_STORAGE_MIGRATION_MIGRATION_MIGRATION_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/storage_migration/core/error_codes.h"
#include "kcenon/storage_migration/core/job_id.h"
#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/storage/storage_backend.h"

namespace kcenon::storage_migration {

/**
 * @brief Migration job status
 */
enum class job_status {
    pending,      ///< Created, scope enumeration not finished
    in_progress,  ///< Workers are copying
    paused,       ///< Stopped cooperatively; resumable
    completed,    ///< Every manifest entry reached verified or failed
    failed,       ///< Fatal error or failure threshold exceeded
    cancelled     ///< Stopped by the operator
};

[[nodiscard]] constexpr auto to_string(job_status status) -> const char* {
    switch (status) {
        case job_status::pending: return "pending";
        case job_status::in_progress: return "in_progress";
        case job_status::paused: return "paused";
        case job_status::completed: return "completed";
        case job_status::failed: return "failed";
        case job_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto job_status_from_string(std::string_view name)
    -> std::optional<job_status> {
    if (name == "pending") return job_status::pending;
    if (name == "in_progress") return job_status::in_progress;
    if (name == "paused") return job_status::paused;
    if (name == "completed") return job_status::completed;
    if (name == "failed") return job_status::failed;
    if (name == "cancelled") return job_status::cancelled;
    return std::nullopt;
}

/**
 * @brief Statuses that hold the workspace's single active-job slot
 */
[[nodiscard]] constexpr auto is_active(job_status status) noexcept -> bool {
    return status == job_status::pending ||
           status == job_status::in_progress ||
           status == job_status::paused;
}

/**
 * @brief Per-file status
 */
enum class file_status {
    pending,   ///< Not yet claimed (or released after an interruption)
    copying,   ///< Claimed by a worker
    verified,  ///< Copied and checksums matched
    failed     ///< Retries exhausted or fail-soft error
};

[[nodiscard]] constexpr auto to_string(file_status status) -> const char* {
    switch (status) {
        case file_status::pending: return "pending";
        case file_status::copying: return "copying";
        case file_status::verified: return "verified";
        case file_status::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto file_status_from_string(std::string_view name)
    -> std::optional<file_status> {
    if (name == "pending") return file_status::pending;
    if (name == "copying") return file_status::copying;
    if (name == "verified") return file_status::verified;
    if (name == "failed") return file_status::failed;
    return std::nullopt;
}

/**
 * @brief Start-time options of a migration
 */
struct migration_options {
    /// Keep going past per-file failures
    bool continue_on_error = true;

    /// Number of concurrent copy workers (1..64)
    std::size_t concurrency = 5;

    /// Fail files whose source and target checksums differ
    bool verify_integrity = true;

    /// Attempts per file, first attempt included
    std::size_t max_attempts = 3;

    /// Failed files tolerated when continue_on_error is false
    uint64_t abort_threshold = 0;

    /// Only objects whose key starts with this prefix are migrated
    std::string filter_prefix;

    static constexpr std::size_t max_concurrency = 64;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief One entry of a job's error list
 */
struct migration_error_entry {
    std::string path;
    error_kind kind = error_kind::internal;
    std::string message;
    std::size_t attempt = 0;
    std::chrono::system_clock::time_point timestamp;
    bool retryable = false;
};

/**
 * @brief Snapshot of a migration job
 */
struct migration_job {
    job_id id;
    std::string workspace_id;

    std::string source_provider;
    storage_config source_config;
    std::string target_provider;
    storage_config target_config;

    migration_options options;
    job_status status = job_status::pending;

    uint64_t total_files = 0;
    uint64_t migrated_files = 0;
    uint64_t failed_files = 0;
    uint64_t total_bytes = 0;
    uint64_t migrated_bytes = 0;

    /// Last file a worker touched; advisory only
    std::string current_file;

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> estimated_completion_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;

    /// Most recent errors, oldest first
    std::vector<migration_error_entry> errors;

    /// Total errors recorded, including entries dropped from the list
    uint64_t error_count = 0;

    /// Error that drove the job to failed, if any
    std::optional<migration_error_entry> fatal_error;

    /// Scope enumeration finished and the manifest is persisted
    bool manifest_complete = false;

    /// Cutover to the target has been committed
    bool committed = false;

    /// Coordinator instance supervising the job
    std::string owner_id;
    std::optional<std::chrono::system_clock::time_point> heartbeat_at;

    /**
     * @brief True while paused or failed with a valid manifest snapshot
     */
    [[nodiscard]] auto can_resume() const noexcept -> bool {
        return (status == job_status::paused || status == job_status::failed) &&
               manifest_complete && !committed;
    }

    [[nodiscard]] auto progress_percent() const noexcept -> double {
        if (total_bytes > 0) {
            return 100.0 * static_cast<double>(migrated_bytes) /
                   static_cast<double>(total_bytes);
        }
        if (total_files > 0) {
            return 100.0 * static_cast<double>(migrated_files + failed_files) /
                   static_cast<double>(total_files);
        }
        return status == job_status::completed ? 100.0 : 0.0;
    }
};

/**
 * @brief Per-file record of a migration job
 */
struct file_migration_record {
    std::string path;
    uint64_t size_bytes = 0;
    std::string source_checksum;
    std::string target_checksum;
    file_status status = file_status::pending;
    std::size_t attempts = 0;
    std::string last_error;
};

/**
 * @brief Result of a scope calculation
 */
struct migration_scope {
    uint64_t file_count = 0;
    uint64_t total_bytes = 0;
    std::chrono::seconds estimated_duration{0};
    std::string formatted_size;
    std::string formatted_duration;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_MIGRATION_MIGRATION_TYPES_H
