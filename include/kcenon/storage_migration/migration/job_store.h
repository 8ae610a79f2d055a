/**
 * @file job_store.h
 * @brief Durable store of migration jobs and their per-file records
 *
 * Layout below the state directory:
 * - jobs/<id>/job.json        header and counters, rewritten atomically
 * - jobs/<id>/manifest.jsonl  scope snapshot in key order, appended page by page
 * - jobs/<id>/records.jsonl   journal of terminal per-file results and resets,
 *                             keyed by manifest position
 * - jobs/<id>/errors.jsonl    error entries
 * - workspaces/<ws>.lock      held while the workspace has an active job
 *
 * The store is the single source of truth for resumability: loading an
 * active job replays the journal over the manifest and returns records
 * that were being copied to pending. Inactive jobs load their header only.
 *
 * Records live on disk. A job that is claiming work keeps one status per
 * manifest entry and the records in flight; claim_next() reads the
 * manifest forward from where the previous claim stopped.
 */

#ifndef KCENON_STORAGE_MIGRATION_MIGRATION_JOB_STORE_H
#define KCENON_STORAGE_MIGRATION_MIGRATION_JOB_STORE_H

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/migration/migration_types.h"

namespace kcenon::storage_migration {

class config_cipher;

/**
 * @brief Job store settings
 */
struct job_store_options {
    std::filesystem::path state_directory;

    /// Counter updates between header rewrites
    std::size_t checkpoint_interval = 10;

    /// Errors kept on a job snapshot
    std::size_t max_error_entries = 100;

    /// Seals provider configs in job headers when set
    std::shared_ptr<const config_cipher> cipher;
};

/**
 * @brief Parameters of a new job
 */
struct new_job_request {
    std::string workspace_id;
    std::string source_provider;
    storage_config source_config;
    std::string target_provider;
    storage_config target_config;
    migration_options options;
    std::string owner_id;
};

/**
 * @brief Mutation applied to a job under the store's lock
 */
using job_mutator = std::function<void(migration_job&)>;

/**
 * @brief Durable job store
 *
 * All mutations of a job and its records are serialized per job. Counter
 * updates go through commit_record(), which appends to the journal and
 * adjusts the counters in one critical section.
 *
 * @note Thread-safe.
 */
class job_store {
public:
    /**
     * @brief Open (and create if needed) a store and load existing jobs
     */
    [[nodiscard]] static auto open(job_store_options options)
        -> result<std::unique_ptr<job_store>>;

    ~job_store();

    job_store(const job_store&) = delete;
    auto operator=(const job_store&) -> job_store& = delete;

    /**
     * @brief Whether workspace identifiers are acceptable
     *
     * Identifiers consist of letters, digits, '.', '-' and '_'.
     */
    [[nodiscard]] static auto validate_workspace_id(const std::string& workspace_id)
        -> result<void>;

    // ========================================================================
    // Job lifecycle
    // ========================================================================

    /**
     * @brief Create a pending job and take the workspace's active slot
     * @return job_already_active if the workspace already has an active job
     */
    [[nodiscard]] auto create_job(const new_job_request& request) -> result<migration_job>;

    /**
     * @brief Append one listing page to the manifest of a pending job
     *
     * Pages must arrive in key order; a key equal to the last one appended
     * is skipped and a smaller key yields invalid_argument.
     */
    [[nodiscard]] auto append_manifest(const job_id& id,
                                       std::span<const storage_object> entries)
        -> result<void>;

    /**
     * @brief Mark the manifest complete; totals become immutable
     */
    [[nodiscard]] auto finalize_manifest(const job_id& id) -> result<migration_job>;

    /**
     * @brief Drop a partially written manifest so scope can be rerun
     */
    [[nodiscard]] auto reset_manifest(const job_id& id) -> result<void>;

    /**
     * @brief Apply @p mutator and persist the header
     *
     * Transitions into or out of the active set acquire or release the
     * workspace slot; a conflicting active job yields job_already_active
     * and leaves the job unchanged.
     */
    [[nodiscard]] auto update_job(const job_id& id, const job_mutator& mutator)
        -> result<migration_job>;

    /**
     * @brief Remove a job that is failed, cancelled or committed
     */
    [[nodiscard]] auto discard_job(const job_id& id) -> result<void>;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] auto get_job(const job_id& id) const -> result<migration_job>;

    [[nodiscard]] auto find_active_job(const std::string& workspace_id) const
        -> std::optional<migration_job>;

    [[nodiscard]] auto find_latest_job(const std::string& workspace_id) const
        -> std::optional<migration_job>;

    /**
     * @brief Jobs of a workspace, newest first
     */
    [[nodiscard]] auto list_jobs(const std::string& workspace_id) const
        -> std::vector<migration_job>;

    [[nodiscard]] auto list_all_jobs() const -> std::vector<migration_job>;

    /**
     * @brief All records of a job in manifest order, read from disk
     */
    [[nodiscard]] auto records(const job_id& id) const
        -> result<std::vector<file_migration_record>>;

    /**
     * @brief One record; scans the manifest and journal
     */
    [[nodiscard]] auto record(const job_id& id, const std::string& path) const
        -> result<file_migration_record>;

    // ========================================================================
    // Per-file work
    // ========================================================================

    /**
     * @brief Atomically claim the next pending record
     * @return nullopt when no pending record is left
     */
    [[nodiscard]] auto claim_next(const job_id& id)
        -> result<std::optional<file_migration_record>>;

    /**
     * @brief Persist the terminal result of a claimed record
     *
     * Updates migrated or failed counters, appends to the journal and runs
     * @p after on the job within the same critical section.
     */
    [[nodiscard]] auto commit_record(const job_id& id,
                                     const file_migration_record& record,
                                     const job_mutator& after = {})
        -> result<migration_job>;

    /**
     * @brief Return a claimed record to pending without a result
     */
    [[nodiscard]] auto release_record(const job_id& id, const std::string& path)
        -> result<void>;

    /**
     * @brief Append an error entry to the job's error list
     */
    [[nodiscard]] auto record_error(const job_id& id, const migration_error_entry& entry)
        -> result<void>;

    /**
     * @brief Move failed records back to pending
     * @return Number of records reset
     */
    [[nodiscard]] auto reset_failed_records(const job_id& id) -> result<uint64_t>;

    /**
     * @brief Force a header rewrite
     */
    [[nodiscard]] auto checkpoint(const job_id& id) -> result<void>;

private:
    explicit job_store(job_store_options options);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_MIGRATION_JOB_STORE_H
