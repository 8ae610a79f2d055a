/**
 * @file migration_coordinator.h
 * @brief Entry point of the storage migration engine
 */

#ifndef KCENON_STORAGE_MIGRATION_MIGRATION_MIGRATION_COORDINATOR_H
#define KCENON_STORAGE_MIGRATION_MIGRATION_MIGRATION_COORDINATOR_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/storage_migration/config/engine_config.h"
#include "kcenon/storage_migration/core/job_id.h"
#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/migration/cutover_manager.h"
#include "kcenon/storage_migration/migration/migration_types.h"
#include "kcenon/storage_migration/migration/progress_tracker.h"
#include "kcenon/storage_migration/migration/workspace_config_store.h"
#include "kcenon/storage_migration/storage/backend_registry.h"

namespace kcenon::storage_migration {

/**
 * @brief Parameters of startMigration
 */
struct start_request {
    std::string workspace_id;
    std::string target_provider;
    storage_config target_config;

    /// Engine defaults are used when unset
    std::optional<migration_options> options;
};

/**
 * @brief Migration coordinator
 *
 * Owns the job state machine. Every active job is supervised by one
 * background thread that enumerates the scope, launches the copy workers
 * on a bounded pool, refreshes the job's heartbeat and decides the
 * terminal status once all workers have stopped.
 *
 * @code
 * auto config = engine_config_builder()
 *     .with_state_directory("/var/lib/storage-migration")
 *     .build();
 *
 * auto coordinator = migration_coordinator::builder()
 *     .with_config(config.value())
 *     .build();
 *
 * auto id = coordinator.value().start_migration(
 *     {"workspace-1", "local", {{"root", "/mnt/new"}}, std::nullopt});
 * auto job = coordinator.value().get_progress(id.value());
 * @endcode
 *
 * @note Thread-safe.
 */
class migration_coordinator {
public:
    /**
     * @brief Builder for migration_coordinator
     */
    class builder {
    public:
        builder();

        auto with_config(engine_config config) -> builder&;

        /**
         * @brief Provider factories; a registry with only `local` is used when unset
         */
        auto with_backend_registry(std::shared_ptr<backend_registry> registry) -> builder&;

        /**
         * @brief Identity written to supervised jobs; random when unset
         */
        auto with_owner_id(std::string owner_id) -> builder&;

        /**
         * @brief Open the state directory and load persisted jobs
         *
         * Orphaned jobs are not resumed until recover_jobs() is called.
         */
        [[nodiscard]] auto build() -> result<migration_coordinator>;

    private:
        engine_config config_;
        bool has_config_ = false;
        std::shared_ptr<backend_registry> registry_;
        std::string owner_id_;
    };

    migration_coordinator(const migration_coordinator&) = delete;
    auto operator=(const migration_coordinator&) -> migration_coordinator& = delete;
    migration_coordinator(migration_coordinator&&) noexcept;
    auto operator=(migration_coordinator&&) noexcept -> migration_coordinator&;

    /**
     * @brief Stops supervised jobs as shutdown() does
     */
    ~migration_coordinator();

    // ========================================================================
    // Workspace storage
    // ========================================================================

    /**
     * @brief Set the storage a workspace currently uses
     *
     * The active configuration is the source of the next migration.
     */
    [[nodiscard]] auto set_workspace_storage(const std::string& workspace_id,
                                             const std::string& provider,
                                             const storage_config& config)
        -> result<workspace_storage_config>;

    [[nodiscard]] auto workspace_storage(const std::string& workspace_id) const
        -> result<workspace_storage_config>;

    // ========================================================================
    // Migration operations
    // ========================================================================

    /**
     * @brief Count the objects a migration of the workspace would copy
     *
     * Read-only; does not create a job.
     */
    [[nodiscard]] auto calculate_scope(const std::string& workspace_id,
                                       const std::string& prefix = {})
        -> result<migration_scope>;

    /**
     * @brief Create a job and start it in the background
     *
     * Both backends are connected first; connection failures are returned
     * here. Everything after the job is created is reported through the
     * job's status.
     *
     * @return job_already_active if the workspace has an active job
     */
    [[nodiscard]] auto start_migration(const start_request& request) -> result<job_id>;

    /**
     * @brief Snapshot of a job; never re-enumerates
     */
    [[nodiscard]] auto get_progress(const job_id& id) const -> result<migration_job>;

    /**
     * @brief Request cooperative cancellation
     *
     * Returns immediately. Workers finish the object they are copying;
     * the job becomes cancelled once they have all stopped. A paused job
     * is cancelled at once.
     */
    [[nodiscard]] auto cancel_migration(const job_id& id) -> result<void>;

    /**
     * @brief Request a cooperative pause of an in-progress job
     */
    [[nodiscard]] auto pause_migration(const job_id& id) -> result<void>;

    /**
     * @brief Resume a paused or failed job
     *
     * Verified records are skipped. Failed records stay failed unless
     * @p reset_failed is set.
     *
     * @return not_resumable unless can_resume() holds for the job
     */
    [[nodiscard]] auto resume_migration(const job_id& id, bool reset_failed = false)
        -> result<void>;

    /**
     * @brief Switch the workspace to the target of its completed migration
     */
    [[nodiscard]] auto complete_migration(const cutover_request& request)
        -> result<cutover_result>;

    /**
     * @brief Delete a failed, cancelled or committed job
     */
    [[nodiscard]] auto discard_job(const job_id& id) -> result<void>;

    /**
     * @brief Jobs of a workspace, newest first
     */
    [[nodiscard]] auto list_jobs(const std::string& workspace_id) const
        -> std::vector<migration_job>;

    /**
     * @brief Resume jobs whose owner is gone
     *
     * in_progress jobs continue with their persisted records; pending jobs
     * restart scope enumeration.
     *
     * @return Number of jobs taken over
     */
    [[nodiscard]] auto recover_jobs() -> result<std::size_t>;

    /**
     * @brief Block until the job has left pending/in_progress and its
     *        supervisor has stopped
     * @return The job snapshot, or operation_cancelled on timeout
     */
    [[nodiscard]] auto wait_for_terminal(const job_id& id, std::chrono::milliseconds timeout)
        -> result<migration_job>;

    /**
     * @brief Install a push channel for job snapshots
     */
    void on_progress(progress_listener listener);

    [[nodiscard]] auto throughput(const job_id& id) const -> std::optional<throughput_snapshot>;

    /**
     * @brief Stop all workers cooperatively and wait for supervisors
     *
     * Jobs stay in_progress without an owner, so the next coordinator
     * resumes them in recover_jobs().
     */
    void shutdown();

    [[nodiscard]] auto owner_id() const -> const std::string&;

    [[nodiscard]] auto registry() const -> backend_registry&;

    [[nodiscard]] auto config() const -> const engine_config&;

private:
    migration_coordinator();

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_MIGRATION_MIGRATION_COORDINATOR_H
