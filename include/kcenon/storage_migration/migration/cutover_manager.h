/**
 * @file cutover_manager.h
 * @brief Explicit switch of a workspace to its migration target
 */

#ifndef KCENON_STORAGE_MIGRATION_MIGRATION_CUTOVER_MANAGER_H
#define KCENON_STORAGE_MIGRATION_MIGRATION_CUTOVER_MANAGER_H

#include <string>

#include "kcenon/storage_migration/core/job_id.h"
#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/migration/workspace_config_store.h"
#include "kcenon/storage_migration/storage/storage_backend.h"

namespace kcenon::storage_migration {

class job_store;

/**
 * @brief Parameters of completeMigration
 */
struct cutover_request {
    std::string workspace_id;
    std::string target_provider;
    storage_config target_config;

    /// Accept a failed or cancelled job; active jobs are always refused
    bool override_status = false;
};

/**
 * @brief Result of completeMigration
 */
struct cutover_result {
    job_id job;

    /// The workspace already pointed at the target for this job
    bool already_applied = false;

    workspace_storage_config active;
};

/**
 * @brief Cutover manager
 *
 * Second phase of a migration. Only the workspace configuration changes;
 * the source data is never touched. Retrying after a crash between the
 * configuration write and the acknowledgement succeeds without a second
 * write.
 */
class cutover_manager {
public:
    cutover_manager(job_store& jobs, workspace_config_store& configs);

    [[nodiscard]] auto complete_migration(const cutover_request& request)
        -> result<cutover_result>;

private:
    job_store& jobs_;
    workspace_config_store& configs_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_MIGRATION_CUTOVER_MANAGER_H
