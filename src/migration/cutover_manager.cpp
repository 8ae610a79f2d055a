/**
 * @file cutover_manager.cpp
 * @brief Implementation of the cutover manager
 */

#include "kcenon/storage_migration/migration/cutover_manager.h"

#include "kcenon/storage_migration/core/logging.h"
#include "kcenon/storage_migration/migration/job_store.h"

namespace kcenon::storage_migration {

cutover_manager::cutover_manager(job_store& jobs, workspace_config_store& configs)
    : jobs_(jobs), configs_(configs) {}

auto cutover_manager::complete_migration(const cutover_request& request)
    -> result<cutover_result> {
    auto valid = job_store::validate_workspace_id(request.workspace_id);
    if (!valid) {
        return unexpected(valid.error());
    }

    auto latest = jobs_.find_latest_job(request.workspace_id);
    if (!latest) {
        return unexpected(error{error_code::job_not_found,
                                "workspace " + request.workspace_id + " has no migration"});
    }
    auto job = std::move(*latest);

    if (job.target_provider != request.target_provider ||
        job.target_config != request.target_config) {
        return unexpected(error{error_code::invalid_argument,
                                "target does not match migration " + job.id.to_string()});
    }

    const auto target_fingerprint =
        workspace_config_store::fingerprint(request.target_provider, request.target_config);

    auto current = configs_.get(request.workspace_id);
    if (!current && current.error().code != error_code::object_not_found) {
        return unexpected(current.error());
    }

    cutover_result outcome;
    outcome.job = job.id;

    if (current && current.value().fingerprint == target_fingerprint &&
        current.value().cutover_job_id == job.id) {
        if (!job.committed) {
            auto committed = jobs_.update_job(job.id, [](migration_job& j) { j.committed = true; });
            if (!committed) {
                return unexpected(committed.error());
            }
        }
        SM_LOG_INFO(log_category::cutover,
            "Cutover of workspace " + request.workspace_id + " to job " + job.id.to_string() +
                " was already applied");
        outcome.already_applied = true;
        outcome.active = std::move(current.value());
        return outcome;
    }

    if (is_active(job.status)) {
        return unexpected(error{error_code::invalid_job_state,
                                "migration " + job.id.to_string() + " is still " +
                                    to_string(job.status)});
    }
    if (job.status != job_status::completed && !request.override_status) {
        return unexpected(error{error_code::invalid_job_state,
                                "migration " + job.id.to_string() + " ended " +
                                    to_string(job.status) + "; cutover needs an override"});
    }
    if (job.status != job_status::completed) {
        SM_LOG_WARN(log_category::cutover,
            "Operator override: cutting workspace " + request.workspace_id + " over to " +
                std::string(to_string(job.status)) + " migration " + job.id.to_string());
    }

    auto written = configs_.put(request.workspace_id, request.target_provider,
                                request.target_config, job.id);
    if (!written) {
        return unexpected(written.error());
    }

    auto committed = jobs_.update_job(job.id, [](migration_job& j) { j.committed = true; });
    if (!committed) {
        return unexpected(committed.error());
    }

    SM_LOG_INFO(log_category::cutover,
        "Workspace " + request.workspace_id + " switched to " + request.target_provider +
            " by migration " + job.id.to_string());
    outcome.active = std::move(written.value());
    return outcome;
}

}  // namespace kcenon::storage_migration
