/**
 * @file workspace_config_store.h
 * @brief Active storage configuration of each workspace
 */

#ifndef KCENON_STORAGE_MIGRATION_MIGRATION_WORKSPACE_CONFIG_STORE_H
#define KCENON_STORAGE_MIGRATION_MIGRATION_WORKSPACE_CONFIG_STORE_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/storage_migration/core/job_id.h"
#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/storage/storage_backend.h"

namespace kcenon::storage_migration {

class config_cipher;

/**
 * @brief Storage backend a workspace currently reads and writes
 */
struct workspace_storage_config {
    std::string workspace_id;
    std::string provider;
    storage_config config;

    /// SHA-256 over provider and canonical config
    std::string fingerprint;

    /// Migration whose cutover produced this configuration
    std::optional<job_id> cutover_job_id;

    std::chrono::system_clock::time_point updated_at;
};

/**
 * @brief File-backed store of workspace storage configurations
 *
 * One file per workspace under <state_directory>/workspace_configs/,
 * replaced atomically on every write. Configs are sealed with the
 * cipher when one is given.
 *
 * @note Thread-safe.
 */
class workspace_config_store {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& state_directory,
                                   std::shared_ptr<const config_cipher> cipher = nullptr)
        -> result<std::unique_ptr<workspace_config_store>>;

    ~workspace_config_store();

    workspace_config_store(const workspace_config_store&) = delete;
    auto operator=(const workspace_config_store&) -> workspace_config_store& = delete;

    /**
     * @brief Fingerprint identifying a provider/config pair
     */
    [[nodiscard]] static auto fingerprint(const std::string& provider,
                                          const storage_config& config) -> std::string;

    /**
     * @brief Active configuration of @p workspace_id
     * @return object_not_found if the workspace has none
     */
    [[nodiscard]] auto get(const std::string& workspace_id) const
        -> result<workspace_storage_config>;

    /**
     * @brief Replace the active configuration of @p workspace_id
     */
    [[nodiscard]] auto put(const std::string& workspace_id, const std::string& provider,
                           const storage_config& config,
                           const std::optional<job_id>& cutover_job_id = std::nullopt)
        -> result<workspace_storage_config>;

private:
    workspace_config_store(std::filesystem::path directory,
                           std::shared_ptr<const config_cipher> cipher);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_MIGRATION_WORKSPACE_CONFIG_STORE_H
