/**
 * @file storage_migration.h
 * @brief Main header for the storage_migration library
 * @version 0.1.0
 *
 * Include this header to access the migration engine, its storage
 * backends and the job model.
 *
 * @code
 * #include <kcenon/storage_migration/storage_migration.h>
 *
 * using namespace kcenon::storage_migration;
 *
 * auto config = engine_config_builder()
 *     .with_state_directory("/var/lib/storage-migration")
 *     .build();
 *
 * auto coordinator = migration_coordinator::builder()
 *     .with_config(config.value())
 *     .build();
 * @endcode
 */

#ifndef KCENON_STORAGE_MIGRATION_STORAGE_MIGRATION_H
#define KCENON_STORAGE_MIGRATION_STORAGE_MIGRATION_H

#include <string>

// Core
#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/core/error_codes.h"
#include "kcenon/storage_migration/core/job_id.h"
#include "kcenon/storage_migration/core/logging.h"

// Configuration
#include "kcenon/storage_migration/config/engine_config.h"

// Storage
#include "kcenon/storage_migration/storage/storage_backend.h"
#include "kcenon/storage_migration/storage/local_storage_backend.h"
#include "kcenon/storage_migration/storage/cloud_storage_backend.h"
#include "kcenon/storage_migration/storage/backend_registry.h"

// Migration
#include "kcenon/storage_migration/migration/migration_types.h"
#include "kcenon/storage_migration/migration/migration_coordinator.h"

namespace kcenon::storage_migration {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_STORAGE_MIGRATION_H
