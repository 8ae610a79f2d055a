/**
 * @file migration_types.cpp
 * @brief Validation of migration options
 */

#include "kcenon/storage_migration/migration/migration_types.h"

namespace kcenon::storage_migration {

auto migration_options::validate() const -> result<void> {
    if (concurrency < 1 || concurrency > max_concurrency) {
        return unexpected(error{error_code::invalid_argument,
                                "concurrency must be between 1 and " +
                                    std::to_string(max_concurrency)});
    }
    if (max_attempts < 1) {
        return unexpected(error{error_code::invalid_argument,
                                "max_attempts must be at least 1"});
    }
    return {};
}

}  // namespace kcenon::storage_migration
