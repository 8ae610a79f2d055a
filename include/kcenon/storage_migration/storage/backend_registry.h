/**
 * @file backend_registry.h
 * @brief Provider name to storage backend factory mapping
 */

#ifndef KCENON_STORAGE_MIGRATION_STORAGE_BACKEND_REGISTRY_H
#define KCENON_STORAGE_MIGRATION_STORAGE_BACKEND_REGISTRY_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "storage_backend.h"

namespace kcenon::storage_migration {

/**
 * @brief Creates a backend from its opaque configuration
 */
using backend_factory =
    std::function<result<std::unique_ptr<storage_backend>>(const storage_config&)>;

/**
 * @brief Registry of storage provider factories
 *
 * The `local` provider is always available. Cloud providers are
 * registered by the embedding application with a factory that builds its
 * client and wraps it in a cloud_storage_backend.
 *
 * @note Thread-safe.
 */
class backend_registry {
public:
    backend_registry();
    ~backend_registry();

    backend_registry(const backend_registry&) = delete;
    auto operator=(const backend_registry&) -> backend_registry& = delete;

    /**
     * @brief Register or replace the factory for @p provider
     */
    void register_provider(const std::string& provider, backend_factory factory);

    [[nodiscard]] auto has_provider(const std::string& provider) const -> bool;

    [[nodiscard]] auto providers() const -> std::vector<std::string>;

    /**
     * @brief Instantiate a backend (not yet connected)
     * @return unknown_provider when no factory is registered
     */
    [[nodiscard]] auto create(const std::string& provider, const storage_config& config) const
        -> result<std::unique_ptr<storage_backend>>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_STORAGE_BACKEND_REGISTRY_H
