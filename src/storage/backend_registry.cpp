/**
 * @file backend_registry.cpp
 * @brief Implementation of the storage backend registry
 */

#include "kcenon/storage_migration/storage/backend_registry.h"

#include "kcenon/storage_migration/storage/local_storage_backend.h"

#include <map>
#include <mutex>

namespace kcenon::storage_migration {

struct backend_registry::impl {
    mutable std::mutex mutex;
    std::map<std::string, backend_factory> factories;
};

backend_registry::backend_registry() : impl_(std::make_unique<impl>()) {
    register_provider(to_string(storage_provider::local),
        [](const storage_config& config) -> result<std::unique_ptr<storage_backend>> {
            auto local = local_storage_config::from(config);
            if (!local) {
                return unexpected(local.error());
            }
            return std::unique_ptr<storage_backend>(
                local_storage_backend::create(std::move(local.value())));
        });
}

backend_registry::~backend_registry() = default;

void backend_registry::register_provider(const std::string& provider, backend_factory factory) {
    std::lock_guard lock(impl_->mutex);
    impl_->factories[provider] = std::move(factory);
}

auto backend_registry::has_provider(const std::string& provider) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->factories.contains(provider);
}

auto backend_registry::providers() const -> std::vector<std::string> {
    std::lock_guard lock(impl_->mutex);
    std::vector<std::string> names;
    names.reserve(impl_->factories.size());
    for (const auto& [name, factory] : impl_->factories) {
        names.push_back(name);
    }
    return names;
}

auto backend_registry::create(const std::string& provider, const storage_config& config) const
    -> result<std::unique_ptr<storage_backend>> {
    backend_factory factory;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->factories.find(provider);
        if (it == impl_->factories.end()) {
            return unexpected(error{error_code::unknown_provider,
                                    "no storage backend registered for '" + provider + "'"});
        }
        factory = it->second;
    }

    auto backend = factory(config);
    if (backend && !backend.value()) {
        return unexpected(error{error_code::internal_error,
                                "factory for '" + provider + "' returned no backend"});
    }
    return backend;
}

}  // namespace kcenon::storage_migration
