/**
 * @file cloud_storage_backend.h
 * @brief storage_backend over a cloud object-store client
 */

#ifndef KCENON_STORAGE_MIGRATION_STORAGE_CLOUD_STORAGE_BACKEND_H
#define KCENON_STORAGE_MIGRATION_STORAGE_CLOUD_STORAGE_BACKEND_H

#include <memory>
#include <string>

#include "cloud_storage_interface.h"
#include "storage_backend.h"

namespace kcenon::storage_migration {

/**
 * @brief Adapts a cloud_storage_interface client to storage_backend
 *
 * Directory markers are skipped in listings. The checksum reported for a
 * finished write is the provider's SHA-256 when the upload result carries
 * one, otherwise the digest of the bytes handed to the client.
 */
class cloud_storage_backend : public storage_backend {
public:
    [[nodiscard]] static auto create(std::unique_ptr<cloud_storage_interface> client)
        -> std::unique_ptr<cloud_storage_backend>;

    ~cloud_storage_backend() override;

    cloud_storage_backend(const cloud_storage_backend&) = delete;
    auto operator=(const cloud_storage_backend&) -> cloud_storage_backend& = delete;

    [[nodiscard]] auto provider() const -> storage_provider override;
    [[nodiscard]] auto name() const -> std::string_view override;
    [[nodiscard]] auto connect() -> result<void> override;
    [[nodiscard]] auto list(const list_storage_options& options)
        -> result<list_storage_result> override;
    [[nodiscard]] auto open_read(const std::string& key)
        -> result<std::unique_ptr<object_read_stream>> override;
    [[nodiscard]] auto open_write(const std::string& key, uint64_t expected_size)
        -> result<std::unique_ptr<object_write_stream>> override;
    [[nodiscard]] auto remove(const std::string& key) -> result<void> override;
    [[nodiscard]] auto exists(const std::string& key) -> result<bool> override;

    [[nodiscard]] auto client() -> cloud_storage_interface&;

private:
    explicit cloud_storage_backend(std::unique_ptr<cloud_storage_interface> client);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_STORAGE_CLOUD_STORAGE_BACKEND_H
