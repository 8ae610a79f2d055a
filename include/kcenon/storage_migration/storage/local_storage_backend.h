/**
 * @file local_storage_backend.h
 * @brief Local filesystem storage backend
 */

#ifndef KCENON_STORAGE_MIGRATION_STORAGE_LOCAL_STORAGE_BACKEND_H
#define KCENON_STORAGE_MIGRATION_STORAGE_LOCAL_STORAGE_BACKEND_H

#include <filesystem>
#include <memory>

#include "storage_backend.h"

namespace kcenon::storage_migration {

/**
 * @brief Local storage configuration
 */
struct local_storage_config {
    /// Root directory
    std::filesystem::path root;

    /// Prefix prepended to every key, isolating one workspace under root
    std::string key_prefix;

    /// Create the root directory on connect()
    bool create_root = true;

    /**
     * @brief Build from an opaque config (`root`, optional `key_prefix`)
     */
    [[nodiscard]] static auto from(const storage_config& config) -> result<local_storage_config>;
};

/**
 * @brief Storage backend on the local filesystem
 *
 * Keys map to files below root/key_prefix. Writes land in a temporary
 * sibling file and are renamed into place by finalize(), so readers never
 * observe a partially written object.
 */
class local_storage_backend : public storage_backend {
public:
    [[nodiscard]] static auto create(local_storage_config config)
        -> std::unique_ptr<local_storage_backend>;

    ~local_storage_backend() override;

    local_storage_backend(const local_storage_backend&) = delete;
    auto operator=(const local_storage_backend&) -> local_storage_backend& = delete;

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

    /**
     * @brief Filesystem path a key maps to
     */
    [[nodiscard]] auto path_for(const std::string& key) const -> result<std::filesystem::path>;

    /**
     * @brief Validate a key
     *
     * Rejects empty keys, absolute paths, backslashes, empty segments and
     * `.` or `..` segments.
     */
    [[nodiscard]] static auto validate_key(std::string_view key) -> result<void>;

private:
    explicit local_storage_backend(local_storage_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_STORAGE_LOCAL_STORAGE_BACKEND_H
