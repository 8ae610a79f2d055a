/**
 * @file cloud_storage_interface.h
 * @brief Client interface for cloud object stores
 *
 * Provider SDK wrappers (S3-compatible, Azure Blob, GCS) implement this
 * interface. cloud_storage_backend adapts a client to storage_backend, so
 * the copy pipeline never sees provider types. Clients report failures
 * with make_cloud_error().
 */

#ifndef KCENON_STORAGE_MIGRATION_STORAGE_CLOUD_STORAGE_INTERFACE_H
#define KCENON_STORAGE_MIGRATION_STORAGE_CLOUD_STORAGE_INTERFACE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cloud_error.h"
#include "storage_backend.h"

namespace kcenon::storage_migration {

struct cloud_object_metadata {
    std::string key;
    uint64_t size = 0;
    std::string etag;

    /// SHA-256 (hex) stored by the provider alongside the object, if any
    std::optional<std::string> sha256;

    /// Folder placeholder; never copied
    bool is_directory = false;
};

/**
 * @brief One page of a bucket listing
 *
 * A truncated page carries the token for the next one.
 */
struct list_objects_result {
    std::vector<cloud_object_metadata> objects;
    bool is_truncated = false;
    std::optional<std::string> continuation_token;
};

struct list_objects_options {
    std::optional<std::string> prefix;
    std::size_t max_keys = 1000;
    std::optional<std::string> continuation_token;
};

struct upload_result {
    std::string key;
    std::string etag;

    /// SHA-256 (hex) the provider computed over the stored bytes, if any
    std::optional<std::string> sha256;

    uint64_t bytes_uploaded = 0;
};

/**
 * @brief Upload in progress; the object becomes visible on finalize()
 */
class cloud_upload_stream {
public:
    virtual ~cloud_upload_stream() = default;

    /**
     * @return Bytes accepted, possibly fewer than offered
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<std::size_t> = 0;

    [[nodiscard]] virtual auto finalize() -> result<upload_result> = 0;

    [[nodiscard]] virtual auto abort() -> result<void> = 0;

    [[nodiscard]] virtual auto bytes_written() const -> uint64_t = 0;
};

class cloud_download_stream {
public:
    virtual ~cloud_download_stream() = default;

    /**
     * @return Bytes read; 0 once the object is exhausted
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    [[nodiscard]] virtual auto has_more() const -> bool = 0;

    [[nodiscard]] virtual auto total_size() const -> uint64_t = 0;

    [[nodiscard]] virtual auto metadata() const -> const cloud_object_metadata& = 0;
};

/**
 * @brief Provider client
 *
 * Not thread-safe unless the implementation says otherwise;
 * cloud_storage_backend serializes connect() and leaves per-object calls
 * to the client.
 */
class cloud_storage_interface {
public:
    cloud_storage_interface() = default;
    virtual ~cloud_storage_interface() = default;

    cloud_storage_interface(const cloud_storage_interface&) = delete;
    auto operator=(const cloud_storage_interface&) -> cloud_storage_interface& = delete;

    [[nodiscard]] virtual auto provider() const -> storage_provider = 0;

    /// Short provider label used in logs, e.g. "aws-s3"
    [[nodiscard]] virtual auto provider_name() const -> std::string_view = 0;

    /**
     * @brief Validate credentials and configuration against the provider
     */
    [[nodiscard]] virtual auto connect() -> result<void> = 0;

    [[nodiscard]] virtual auto is_connected() const -> bool = 0;

    [[nodiscard]] virtual auto delete_object(const std::string& key) -> result<void> = 0;

    [[nodiscard]] virtual auto exists(const std::string& key) -> result<bool> = 0;

    [[nodiscard]] virtual auto get_metadata(const std::string& key)
        -> result<cloud_object_metadata> = 0;

    /**
     * @brief List one page of objects in lexicographic key order
     */
    [[nodiscard]] virtual auto list_objects(const list_objects_options& options = {})
        -> result<list_objects_result> = 0;

    [[nodiscard]] virtual auto create_upload_stream(const std::string& key,
                                                    uint64_t expected_size)
        -> result<std::unique_ptr<cloud_upload_stream>> = 0;

    [[nodiscard]] virtual auto create_download_stream(const std::string& key)
        -> result<std::unique_ptr<cloud_download_stream>> = 0;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_STORAGE_CLOUD_STORAGE_INTERFACE_H
