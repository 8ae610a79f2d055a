/**
 * @file storage_backend.h
 * @brief Uniform storage backend capability consumed by the migration engine
 *
 * A backend enumerates objects under a prefix page by page, opens
 * streaming readers and writers, and deletes objects. Providers (local
 * disk, S3-compatible, GCS, Azure Blob, managed bucket) all sit behind
 * this interface.
 */

#ifndef KCENON_STORAGE_MIGRATION_STORAGE_STORAGE_BACKEND_H
#define KCENON_STORAGE_MIGRATION_STORAGE_STORAGE_BACKEND_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/storage_migration/core/types.h"

namespace kcenon::storage_migration {

/**
 * @brief Storage provider kinds
 */
enum class storage_provider {
    local,    ///< Local filesystem
    s3,       ///< AWS S3
    gcs,      ///< Google Cloud Storage
    azure,    ///< Azure Blob Storage
    minio,    ///< S3-compatible (MinIO and others)
    managed   ///< Platform-managed bucket
};

[[nodiscard]] constexpr auto to_string(storage_provider provider) -> const char* {
    switch (provider) {
        case storage_provider::local: return "local";
        case storage_provider::s3: return "s3";
        case storage_provider::gcs: return "gcs";
        case storage_provider::azure: return "azure";
        case storage_provider::minio: return "minio";
        case storage_provider::managed: return "managed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto provider_from_string(std::string_view name)
    -> std::optional<storage_provider> {
    if (name == "local") return storage_provider::local;
    if (name == "s3") return storage_provider::s3;
    if (name == "gcs") return storage_provider::gcs;
    if (name == "azure") return storage_provider::azure;
    if (name == "minio") return storage_provider::minio;
    if (name == "managed") return storage_provider::managed;
    return std::nullopt;
}

/**
 * @brief Opaque provider configuration (endpoint, bucket, credentials, ...)
 *
 * Values may be secrets; never log them without redact_config().
 */
using storage_config = std::map<std::string, std::string>;

/**
 * @brief Listing entry
 */
struct storage_object {
    std::string key;
    uint64_t size = 0;
};

/**
 * @brief Options for one page of a listing
 */
struct list_storage_options {
    /// Only keys starting with this prefix
    std::string prefix;

    /// Maximum entries in the page
    std::size_t max_results = 1000;

    /// Token returned by the previous page
    std::optional<std::string> continuation_token;
};

/**
 * @brief One page of a listing
 */
struct list_storage_result {
    std::vector<storage_object> objects;
    bool is_truncated = false;
    std::optional<std::string> continuation_token;
};

/**
 * @brief Streaming reader for one object
 */
class object_read_stream {
public:
    virtual ~object_read_stream() = default;

    /**
     * @brief Read the next block
     * @return Bytes read; 0 at end of object
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Object size as reported when the stream was opened
     */
    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief SHA-256 hex digest stored with the object, if the backend has one
     */
    [[nodiscard]] virtual auto checksum() const -> std::optional<std::string> = 0;
};

/**
 * @brief Result of a completed write
 */
struct write_result {
    /// SHA-256 hex digest of the bytes the target persisted
    std::string checksum;

    uint64_t bytes_written = 0;
};

/**
 * @brief Streaming writer for one object
 *
 * The object becomes visible only when finalize() succeeds; abort() or
 * destruction without finalize() leaves no object behind.
 */
class object_write_stream {
public:
    virtual ~object_write_stream() = default;

    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<void> = 0;

    [[nodiscard]] virtual auto finalize() -> result<write_result> = 0;

    [[nodiscard]] virtual auto abort() -> result<void> = 0;

    [[nodiscard]] virtual auto bytes_written() const -> uint64_t = 0;
};

/**
 * @brief Abstract storage backend
 */
class storage_backend {
public:
    virtual ~storage_backend() = default;

    [[nodiscard]] virtual auto provider() const -> storage_provider = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Validate configuration and credentials
     */
    [[nodiscard]] virtual auto connect() -> result<void> = 0;

    /**
     * @brief List one page of objects in lexicographic key order
     */
    [[nodiscard]] virtual auto list(const list_storage_options& options)
        -> result<list_storage_result> = 0;

    [[nodiscard]] virtual auto open_read(const std::string& key)
        -> result<std::unique_ptr<object_read_stream>> = 0;

    /**
     * @brief Open a writer; an existing object is replaced on finalize()
     * @param expected_size Size hint for providers that need it up front
     */
    [[nodiscard]] virtual auto open_write(const std::string& key, uint64_t expected_size)
        -> result<std::unique_ptr<object_write_stream>> = 0;

    /**
     * @brief Delete an object (operator cleanup tooling only)
     */
    [[nodiscard]] virtual auto remove(const std::string& key) -> result<void> = 0;

    [[nodiscard]] virtual auto exists(const std::string& key) -> result<bool> = 0;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_STORAGE_STORAGE_BACKEND_H
