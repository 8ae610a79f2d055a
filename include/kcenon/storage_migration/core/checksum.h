/**
 * @file checksum.h
 * @brief Checksum utilities for data integrity verification
 */

#ifndef KCENON_STORAGE_MIGRATION_CORE_CHECKSUM_H
#define KCENON_STORAGE_MIGRATION_CORE_CHECKSUM_H

#include <kcenon/storage_migration/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace kcenon::storage_migration {

/**
 * @brief Incremental SHA-256 hasher for single-pass streaming
 *
 * Bytes are fed as they flow from a source stream to a target stream,
 * so the digest is available without a second read of the object.
 * Backed by the OpenSSL EVP digest API.
 */
class streaming_checksum {
public:
    streaming_checksum();
    ~streaming_checksum();

    // Non-copyable
    streaming_checksum(const streaming_checksum&) = delete;
    auto operator=(const streaming_checksum&) -> streaming_checksum& = delete;

    // Movable
    streaming_checksum(streaming_checksum&&) noexcept;
    auto operator=(streaming_checksum&&) noexcept -> streaming_checksum&;

    /**
     * @brief Feed the next block of bytes
     */
    void update(std::span<const std::byte> data);

    /**
     * @brief Finish the digest and return it as lowercase hex
     *
     * The hasher is reset afterwards and may be reused.
     */
    [[nodiscard]] auto finalize() -> std::string;

    /**
     * @brief Number of bytes fed since the last reset
     */
    [[nodiscard]] auto bytes_processed() const noexcept -> uint64_t;

    /**
     * @brief Discard state and start a new digest
     */
    void reset();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief One-shot checksum helpers
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a string
     */
    [[nodiscard]] static auto sha256(const std::string& text) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_CORE_CHECKSUM_H
