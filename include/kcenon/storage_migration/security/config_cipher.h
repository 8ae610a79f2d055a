/**
 * @file config_cipher.h
 * @brief AES-256-GCM sealing of provider configurations at rest
 *
 * Provider configurations carry credentials. Whenever a key is configured
 * they are stored sealed in job state and workspace configuration files.
 * The sealed form is `v1:<iv hex>:<tag hex>:<ciphertext hex>`.
 */

#ifndef KCENON_STORAGE_MIGRATION_SECURITY_CONFIG_CIPHER_H
#define KCENON_STORAGE_MIGRATION_SECURITY_CONFIG_CIPHER_H

#include <array>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "kcenon/storage_migration/core/types.h"

namespace kcenon::storage_migration {

/**
 * @brief AES-256-GCM cipher for short configuration payloads
 *
 * A fresh random 96-bit IV is drawn for every seal() call. The key is
 * wiped from memory on destruction.
 *
 * @note Thread-safe: seal() and open() do not share mutable state.
 */
class config_cipher {
public:
    static constexpr std::size_t key_size = 32;
    static constexpr std::size_t iv_size = 12;
    static constexpr std::size_t tag_size = 16;

    /**
     * @brief Create a cipher from a raw 32-byte key
     */
    [[nodiscard]] static auto create(std::span<const std::byte> key)
        -> result<std::unique_ptr<config_cipher>>;

    /**
     * @brief Create a cipher from a base64-encoded 32-byte key
     */
    [[nodiscard]] static auto from_base64(std::string_view encoded_key)
        -> result<std::unique_ptr<config_cipher>>;

    /**
     * @brief Generate a random key, base64 encoded
     */
    [[nodiscard]] static auto generate_key_base64() -> result<std::string>;

    ~config_cipher();

    config_cipher(const config_cipher&) = delete;
    auto operator=(const config_cipher&) -> config_cipher& = delete;

    /**
     * @brief Encrypt and authenticate @p plaintext
     * @param aad Additional data bound to the ciphertext (e.g. the job id)
     */
    [[nodiscard]] auto seal(std::string_view plaintext, std::string_view aad = {}) const
        -> result<std::string>;

    /**
     * @brief Decrypt a value produced by seal()
     * @return decryption_failed on a malformed value, wrong key or wrong aad
     */
    [[nodiscard]] auto open(std::string_view sealed, std::string_view aad = {}) const
        -> result<std::string>;

    /**
     * @brief Check whether @p value has the sealed layout
     */
    [[nodiscard]] static auto is_sealed(std::string_view value) -> bool;

private:
    explicit config_cipher(std::span<const std::byte> key);

    std::array<std::byte, key_size> key_{};
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_SECURITY_CONFIG_CIPHER_H
