/**
 * @file config_cipher.cpp
 * @brief AES-256-GCM configuration cipher implementation
 */

#include "kcenon/storage_migration/security/config_cipher.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstring>
#include <vector>

namespace kcenon::storage_migration {

namespace {

constexpr std::string_view sealed_prefix = "v1:";

/**
 * @brief Get OpenSSL error message
 */
auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief RAII wrapper for EVP_CIPHER_CTX
 */
class evp_cipher_ctx_wrapper {
public:
    evp_cipher_ctx_wrapper() : ctx_(EVP_CIPHER_CTX_new()) {}

    ~evp_cipher_ctx_wrapper() {
        if (ctx_) {
            EVP_CIPHER_CTX_free(ctx_);
        }
    }

    evp_cipher_ctx_wrapper(const evp_cipher_ctx_wrapper&) = delete;
    auto operator=(const evp_cipher_ctx_wrapper&) -> evp_cipher_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_CIPHER_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_CIPHER_CTX* ctx_;
};

auto to_hex(const unsigned char* data, std::size_t size) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

auto from_hex(std::string_view hex, std::vector<unsigned char>& out) -> bool {
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.clear();
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return true;
}

auto decrypt_error(const std::string& detail) -> unexpected {
    return unexpected(error{error_code::decryption_failed, detail});
}

}  // namespace

config_cipher::config_cipher(std::span<const std::byte> key) {
    std::copy(key.begin(), key.end(), key_.begin());
}

config_cipher::~config_cipher() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

auto config_cipher::create(std::span<const std::byte> key)
    -> result<std::unique_ptr<config_cipher>> {
    if (key.size() != key_size) {
        return unexpected(error{error_code::invalid_configuration,
                                "encryption key must be 32 bytes, got " +
                                    std::to_string(key.size())});
    }
    return std::unique_ptr<config_cipher>(new config_cipher(key));
}

auto config_cipher::from_base64(std::string_view encoded_key)
    -> result<std::unique_ptr<config_cipher>> {
    std::string trimmed(encoded_key);
    trimmed.erase(std::remove_if(trimmed.begin(), trimmed.end(),
                                 [](char c) { return c == '\n' || c == '\r' || c == ' '; }),
                  trimmed.end());
    if (trimmed.empty() || trimmed.size() % 4 != 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "encryption key is not valid base64"});
    }

    std::vector<unsigned char> decoded(trimmed.size() / 4 * 3);
    int len = EVP_DecodeBlock(decoded.data(),
                              reinterpret_cast<const unsigned char*>(trimmed.data()),
                              static_cast<int>(trimmed.size()));
    if (len < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "encryption key is not valid base64"});
    }

    // EVP_DecodeBlock counts padding characters as zero bytes
    auto padding = static_cast<std::size_t>(std::count(trimmed.end() - 2, trimmed.end(), '='));
    decoded.resize(static_cast<std::size_t>(len) - padding);

    auto cipher = create(std::as_bytes(std::span(decoded)));
    OPENSSL_cleanse(decoded.data(), decoded.size());
    return cipher;
}

auto config_cipher::generate_key_base64() -> result<std::string> {
    std::array<unsigned char, key_size> key{};
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        return unexpected(error{error_code::encryption_failed, get_openssl_error()});
    }

    std::array<unsigned char, 4 * ((key_size + 2) / 3) + 1> encoded{};
    int len = EVP_EncodeBlock(encoded.data(), key.data(), static_cast<int>(key.size()));
    OPENSSL_cleanse(key.data(), key.size());
    return std::string(reinterpret_cast<const char*>(encoded.data()),
                       static_cast<std::size_t>(len));
}

auto config_cipher::is_sealed(std::string_view value) -> bool {
    if (!value.starts_with(sealed_prefix)) {
        return false;
    }
    return std::count(value.begin(), value.end(), ':') == 3;
}

auto config_cipher::seal(std::string_view plaintext, std::string_view aad) const
    -> result<std::string> {
    evp_cipher_ctx_wrapper ctx;
    if (!ctx) {
        return unexpected(error{error_code::encryption_failed,
                                "Failed to create cipher context"});
    }

    std::array<unsigned char, iv_size> iv{};
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        return unexpected(error{error_code::encryption_failed, "Failed to generate IV"});
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return unexpected(error{error_code::encryption_failed, get_openssl_error()});
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(iv_size), nullptr) != 1) {
        return unexpected(error{error_code::encryption_failed, "Failed to set IV length"});
    }

    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr,
                           reinterpret_cast<const unsigned char*>(key_.data()),
                           iv.data()) != 1) {
        return unexpected(error{error_code::encryption_failed, get_openssl_error()});
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                              reinterpret_cast<const unsigned char*>(aad.data()),
                              static_cast<int>(aad.size())) != 1) {
            return unexpected(error{error_code::encryption_failed, "Failed to process AAD"});
        }
    }

    std::vector<unsigned char> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        return unexpected(error{error_code::encryption_failed, get_openssl_error()});
    }
    int total_len = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total_len, &len) != 1) {
        return unexpected(error{error_code::encryption_failed, get_openssl_error()});
    }
    total_len += len;

    std::array<unsigned char, tag_size> tag{};
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(tag_size), tag.data()) != 1) {
        return unexpected(error{error_code::encryption_failed, "Failed to get auth tag"});
    }

    std::string sealed(sealed_prefix);
    sealed += to_hex(iv.data(), iv.size());
    sealed += ':';
    sealed += to_hex(tag.data(), tag.size());
    sealed += ':';
    sealed += to_hex(ciphertext.data(), static_cast<std::size_t>(total_len));
    return sealed;
}

auto config_cipher::open(std::string_view sealed, std::string_view aad) const
    -> result<std::string> {
    if (!is_sealed(sealed)) {
        return decrypt_error("value is not sealed");
    }

    auto body = sealed.substr(sealed_prefix.size());
    auto first = body.find(':');
    auto second = body.find(':', first + 1);

    std::vector<unsigned char> iv;
    std::vector<unsigned char> tag;
    std::vector<unsigned char> ciphertext;
    if (!from_hex(body.substr(0, first), iv) ||
        !from_hex(body.substr(first + 1, second - first - 1), tag) ||
        !from_hex(body.substr(second + 1), ciphertext)) {
        return decrypt_error("sealed value is not valid hex");
    }
    if (iv.size() != iv_size || tag.size() != tag_size) {
        return decrypt_error("sealed value has wrong IV or tag length");
    }

    evp_cipher_ctx_wrapper ctx;
    if (!ctx) {
        return decrypt_error("Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return decrypt_error(get_openssl_error());
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(iv.size()), nullptr) != 1) {
        return decrypt_error("Failed to set IV length");
    }

    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr,
                           reinterpret_cast<const unsigned char*>(key_.data()),
                           iv.data()) != 1) {
        return decrypt_error(get_openssl_error());
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                              reinterpret_cast<const unsigned char*>(aad.data()),
                              static_cast<int>(aad.size())) != 1) {
            return decrypt_error("Failed to process AAD");
        }
    }

    std::vector<unsigned char> plaintext(ciphertext.size() + EVP_MAX_BLOCK_LENGTH);
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
        return decrypt_error(get_openssl_error());
    }
    int total_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != 1) {
        return decrypt_error("Failed to set auth tag");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return decrypt_error("Authentication failed - wrong key or tampered value");
    }
    total_len += len;

    std::string out(reinterpret_cast<const char*>(plaintext.data()),
                    static_cast<std::size_t>(total_len));
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return out;
}

}  // namespace kcenon::storage_migration
