/**
 * @file checksum.cpp
 * @brief Implementation of streaming and one-shot SHA-256 checksums
 */

#include <kcenon/storage_migration/core/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <new>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace kcenon::storage_migration {

namespace {

auto to_hex(const unsigned char* data, std::size_t size) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

}  // namespace

// ============================================================================
// streaming_checksum
// ============================================================================

struct streaming_checksum::impl {
    EVP_MD_CTX* ctx = nullptr;
    uint64_t bytes = 0;

    impl() : ctx(EVP_MD_CTX_new()) {
        if (ctx == nullptr) {
            throw std::bad_alloc();
        }
        start();
    }

    ~impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    void start() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
        bytes = 0;
    }
};

streaming_checksum::streaming_checksum() : impl_(std::make_unique<impl>()) {}

streaming_checksum::~streaming_checksum() = default;

streaming_checksum::streaming_checksum(streaming_checksum&&) noexcept = default;

auto streaming_checksum::operator=(streaming_checksum&&) noexcept
    -> streaming_checksum& = default;

void streaming_checksum::update(std::span<const std::byte> data) {
    if (data.empty()) {
        return;
    }
    EVP_DigestUpdate(impl_->ctx, data.data(), data.size());
    impl_->bytes += data.size();
}

auto streaming_checksum::finalize() -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    EVP_DigestFinal_ex(impl_->ctx, digest.data(), &length);
    auto hex = to_hex(digest.data(), length);
    impl_->start();
    return hex;
}

auto streaming_checksum::bytes_processed() const noexcept -> uint64_t {
    return impl_->bytes;
}

void streaming_checksum::reset() {
    impl_->start();
}

// ============================================================================
// checksum
// ============================================================================

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr);
    return to_hex(digest.data(), length);
}

auto checksum::sha256(const std::string& text) -> std::string {
    return sha256(std::as_bytes(std::span(text.data(), text.size())));
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::object_not_found,
                                "cannot open file: " + path.string()));
    }

    streaming_checksum hasher;
    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = file.gcount();
        if (count > 0) {
            hasher.update(std::as_bytes(
                std::span(buffer.data(), static_cast<std::size_t>(count))));
        }
    }
    if (file.bad()) {
        return unexpected(error(error_code::storage_read_failed,
                                "read failed: " + path.string()));
    }

    return hasher.finalize();
}

}  // namespace kcenon::storage_migration
