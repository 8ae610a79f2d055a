/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <kcenon/storage_migration/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace kcenon::storage_migration::test {

namespace {

constexpr const char* empty_sha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* abc_sha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

auto bytes_of(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

}  // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "storage_migration_test_checksum";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

// SHA-256 Tests

TEST_F(ChecksumTest, SHA256_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::sha256(empty), empty_sha256);
}

TEST_F(ChecksumTest, SHA256_KnownValue) {
    EXPECT_EQ(checksum::sha256(std::string("abc")), abc_sha256);
    EXPECT_EQ(checksum::sha256(bytes_of("abc")), abc_sha256);
}

TEST_F(ChecksumTest, SHA256_LowercaseHex) {
    auto hash = checksum::sha256(std::string("storage"));
    ASSERT_EQ(hash.size(), 64u);
    for (char c : hash) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST_F(ChecksumTest, SHA256_File) {
    auto path = create_test_file("abc.txt", "abc");
    auto hash = checksum::sha256_file(path);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(hash.value(), abc_sha256);
}

TEST_F(ChecksumTest, SHA256_FileNotFound) {
    auto hash = checksum::sha256_file(test_dir_ / "missing.bin");
    EXPECT_FALSE(hash.has_value());
}

// Streaming Tests

TEST_F(ChecksumTest, Streaming_MatchesOneShot) {
    std::mt19937 gen(7);
    std::uniform_int_distribution<> dis(0, 255);
    std::vector<std::byte> data(100 * 1024 + 17);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }

    streaming_checksum hasher;
    std::size_t offset = 0;
    std::size_t block = 1;
    while (offset < data.size()) {
        auto n = std::min(block, data.size() - offset);
        hasher.update(std::span<const std::byte>(data.data() + offset, n));
        offset += n;
        block = block * 3 + 1;
    }

    EXPECT_EQ(hasher.bytes_processed(), data.size());
    EXPECT_EQ(hasher.finalize(), checksum::sha256(data));
}

TEST_F(ChecksumTest, Streaming_FinalizeResets) {
    streaming_checksum hasher;
    auto abc = bytes_of("abc");
    hasher.update(abc);
    EXPECT_EQ(hasher.finalize(), abc_sha256);

    EXPECT_EQ(hasher.bytes_processed(), 0u);
    EXPECT_EQ(hasher.finalize(), empty_sha256);
}

TEST_F(ChecksumTest, Streaming_Reset) {
    streaming_checksum hasher;
    auto junk = bytes_of("junk");
    hasher.update(junk);
    hasher.reset();

    auto abc = bytes_of("abc");
    hasher.update(abc);
    EXPECT_EQ(hasher.finalize(), abc_sha256);
}

TEST_F(ChecksumTest, Streaming_Move) {
    streaming_checksum first;
    auto ab = bytes_of("ab");
    first.update(ab);

    streaming_checksum second(std::move(first));
    auto c = bytes_of("c");
    second.update(c);
    EXPECT_EQ(second.finalize(), abc_sha256);
}

}  // namespace kcenon::storage_migration::test
