/**
 * @file test_engine_config.cpp
 * @brief Unit tests for engine configuration and its builder
 */

#include <gtest/gtest.h>

#include <kcenon/storage_migration/config/engine_config.h>
#include <kcenon/storage_migration/security/config_cipher.h>

namespace kcenon::storage_migration::test {

using namespace std::chrono_literals;

class EngineConfigTest : public ::testing::Test {
protected:
    auto builder() -> engine_config_builder {
        engine_config_builder b;
        b.with_state_directory("/tmp/storage-migration-state");
        return b;
    }
};

TEST_F(EngineConfigTest, DefaultsAreValid) {
    auto config = builder().build();
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config.value().default_options.concurrency, 5u);
    EXPECT_EQ(config.value().retry.max_attempts, 3u);
    EXPECT_EQ(config.value().list_page_size, 1000u);
    EXPECT_EQ(config.value().checksum_when_unverified, unverified_checksum_mode::compute);
    EXPECT_FALSE(config.value().encryption_key_base64.has_value());
}

TEST_F(EngineConfigTest, StateDirectoryIsRequired) {
    auto config = engine_config_builder().build();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_configuration);
}

TEST_F(EngineConfigTest, BuilderSetsFields) {
    auto config = builder()
        .with_concurrency(12)
        .with_list_page_size(250)
        .with_stream_buffer_size(64 * 1024)
        .with_max_error_entries(20)
        .with_checkpoint_interval(3)
        .with_owner_lease(10s)
        .with_heartbeat_interval(1s)
        .with_unverified_checksums(unverified_checksum_mode::skip)
        .build();
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config.value().default_options.concurrency, 12u);
    EXPECT_EQ(config.value().list_page_size, 250u);
    EXPECT_EQ(config.value().stream_buffer_size, 64u * 1024u);
    EXPECT_EQ(config.value().max_error_entries, 20u);
    EXPECT_EQ(config.value().checkpoint_interval, 3u);
    EXPECT_EQ(config.value().owner_lease, 10s);
    EXPECT_EQ(config.value().heartbeat_interval, 1s);
    EXPECT_EQ(config.value().checksum_when_unverified, unverified_checksum_mode::skip);
}

TEST_F(EngineConfigTest, RejectsInvalidConcurrency) {
    EXPECT_FALSE(builder().with_concurrency(0).build().has_value());
    EXPECT_FALSE(builder().with_concurrency(65).build().has_value());
}

TEST_F(EngineConfigTest, RejectsTinyBuffer) {
    EXPECT_FALSE(builder().with_stream_buffer_size(512).build().has_value());
}

TEST_F(EngineConfigTest, LeaseMustExceedHeartbeat) {
    auto config = builder().with_owner_lease(1s).with_heartbeat_interval(2s).build();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_configuration);
}

TEST_F(EngineConfigTest, RejectsBadRetryPolicy) {
    retry_policy policy;
    policy.backoff_multiplier = 0.5;
    EXPECT_FALSE(builder().with_retry_policy(policy).build().has_value());

    policy = retry_policy{};
    policy.max_delay = 10ms;
    EXPECT_FALSE(builder().with_retry_policy(policy).build().has_value());
}

TEST_F(EngineConfigTest, EncryptionKeyIsValidated) {
    EXPECT_FALSE(builder().with_encryption_key("not base64 at all").build().has_value());

    auto key = config_cipher::generate_key_base64();
    ASSERT_TRUE(key.has_value());
    auto config = builder().with_encryption_key(key.value()).build();
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config.value().encryption_key_base64, key.value());
}

}  // namespace kcenon::storage_migration::test
