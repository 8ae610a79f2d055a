/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging, masking and config redaction
 */

#include <gtest/gtest.h>

#include <kcenon/storage_migration/core/logging.h>

#include <regex>
#include <string>
#include <tuple>
#include <vector>

namespace kcenon::storage_migration::test {

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = "Copy of /srv/acme/secret.txt from 192.168.1.100";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskIPAddresses) {
    masking_config config;
    config.mask_ips = true;
    sensitive_info_masker masker(config);

    EXPECT_EQ(masker.mask_ip("192.168.1.100"), "*********.100");
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePath) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/home/user/documents/secret.txt");

    EXPECT_NE(result.find("secret.txt"), std::string::npos);
    EXPECT_EQ(result.find("/home/"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MasksWordsInFreeText) {
    sensitive_info_masker masker(masking_config::all_masked());

    auto masked = masker.mask("open /srv/acme/blob.bin via 10.0.0.7:9000 failed");
    EXPECT_EQ(masked.find("/srv/acme"), std::string::npos);
    EXPECT_NE(masked.find("blob.bin"), std::string::npos);
    EXPECT_NE(masked.find("*****.7:9000"), std::string::npos);
    EXPECT_NE(masked.find("failed"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, VersionNumbersAreNotAddresses) {
    sensitive_info_masker masker(masking_config::all_masked());
    EXPECT_EQ(masker.mask("protocol 1.2.3"), "protocol 1.2.3");
}

TEST_F(SensitiveInfoMaskerTest, EmptyInput) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask(""), "");
    EXPECT_EQ(masker.mask_path(""), "");
    EXPECT_EQ(masker.mask_ip(""), "");
}

// =============================================================================
// Config Redaction Tests
// =============================================================================

class RedactConfigTest : public ::testing::Test {};

TEST_F(RedactConfigTest, HidesEveryValue) {
    std::map<std::string, std::string> config{
        {"access_key_id", "AKIAEXAMPLE"},
        {"secret_access_key", "wJalrXUtnFEMI/K7MDENG"},
        {"bucket", "assets"}};

    auto redacted = redact_config(config);

    EXPECT_EQ(redacted, "{access_key_id=****,bucket=****,secret_access_key=****}");
    EXPECT_EQ(redacted.find("AKIAEXAMPLE"), std::string::npos);
    EXPECT_EQ(redacted.find("wJalrXUtnFEMI"), std::string::npos);
}

TEST_F(RedactConfigTest, EmptyValuesStayEmpty) {
    EXPECT_EQ(redact_config({}), "{}");
    EXPECT_EQ(redact_config({{"token", ""}}), "{token=}");
}

// =============================================================================
// Migration Log Context Tests
// =============================================================================

class MigrationLogContextTest : public ::testing::Test {};

TEST_F(MigrationLogContextTest, EmptyContextToJson) {
    migration_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(MigrationLogContextTest, AllFieldsToJson) {
    migration_log_context ctx;
    ctx.job_id = "job-001";
    ctx.workspace_id = "acme";
    ctx.path = "site/index.html";
    ctx.provider = "s3";
    ctx.size_bytes = 1048576;
    ctx.bytes_migrated = 524288;
    ctx.attempt = 2;
    ctx.progress_percent = 50.0;
    ctx.rate_mbps = 2.5;
    ctx.duration_ms = 1000;
    ctx.error_message = "Test error";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"job_id\":\"job-001\""), std::string::npos);
    EXPECT_NE(json.find("\"workspace_id\":\"acme\""), std::string::npos);
    EXPECT_NE(json.find("\"path\":\"site/index.html\""), std::string::npos);
    EXPECT_NE(json.find("\"provider\":\"s3\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":1048576"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_migrated\":524288"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"progress_percent\":50.00"), std::string::npos);
    EXPECT_NE(json.find("\"rate_mbps\":2.50"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":1000"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"Test error\""), std::string::npos);
}

TEST_F(MigrationLogContextTest, JsonEscaping) {
    migration_log_context ctx;
    ctx.path = "dir/\"quoted\".txt";
    ctx.error_message = "Error:\nLine break\tand\ttabs";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
}

// =============================================================================
// Log Record Tests
// =============================================================================

class LogRecordTest : public ::testing::Test {};

TEST_F(LogRecordTest, JsonCarriesContextFields) {
    log_record record;
    record.level = log_level::warn;
    record.category = std::string(log_category::coordinator);
    record.message = "Copy attempt failed";

    migration_log_context ctx;
    ctx.job_id = "abc-123";
    ctx.path = "site/app.js";
    ctx.attempt = 2;
    record.context = ctx;

    auto json = record.to_json();
    EXPECT_NE(json.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"storage_migration.coordinator\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Copy attempt failed\""), std::string::npos);
    EXPECT_NE(json.find("\"job_id\":\"abc-123\""), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
}

TEST_F(LogRecordTest, MaskedPathKeepsFileName) {
    log_record record;
    record.message = "Object failed";
    migration_log_context ctx;
    ctx.path = "acme/private/report.pdf";
    record.context = ctx;

    sensitive_info_masker masker(masking_config::all_masked());
    auto json = record.to_json(&masker);
    EXPECT_NE(json.find("report.pdf"), std::string::npos);
    EXPECT_EQ(json.find("acme/private"), std::string::npos);
}

TEST_F(LogRecordTest, TimestampFormat) {
    log_record record;
    std::regex iso8601_regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(record.timestamp(), iso8601_regex));
}

TEST_F(LogRecordTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Integration Tests
// =============================================================================

class MigrationLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().enable_json_output(false);
        get_logger().enable_masking(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().enable_json_output(false);
        get_logger().enable_masking(false);
        get_logger().set_level(log_level::info);
    }
};

TEST_F(MigrationLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const migration_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    SM_LOG_INFO(log_category::coordinator, "Test message");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::coordinator);
    EXPECT_EQ(std::get<2>(captured[0]), "Test message");
}

TEST_F(MigrationLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const migration_log_context*) {
        captured.push_back(std::string(message));
    });

    get_logger().set_level(log_level::warn);

    SM_LOG_DEBUG(log_category::worker, "Debug message");
    SM_LOG_INFO(log_category::worker, "Info message");
    SM_LOG_WARN(log_category::worker, "Warn message");
    SM_LOG_ERROR(log_category::worker, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

TEST_F(MigrationLoggerTest, ContextReachesCallback) {
    std::string job;
    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const migration_log_context* ctx) {
        if (ctx) {
            job = ctx->job_id;
        }
    });

    migration_log_context ctx;
    ctx.job_id = "job-42";
    SM_LOG_WARN_CTX(log_category::worker, "Retrying", ctx);

    EXPECT_EQ(job, "job-42");
}

TEST_F(MigrationLoggerTest, JsonCallback) {
    std::vector<std::string> captured_json;

    get_logger().enable_json_output(true);
    get_logger().set_json_callback([&](const log_record&, const std::string& json) {
        captured_json.push_back(json);
    });

    SM_LOG_INFO(log_category::cutover, "JSON test");

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_NE(captured_json[0].find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(captured_json[0].find("\"message\":\"JSON test\""), std::string::npos);
}

TEST_F(MigrationLoggerTest, MaskingInJsonOutput) {
    std::vector<std::string> captured_json;

    get_logger().enable_json_output(true);
    get_logger().enable_masking(true);
    get_logger().set_json_callback([&](const log_record&, const std::string& json) {
        captured_json.push_back(json);
    });

    migration_log_context ctx;
    ctx.error_message = "endpoint 192.168.1.100 refused the connection";
    SM_LOG_ERROR_CTX(log_category::storage, "Connect failed", ctx);

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_EQ(captured_json[0].find("192.168.1.100"), std::string::npos);
    EXPECT_NE(captured_json[0].find(".100"), std::string::npos);
}

}  // namespace kcenon::storage_migration::test
