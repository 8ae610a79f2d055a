/**
 * @file test_backend_registry.cpp
 * @brief Unit tests for provider name to backend factory resolution
 */

#include <gtest/gtest.h>

#include <kcenon/storage_migration/storage/backend_registry.h>
#include <kcenon/storage_migration/storage/local_storage_backend.h>

#include <algorithm>
#include <filesystem>

namespace kcenon::storage_migration::test {

class BackendRegistryTest : public ::testing::Test {
protected:
    backend_registry registry_;
};

TEST_F(BackendRegistryTest, LocalIsBuiltIn) {
    EXPECT_TRUE(registry_.has_provider("local"));
    auto names = registry_.providers();
    EXPECT_NE(std::find(names.begin(), names.end(), "local"), names.end());
}

TEST_F(BackendRegistryTest, CreateLocal) {
    auto root = std::filesystem::temp_directory_path() / "storage_migration_test_registry";
    auto backend = registry_.create("local", {{"root", root.string()}});
    ASSERT_TRUE(backend.has_value()) << backend.error().message;
    EXPECT_EQ(backend.value()->provider(), storage_provider::local);
}

TEST_F(BackendRegistryTest, LocalConfigIsValidated) {
    auto backend = registry_.create("local", {});
    ASSERT_FALSE(backend.has_value());
    EXPECT_EQ(backend.error().code, error_code::invalid_configuration);
}

TEST_F(BackendRegistryTest, UnknownProvider) {
    auto backend = registry_.create("ftp", {});
    ASSERT_FALSE(backend.has_value());
    EXPECT_EQ(backend.error().code, error_code::unknown_provider);
    EXPECT_FALSE(registry_.has_provider("ftp"));
}

TEST_F(BackendRegistryTest, RegisterCustomProvider) {
    storage_config seen;
    registry_.register_provider("custom",
        [&seen](const storage_config& config) -> result<std::unique_ptr<storage_backend>> {
            seen = config;
            local_storage_config local;
            local.root = std::filesystem::temp_directory_path();
            return std::unique_ptr<storage_backend>(local_storage_backend::create(local));
        });

    EXPECT_TRUE(registry_.has_provider("custom"));
    auto backend = registry_.create("custom", {{"bucket", "b1"}});
    ASSERT_TRUE(backend.has_value());
    EXPECT_EQ(seen.at("bucket"), "b1");
}

TEST_F(BackendRegistryTest, FactoryErrorsPropagate) {
    registry_.register_provider("broken",
        [](const storage_config&) -> result<std::unique_ptr<storage_backend>> {
            return unexpected(error{error_code::authentication_failed, "bad credentials"});
        });

    auto backend = registry_.create("broken", {});
    ASSERT_FALSE(backend.has_value());
    EXPECT_EQ(backend.error().code, error_code::authentication_failed);
}

TEST_F(BackendRegistryTest, NullBackendIsInternalError) {
    registry_.register_provider("null",
        [](const storage_config&) -> result<std::unique_ptr<storage_backend>> {
            return std::unique_ptr<storage_backend>();
        });

    auto backend = registry_.create("null", {});
    ASSERT_FALSE(backend.has_value());
    EXPECT_EQ(backend.error().code, error_code::internal_error);
}

}  // namespace kcenon::storage_migration::test
