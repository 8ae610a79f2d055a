/**
 * @file test_migration_types.cpp
 * @brief Unit tests for job, record and option types
 */

#include <gtest/gtest.h>

#include <kcenon/storage_migration/migration/migration_types.h>

namespace kcenon::storage_migration::test {

// =============================================================================
// Status Tests
// =============================================================================

class JobStatusTest : public ::testing::Test {};

TEST_F(JobStatusTest, NamesRoundTrip) {
    for (auto status : {job_status::pending, job_status::in_progress, job_status::paused,
                        job_status::completed, job_status::failed, job_status::cancelled}) {
        auto parsed = job_status_from_string(to_string(status));
        ASSERT_TRUE(parsed.has_value()) << to_string(status);
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(job_status_from_string("running").has_value());
}

TEST_F(JobStatusTest, ActiveStates) {
    EXPECT_TRUE(is_active(job_status::pending));
    EXPECT_TRUE(is_active(job_status::in_progress));
    EXPECT_TRUE(is_active(job_status::paused));
    EXPECT_FALSE(is_active(job_status::completed));
    EXPECT_FALSE(is_active(job_status::failed));
    EXPECT_FALSE(is_active(job_status::cancelled));
}

TEST_F(JobStatusTest, FileStatusNames) {
    EXPECT_STREQ(to_string(file_status::copying), "copying");
    EXPECT_EQ(file_status_from_string("verified"), file_status::verified);
    EXPECT_FALSE(file_status_from_string("done").has_value());
}

// =============================================================================
// Options Tests
// =============================================================================

class MigrationOptionsTest : public ::testing::Test {};

TEST_F(MigrationOptionsTest, Defaults) {
    migration_options options;
    EXPECT_TRUE(options.continue_on_error);
    EXPECT_EQ(options.concurrency, 5u);
    EXPECT_TRUE(options.verify_integrity);
    EXPECT_EQ(options.max_attempts, 3u);
    EXPECT_EQ(options.abort_threshold, 0u);
    EXPECT_TRUE(options.validate().has_value());
}

TEST_F(MigrationOptionsTest, ConcurrencyBounds) {
    migration_options options;
    options.concurrency = 0;
    EXPECT_EQ(options.validate().error().code, error_code::invalid_argument);

    options.concurrency = migration_options::max_concurrency;
    EXPECT_TRUE(options.validate().has_value());

    options.concurrency = migration_options::max_concurrency + 1;
    EXPECT_FALSE(options.validate().has_value());
}

TEST_F(MigrationOptionsTest, AttemptsMustBePositive) {
    migration_options options;
    options.max_attempts = 0;
    EXPECT_FALSE(options.validate().has_value());
}

// =============================================================================
// Job Tests
// =============================================================================

class MigrationJobTest : public ::testing::Test {};

TEST_F(MigrationJobTest, CanResume) {
    migration_job job;
    job.manifest_complete = true;

    job.status = job_status::paused;
    EXPECT_TRUE(job.can_resume());
    job.status = job_status::failed;
    EXPECT_TRUE(job.can_resume());

    job.status = job_status::completed;
    EXPECT_FALSE(job.can_resume());
    job.status = job_status::cancelled;
    EXPECT_FALSE(job.can_resume());
    job.status = job_status::in_progress;
    EXPECT_FALSE(job.can_resume());
}

TEST_F(MigrationJobTest, CannotResumeWithoutManifestOrAfterCutover) {
    migration_job job;
    job.status = job_status::failed;
    EXPECT_FALSE(job.can_resume());

    job.manifest_complete = true;
    job.committed = true;
    EXPECT_FALSE(job.can_resume());
}

TEST_F(MigrationJobTest, ProgressByBytes) {
    migration_job job;
    job.total_bytes = 400;
    job.migrated_bytes = 100;
    EXPECT_DOUBLE_EQ(job.progress_percent(), 25.0);
}

TEST_F(MigrationJobTest, ProgressOfEmptyFiles) {
    migration_job job;
    job.total_files = 4;
    job.migrated_files = 1;
    job.failed_files = 1;
    EXPECT_DOUBLE_EQ(job.progress_percent(), 50.0);
}

TEST_F(MigrationJobTest, ProgressOfEmptyScope) {
    migration_job job;
    EXPECT_DOUBLE_EQ(job.progress_percent(), 0.0);
    job.status = job_status::completed;
    EXPECT_DOUBLE_EQ(job.progress_percent(), 100.0);
}

}  // namespace kcenon::storage_migration::test
