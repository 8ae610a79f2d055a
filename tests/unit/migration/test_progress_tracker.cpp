/**
 * @file test_progress_tracker.cpp
 * @brief Unit tests for progress accounting, ETA and listener delivery
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <kcenon/storage_migration/migration/progress_tracker.h>

#include <atomic>
#include <stdexcept>
#include <thread>

namespace kcenon::storage_migration::test {

using namespace std::chrono_literals;

class ProgressTrackerTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        job_store_options options;
        options.state_directory = state_dir_;
        auto store = job_store::open(options);
        ASSERT_TRUE(store.has_value()) << store.error().message;
        store_ = std::move(store.value());

        progress_tracker::config cfg;
        cfg.rate_window_size = 4;
        cfg.min_eta_elapsed = 0ms;
        tracker_ = std::make_unique<progress_tracker>(*store_, cfg);

        new_job_request request;
        request.workspace_id = "ws-1";
        request.source_provider = "memory";
        request.target_provider = "memory";
        auto job = store_->create_job(request);
        ASSERT_TRUE(job.has_value());
        id_ = job.value().id;

        std::vector<storage_object> manifest;
        for (int i = 0; i < 4; ++i) {
            manifest.push_back({"file-" + std::to_string(i), 1000});
        }
        ASSERT_TRUE(store_->append_manifest(id_, manifest).has_value());
        ASSERT_TRUE(store_->finalize_manifest(id_).has_value());
        ASSERT_TRUE(store_->update_job(id_, [](migration_job& j) {
            j.status = job_status::in_progress;
        }).has_value());
    }

    auto complete_next(file_status status) -> result<migration_job> {
        auto claimed = store_->claim_next(id_);
        EXPECT_TRUE(claimed.has_value() && claimed.value().has_value());
        auto record = *claimed.value();
        record.status = status;
        record.attempts = 1;
        return tracker_->record_result(id_, record);
    }

    std::unique_ptr<job_store> store_;
    std::unique_ptr<progress_tracker> tracker_;
    job_id id_;
};

TEST_F(ProgressTrackerTest, ResultsUpdateCounters) {
    auto first = complete_next(file_status::verified);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().migrated_files, 1u);
    EXPECT_DOUBLE_EQ(first.value().progress_percent(), 25.0);

    auto second = complete_next(file_status::failed);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().failed_files, 1u);
    EXPECT_EQ(second.value().migrated_bytes, 1000u);
}

TEST_F(ProgressTrackerTest, ThroughputOnlyDuringRun) {
    EXPECT_FALSE(tracker_->throughput(id_).has_value());

    tracker_->begin_run(id_);
    std::this_thread::sleep_for(20ms);
    ASSERT_TRUE(complete_next(file_status::verified).has_value());
    ASSERT_TRUE(complete_next(file_status::failed).has_value());

    auto snap = tracker_->throughput(id_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->bytes_this_run, 1000u);
    EXPECT_EQ(snap->files_this_run, 2u);
    EXPECT_GT(snap->average_rate, 0.0);
    EXPECT_GE(snap->elapsed, 20ms);

    tracker_->end_run(id_);
    EXPECT_FALSE(tracker_->throughput(id_).has_value());
}

TEST_F(ProgressTrackerTest, EstimatesCompletionDuringRun) {
    auto before = store_->get_job(id_).value();
    EXPECT_FALSE(before.estimated_completion_at.has_value());

    tracker_->begin_run(id_);
    std::this_thread::sleep_for(10ms);
    auto job = complete_next(file_status::verified);
    ASSERT_TRUE(job.has_value());
    ASSERT_TRUE(job.value().estimated_completion_at.has_value());
    EXPECT_GE(*job.value().estimated_completion_at,
              std::chrono::system_clock::now() - std::chrono::seconds(1));
}

TEST_F(ProgressTrackerTest, NoEstimateWithoutRun) {
    auto job = complete_next(file_status::verified);
    ASSERT_TRUE(job.has_value());
    EXPECT_FALSE(job.value().estimated_completion_at.has_value());
}

TEST_F(ProgressTrackerTest, ListenerReceivesSnapshots) {
    std::vector<migration_job> seen;
    tracker_->set_listener([&seen](const migration_job& job) { seen.push_back(job); });

    ASSERT_TRUE(complete_next(file_status::verified).has_value());
    ASSERT_TRUE(tracker_->transition(id_, [](migration_job& j) {
        j.status = job_status::paused;
    }).has_value());
    tracker_->publish(id_);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].migrated_files, 1u);
    EXPECT_EQ(seen[1].status, job_status::paused);
    EXPECT_EQ(seen[2].status, job_status::paused);

    tracker_->set_listener(nullptr);
    tracker_->publish(id_);
    EXPECT_EQ(seen.size(), 3u);
}

TEST_F(ProgressTrackerTest, ThrowingListenerIsContained) {
    std::atomic<int> calls{0};
    tracker_->set_listener([&calls](const migration_job&) {
        ++calls;
        throw std::runtime_error("listener failure");
    });

    auto job = complete_next(file_status::verified);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(store_->get_job(id_).value().migrated_files, 1u);
}

TEST_F(ProgressTrackerTest, ListenerMayCallBack) {
    uint64_t observed = 0;
    tracker_->set_listener([this, &observed](const migration_job& job) {
        auto stored = store_->get_job(job.id);
        if (stored) {
            observed = stored.value().migrated_files;
        }
    });

    ASSERT_TRUE(complete_next(file_status::verified).has_value());
    EXPECT_EQ(observed, 1u);
}

TEST_F(ProgressTrackerTest, RecordErrorAppendsEntry) {
    migration_error_entry entry;
    entry.path = "file-0";
    entry.kind = error_kind::transient_io;
    entry.message = "connection reset";
    entry.attempt = 3;
    entry.retryable = true;
    ASSERT_TRUE(tracker_->record_error(id_, entry).has_value());

    auto job = store_->get_job(id_).value();
    ASSERT_EQ(job.errors.size(), 1u);
    EXPECT_EQ(job.errors[0].message, "connection reset");
    EXPECT_EQ(job.error_count, 1u);
}

TEST_F(ProgressTrackerTest, UnknownJob) {
    auto result = tracker_->transition(job_id::generate(), [](migration_job&) {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::job_not_found);
}

}  // namespace kcenon::storage_migration::test
