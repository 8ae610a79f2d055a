/**
 * @file test_concurrency.cpp
 * @brief Cancellation, pause/resume, recovery and progress under concurrency
 */

#include "test_fixtures.h"

#include <kcenon/storage_migration/migration/job_store.h>

#include <array>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace kcenon::storage_migration::test {

using namespace std::chrono_literals;

namespace {

// 64 KiB objects read in 16 KiB blocks with 5 ms per read take about 25 ms each
constexpr std::size_t slow_file_size = 64 * 1024;
constexpr auto slow_read_delay = 5ms;

}  // namespace

class ConcurrencyTest : public CoordinatorFixture {
protected:
    void fill_slow_source(std::size_t count) {
        fill_source(count, slow_file_size);
        source_->set_read_delay(slow_read_delay);
        use_source();
    }

    auto options(std::size_t concurrency) -> migration_options {
        migration_options opts;
        opts.concurrency = concurrency;
        return opts;
    }

    // Waits until the job has verified at least @p files files
    void wait_for_progress(const job_id& id, uint64_t files,
                           std::chrono::milliseconds timeout = 30s) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto job = coordinator_->get_progress(id);
            ASSERT_TRUE(job.has_value());
            if (job.value().migrated_files >= files) {
                return;
            }
            std::this_thread::sleep_for(5ms);
        }
        FAIL() << "job did not reach " << files << " migrated files";
    }

    // Opens the state directory the way another process would
    auto open_store() -> std::unique_ptr<job_store> {
        job_store_options store_options;
        store_options.state_directory = state_dir_;
        auto store = job_store::open(store_options);
        EXPECT_TRUE(store.has_value()) << store.error().message;
        return store.has_value() ? std::move(store.value()) : nullptr;
    }

    void stop_coordinator() {
        coordinator_->shutdown();
        coordinator_.reset();
    }
};

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(ConcurrencyTest, CancelLeavesNoPartialObjects) {
    fill_slow_source(100);
    auto target_root = test_dir_ / "target";

    auto id = coordinator_->start_migration(
        {"ws-1", "local", {{"root", target_root.string()}}, options(4)});
    ASSERT_TRUE(id.has_value()) << id.error().message;

    wait_for_progress(id.value(), 5);
    ASSERT_TRUE(coordinator_->cancel_migration(id.value()).has_value());
    auto job = wait(id.value());

    EXPECT_EQ(job.status, job_status::cancelled);
    EXPECT_LT(job.migrated_files, 100u);
    ASSERT_TRUE(job.completed_at.has_value());

    std::size_t published = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(target_root)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto name = entry.path().filename().string();
        EXPECT_EQ(name.find(".sm-partial"), std::string::npos) << entry.path();

        auto key = std::filesystem::relative(entry.path(), target_root).generic_string();
        auto expected = source_->content_of(key);
        ASSERT_TRUE(expected.has_value()) << key;
        EXPECT_EQ(entry.file_size(), expected->size()) << key;
        EXPECT_EQ(read_file(entry.path()), *expected) << key;
        ++published;
    }
    EXPECT_EQ(published, job.migrated_files);
}

TEST_F(ConcurrencyTest, CancelIsAcknowledgedImmediately) {
    fill_slow_source(50);
    auto id = start(options(2));

    const auto before = std::chrono::steady_clock::now();
    ASSERT_TRUE(coordinator_->cancel_migration(id).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);

    EXPECT_EQ(wait(id).status, job_status::cancelled);
    // Cancelling again is a no-op
    EXPECT_TRUE(coordinator_->cancel_migration(id).has_value());
}

TEST_F(ConcurrencyTest, CancelTerminalJobFails) {
    fill_source(2, 100);
    use_source();
    auto id = start(options(1));
    ASSERT_EQ(wait(id).status, job_status::completed);

    auto cancelled = coordinator_->cancel_migration(id);
    ASSERT_FALSE(cancelled.has_value());
    EXPECT_EQ(cancelled.error().code, error_code::invalid_job_state);
}

// ============================================================================
// Pause / resume
// ============================================================================

TEST_F(ConcurrencyTest, PauseAndResumeCopiesEachObjectOnce) {
    fill_slow_source(60);
    auto id = start(options(3));

    wait_for_progress(id, 3);
    ASSERT_TRUE(coordinator_->pause_migration(id).has_value());
    auto paused = wait(id);
    ASSERT_EQ(paused.status, job_status::paused);
    EXPECT_LT(paused.migrated_files, 60u);
    EXPECT_TRUE(paused.can_resume());

    EXPECT_EQ(static_cast<uint64_t>(target_->object_count()), paused.migrated_files);

    source_->set_read_delay(0ms);
    ASSERT_TRUE(coordinator_->resume_migration(id).has_value());
    auto job = wait(id);

    EXPECT_EQ(job.status, job_status::completed);
    EXPECT_EQ(job.migrated_files, 60u);
    EXPECT_EQ(target_->object_count(), 60u);
    for (std::size_t i = 0; i < 60; ++i) {
        EXPECT_EQ(source_->read_count(file_key(i)), 1) << file_key(i);
    }
}

TEST_F(ConcurrencyTest, PauseRequiresRunningJob) {
    fill_source(2, 100);
    use_source();
    auto id = start(options(1));
    ASSERT_EQ(wait(id).status, job_status::completed);

    auto paused = coordinator_->pause_migration(id);
    ASSERT_FALSE(paused.has_value());
    EXPECT_EQ(paused.error().code, error_code::invalid_job_state);
}

TEST_F(ConcurrencyTest, ResumeWhileRunningFails) {
    fill_slow_source(40);
    auto id = start(options(2));
    wait_for_progress(id, 1);

    auto resumed = coordinator_->resume_migration(id);
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, error_code::invalid_job_state);

    ASSERT_TRUE(coordinator_->cancel_migration(id).has_value());
    EXPECT_EQ(wait(id).status, job_status::cancelled);
}

TEST_F(ConcurrencyTest, ConcurrentResumeStartsOneRun) {
    fill_slow_source(200);
    auto id = start(options(2));

    uint64_t migrated = 0;
    for (int round = 0; round < 3; ++round) {
        wait_for_progress(id, migrated + 1);
        ASSERT_TRUE(coordinator_->pause_migration(id).has_value());
        auto paused = wait(id);
        ASSERT_EQ(paused.status, job_status::paused);
        migrated = paused.migrated_files;

        std::atomic<int> ready{0};
        std::atomic<bool> go{false};
        std::array<bool, 2> succeeded{false, false};
        std::array<std::optional<error_code>, 2> failures;
        std::vector<std::thread> callers;
        for (std::size_t i = 0; i < 2; ++i) {
            callers.emplace_back([&, i] {
                ++ready;
                while (!go.load()) {
                    std::this_thread::yield();
                }
                auto resumed = coordinator_->resume_migration(id);
                if (resumed) {
                    succeeded[i] = true;
                } else {
                    failures[i] = resumed.error().code;
                }
            });
        }
        while (ready.load() < 2) {
            std::this_thread::yield();
        }
        go = true;
        for (auto& caller : callers) {
            caller.join();
        }

        EXPECT_NE(succeeded[0], succeeded[1]) << "round " << round;
        for (const auto& code : failures) {
            if (code) {
                EXPECT_TRUE(*code == error_code::invalid_job_state ||
                            *code == error_code::not_resumable)
                    << to_string(*code);
            }
        }

        auto running = coordinator_->get_progress(id);
        ASSERT_TRUE(running.has_value());
        EXPECT_EQ(running.value().status, job_status::in_progress) << "round " << round;
        EXPECT_EQ(running.value().owner_id, coordinator_->owner_id());
    }

    source_->set_read_delay(0ms);
    auto job = wait(id);
    EXPECT_EQ(job.status, job_status::completed);
    EXPECT_FALSE(job.fatal_error.has_value());
    EXPECT_EQ(job.migrated_files, 200u);
    EXPECT_EQ(target_->object_count(), 200u);
}

TEST_F(ConcurrencyTest, CancelPausedJob) {
    fill_slow_source(40);
    auto id = start(options(2));
    wait_for_progress(id, 1);
    ASSERT_TRUE(coordinator_->pause_migration(id).has_value());
    ASSERT_EQ(wait(id).status, job_status::paused);

    ASSERT_TRUE(coordinator_->cancel_migration(id).has_value());
    auto job = coordinator_->get_progress(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job.value().status, job_status::cancelled);
    EXPECT_FALSE(job.value().can_resume());

    // The workspace is free again
    EXPECT_FALSE(coordinator_->list_jobs("ws-1").empty());
    auto next = coordinator_->start_migration(
        {"ws-1", "memory", bucket_config("target"), options(2)});
    EXPECT_TRUE(next.has_value());
}

// ============================================================================
// Shutdown and recovery
// ============================================================================

TEST_F(ConcurrencyTest, ShutdownThenRecoverCompletesJob) {
    fill_slow_source(60);
    auto id = start(options(3));
    wait_for_progress(id, 3);

    coordinator_->shutdown();
    auto interrupted = coordinator_->get_progress(id);
    ASSERT_TRUE(interrupted.has_value());
    EXPECT_EQ(interrupted.value().status, job_status::in_progress);
    EXPECT_TRUE(interrupted.value().owner_id.empty());
    EXPECT_LT(interrupted.value().migrated_files, 60u);
    coordinator_.reset();

    source_->set_read_delay(0ms);
    coordinator_ = build_coordinator("successor");
    ASSERT_NE(coordinator_, nullptr);

    auto recovered = coordinator_->recover_jobs();
    ASSERT_TRUE(recovered.has_value()) << recovered.error().message;
    EXPECT_EQ(recovered.value(), 1u);

    auto job = wait(id);
    EXPECT_EQ(job.status, job_status::completed);
    EXPECT_EQ(job.migrated_files, 60u);
    EXPECT_EQ(job.owner_id, "successor");
    EXPECT_EQ(target_->object_count(), 60u);
    for (std::size_t i = 0; i < 60; ++i) {
        EXPECT_EQ(source_->read_count(file_key(i)), 1) << file_key(i);
    }
}

TEST_F(ConcurrencyTest, RecoverSkipsJobsWithLiveOwner) {
    fill_slow_source(60);
    auto id = start(options(2));
    wait_for_progress(id, 1);

    auto observer = build_coordinator("observer");
    ASSERT_NE(observer, nullptr);
    auto recovered = observer->recover_jobs();
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(recovered.value(), 0u);
    observer->shutdown();
    observer.reset();

    ASSERT_TRUE(coordinator_->cancel_migration(id).has_value());
    EXPECT_EQ(wait(id).status, job_status::cancelled);
}

TEST_F(ConcurrencyTest, RecoverTakesOverJobOfCrashedOwner) {
    fill_slow_source(40);
    auto id = start(options(2));
    wait_for_progress(id, 3);
    stop_coordinator();

    // Leave the job as a node that died mid-copy would: two records claimed
    // and never committed, its heartbeat still fresh.
    std::vector<std::string> verified;
    std::vector<std::string> in_flight;
    {
        auto store = open_store();
        ASSERT_NE(store, nullptr);
        for (const auto& record : store->records(id).value()) {
            if (record.status == file_status::verified) {
                verified.push_back(record.path);
            }
        }
        for (int i = 0; i < 2; ++i) {
            auto claimed = store->claim_next(id);
            ASSERT_TRUE(claimed.has_value() && claimed.value().has_value());
            in_flight.push_back(claimed.value()->path);
        }
        auto owned = store->update_job(id, [](migration_job& j) {
            j.owner_id = "crashed-node";
            j.heartbeat_at = std::chrono::system_clock::now();
        });
        ASSERT_TRUE(owned.has_value());
    }
    ASSERT_GE(verified.size(), 3u);

    source_->set_read_delay(0ms);
    coordinator_ = build_coordinator("successor");
    ASSERT_NE(coordinator_, nullptr);

    auto early = coordinator_->recover_jobs();
    ASSERT_TRUE(early.has_value());
    EXPECT_EQ(early.value(), 0u);

    // Past the 500 ms owner lease the heartbeat is stale
    std::this_thread::sleep_for(700ms);
    auto recovered = coordinator_->recover_jobs();
    ASSERT_TRUE(recovered.has_value()) << recovered.error().message;
    EXPECT_EQ(recovered.value(), 1u);

    auto job = wait(id);
    EXPECT_EQ(job.status, job_status::completed);
    EXPECT_EQ(job.migrated_files, 40u);
    EXPECT_EQ(job.owner_id, "successor");
    EXPECT_EQ(target_->object_count(), 40u);
    for (const auto& path : verified) {
        EXPECT_EQ(source_->read_count(path), 1) << path;
    }
    for (const auto& path : in_flight) {
        EXPECT_TRUE(target_->contains(path)) << path;
    }
}

TEST_F(ConcurrencyTest, RecoverRestartsUnfinishedScope) {
    fill_source(30, 1024);
    stop_coordinator();

    job_id id;
    {
        auto store = open_store();
        ASSERT_NE(store, nullptr);
        new_job_request request;
        request.workspace_id = "ws-1";
        request.source_provider = "memory";
        request.source_config = bucket_config("source");
        request.target_provider = "memory";
        request.target_config = bucket_config("target");
        request.options = options(2);
        request.owner_id = "crashed-node";
        auto created = store->create_job(request);
        ASSERT_TRUE(created.has_value()) << created.error().message;
        id = created.value().id;

        // Scope died after its first page
        std::vector<storage_object> page{{file_key(0), 1024}, {file_key(1), 1024}};
        ASSERT_TRUE(store->append_manifest(id, page).has_value());
        auto stale = store->update_job(id, [](migration_job& j) {
            j.heartbeat_at = std::chrono::system_clock::now() - std::chrono::hours(1);
        });
        ASSERT_TRUE(stale.has_value());
        ASSERT_EQ(stale.value().status, job_status::pending);
        ASSERT_FALSE(stale.value().manifest_complete);
    }

    coordinator_ = build_coordinator("successor");
    ASSERT_NE(coordinator_, nullptr);
    auto recovered = coordinator_->recover_jobs();
    ASSERT_TRUE(recovered.has_value()) << recovered.error().message;
    EXPECT_EQ(recovered.value(), 1u);

    auto job = wait(id);
    EXPECT_EQ(job.status, job_status::completed);
    EXPECT_TRUE(job.manifest_complete);
    EXPECT_EQ(job.total_files, 30u);
    EXPECT_EQ(job.migrated_files, 30u);
    EXPECT_EQ(target_->object_count(), 30u);
}

TEST_F(ConcurrencyTest, RecoverWithNothingToDo) {
    auto recovered = coordinator_->recover_jobs();
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(recovered.value(), 0u);
}

TEST_F(ConcurrencyTest, WaitTimesOut) {
    fill_slow_source(40);
    auto id = start(options(1));

    auto job = coordinator_->wait_for_terminal(id, 20ms);
    ASSERT_FALSE(job.has_value());
    EXPECT_EQ(job.error().code, error_code::operation_cancelled);

    ASSERT_TRUE(coordinator_->cancel_migration(id).has_value());
    EXPECT_EQ(wait(id).status, job_status::cancelled);
}

// ============================================================================
// Progress reporting
// ============================================================================

TEST_F(ConcurrencyTest, ListenerReceivesUpdates) {
    fill_source(30, 4096);
    use_source();

    std::mutex mutex;
    std::vector<migration_job> snapshots;
    coordinator_->on_progress([&mutex, &snapshots](const migration_job& job) {
        std::lock_guard lock(mutex);
        snapshots.push_back(job);
    });

    auto id = start(options(4));
    ASSERT_EQ(wait(id).status, job_status::completed);

    std::lock_guard lock(mutex);
    ASSERT_GE(snapshots.size(), 30u);
    uint64_t max_migrated = 0;
    bool saw_completed = false;
    for (const auto& snap : snapshots) {
        EXPECT_EQ(snap.id, id);
        EXPECT_LE(snap.migrated_files + snap.failed_files, snap.total_files);
        max_migrated = std::max(max_migrated, snap.migrated_files);
        saw_completed = saw_completed || snap.status == job_status::completed;
    }
    EXPECT_EQ(max_migrated, 30u);
    EXPECT_TRUE(saw_completed);
}

TEST_F(ConcurrencyTest, ProgressIsMonotonicWhilePolling) {
    fill_slow_source(40);
    auto id = start(options(4));

    double last_percent = 0.0;
    uint64_t last_bytes = 0;
    while (true) {
        auto job = coordinator_->get_progress(id);
        ASSERT_TRUE(job.has_value());
        const auto& snap = job.value();
        EXPECT_GE(snap.progress_percent(), last_percent);
        EXPECT_GE(snap.migrated_bytes, last_bytes);
        EXPECT_LE(snap.migrated_files + snap.failed_files, snap.total_files);
        last_percent = snap.progress_percent();
        last_bytes = snap.migrated_bytes;
        if (snap.status != job_status::pending && snap.status != job_status::in_progress) {
            break;
        }
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_DOUBLE_EQ(last_percent, 100.0);
}

TEST_F(ConcurrencyTest, ThroughputDuringRun) {
    fill_slow_source(40);
    auto id = start(options(2));
    wait_for_progress(id, 2);

    auto snap = coordinator_->throughput(id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_GE(snap->files_this_run, 2u);
    EXPECT_GT(snap->bytes_this_run, 0u);

    ASSERT_TRUE(coordinator_->cancel_migration(id).has_value());
    wait(id);
    EXPECT_FALSE(coordinator_->throughput(id).has_value());
}

TEST_F(ConcurrencyTest, ListJobsNewestFirst) {
    fill_source(3, 100);
    use_source();
    auto first = start(options(1));
    ASSERT_EQ(wait(first).status, job_status::completed);

    add_bucket("second-target");
    auto second = start(options(1), "ws-1", "second-target");
    ASSERT_EQ(wait(second).status, job_status::completed);

    auto jobs = coordinator_->list_jobs("ws-1");
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].id, second);
    EXPECT_EQ(jobs[1].id, first);
    EXPECT_TRUE(coordinator_->list_jobs("ws-other").empty());
}

}  // namespace kcenon::storage_migration::test
