/**
 * @file test_job_store.cpp
 * @brief Unit tests for the durable job store
 */

#include <gtest/gtest.h>

#include <kcenon/storage_migration/migration/job_store.h>
#include <kcenon/storage_migration/security/config_cipher.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace kcenon::storage_migration::test {

class JobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        state_dir_ = std::filesystem::temp_directory_path() /
                     ("storage_migration_job_store_" + std::to_string(rd()));
        std::filesystem::create_directories(state_dir_);
        reopen();
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(state_dir_, ec);
    }

    void reopen(std::shared_ptr<const config_cipher> cipher = nullptr) {
        store_.reset();
        job_store_options options;
        options.state_directory = state_dir_;
        options.checkpoint_interval = 2;
        options.max_error_entries = 3;
        options.cipher = std::move(cipher);
        auto store = job_store::open(options);
        ASSERT_TRUE(store.has_value()) << store.error().message;
        store_ = std::move(store.value());
    }

    auto request(const std::string& workspace = "ws-1") -> new_job_request {
        new_job_request req;
        req.workspace_id = workspace;
        req.source_provider = "local";
        req.source_config = {{"root", "/data/source"}};
        req.target_provider = "s3";
        req.target_config = {{"bucket", "archive"}, {"secret_access_key", "s3cr3t"}};
        req.owner_id = "node-a";
        return req;
    }

    auto create(const std::string& workspace = "ws-1") -> migration_job {
        auto job = store_->create_job(request(workspace));
        EXPECT_TRUE(job.has_value()) << job.error().message;
        return job.value();
    }

    // Creates a job with @p count files of 100 bytes each and starts it
    auto create_running(std::size_t count, const std::string& workspace = "ws-1")
        -> migration_job {
        auto job = create(workspace);
        std::vector<storage_object> page;
        for (std::size_t i = 0; i < count; ++i) {
            page.push_back({"file-" + std::to_string(i), 100});
        }
        EXPECT_TRUE(store_->append_manifest(job.id, page).has_value());
        EXPECT_TRUE(store_->finalize_manifest(job.id).has_value());
        auto started = store_->update_job(job.id, [](migration_job& j) {
            j.status = job_status::in_progress;
        });
        EXPECT_TRUE(started.has_value());
        return started.value();
    }

    auto claim(const job_id& id) -> file_migration_record {
        auto claimed = store_->claim_next(id);
        EXPECT_TRUE(claimed.has_value());
        EXPECT_TRUE(claimed.value().has_value());
        return *claimed.value();
    }

    void commit(const job_id& id, file_migration_record record, file_status status) {
        record.status = status;
        record.attempts = 1;
        if (status == file_status::verified) {
            record.source_checksum = "aa";
            record.target_checksum = "aa";
        } else {
            record.last_error = "checksum mismatch";
        }
        auto committed = store_->commit_record(id, record);
        ASSERT_TRUE(committed.has_value()) << committed.error().message;
    }

    auto header_text(const job_id& id) -> std::string {
        std::ifstream in(state_dir_ / "jobs" / id.to_string() / "job.json");
        return std::string((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    }

    std::filesystem::path state_dir_;
    std::unique_ptr<job_store> store_;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(JobStoreTest, OpenRequiresStateDirectory) {
    auto store = job_store::open(job_store_options{});
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error().code, error_code::invalid_configuration);
}

TEST_F(JobStoreTest, ValidateWorkspaceId) {
    EXPECT_TRUE(job_store::validate_workspace_id("ws-1").has_value());
    EXPECT_TRUE(job_store::validate_workspace_id("Team_A.prod").has_value());
    EXPECT_FALSE(job_store::validate_workspace_id("").has_value());
    EXPECT_FALSE(job_store::validate_workspace_id("..").has_value());
    EXPECT_FALSE(job_store::validate_workspace_id("a/b").has_value());
    EXPECT_FALSE(job_store::validate_workspace_id("a b").has_value());

    auto job = store_->create_job(request("../escape"));
    ASSERT_FALSE(job.has_value());
    EXPECT_EQ(job.error().code, error_code::invalid_argument);
}

TEST_F(JobStoreTest, CreateJob) {
    auto job = create();
    EXPECT_EQ(job.status, job_status::pending);
    EXPECT_EQ(job.workspace_id, "ws-1");
    EXPECT_EQ(job.owner_id, "node-a");
    EXPECT_FALSE(job.manifest_complete);
    EXPECT_TRUE(std::filesystem::exists(state_dir_ / "jobs" / job.id.to_string() / "job.json"));
    EXPECT_TRUE(std::filesystem::exists(state_dir_ / "workspaces" / "ws-1.lock"));

    auto active = store_->find_active_job("ws-1");
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->id, job.id);
}

TEST_F(JobStoreTest, RejectsInvalidOptions) {
    auto req = request();
    req.options.concurrency = 0;
    auto job = store_->create_job(req);
    ASSERT_FALSE(job.has_value());
    EXPECT_EQ(job.error().code, error_code::invalid_argument);
    EXPECT_FALSE(store_->find_active_job("ws-1").has_value());
}

TEST_F(JobStoreTest, SecondActiveJobIsRejected) {
    auto first = create();

    auto second = store_->create_job(request());
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::job_already_active);

    auto other_workspace = store_->create_job(request("ws-2"));
    EXPECT_TRUE(other_workspace.has_value());

    auto cancelled = store_->update_job(first.id, [](migration_job& j) {
        j.status = job_status::cancelled;
    });
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_FALSE(store_->find_active_job("ws-1").has_value());

    auto third = store_->create_job(request());
    EXPECT_TRUE(third.has_value());
}

TEST_F(JobStoreTest, ReactivationChecksSlot) {
    auto first = create();
    ASSERT_TRUE(store_->update_job(first.id, [](migration_job& j) {
        j.status = job_status::failed;
    }).has_value());

    auto second = create();

    auto revived = store_->update_job(first.id, [](migration_job& j) {
        j.status = job_status::in_progress;
    });
    ASSERT_FALSE(revived.has_value());
    EXPECT_EQ(revived.error().code, error_code::job_already_active);

    auto unchanged = store_->get_job(first.id);
    ASSERT_TRUE(unchanged.has_value());
    EXPECT_EQ(unchanged.value().status, job_status::failed);
    EXPECT_EQ(store_->find_active_job("ws-1")->id, second.id);
}

// ============================================================================
// Manifest
// ============================================================================

TEST_F(JobStoreTest, ManifestPagesAccumulate) {
    auto job = create();
    std::vector<storage_object> first{{"a", 10}, {"b", 20}};
    // Overlapping page boundary
    std::vector<storage_object> second{{"b", 20}, {"c", 30}};

    ASSERT_TRUE(store_->append_manifest(job.id, first).has_value());
    ASSERT_TRUE(store_->append_manifest(job.id, second).has_value());

    auto finalized = store_->finalize_manifest(job.id);
    ASSERT_TRUE(finalized.has_value());
    EXPECT_TRUE(finalized.value().manifest_complete);
    EXPECT_EQ(finalized.value().total_files, 3u);
    EXPECT_EQ(finalized.value().total_bytes, 60u);

    auto records = store_->records(job.id);
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records.value().size(), 3u);
    EXPECT_EQ(records.value()[2].path, "c");
    EXPECT_EQ(records.value()[2].status, file_status::pending);
}

TEST_F(JobStoreTest, ManifestRejectsKeysOutOfOrder) {
    auto job = create();
    std::vector<storage_object> first{{"m", 10}};
    std::vector<storage_object> second{{"n", 20}, {"a", 30}};

    ASSERT_TRUE(store_->append_manifest(job.id, first).has_value());
    auto appended = store_->append_manifest(job.id, second);
    ASSERT_FALSE(appended.has_value());
    EXPECT_EQ(appended.error().code, error_code::invalid_argument);

    // The rejected page is not applied
    EXPECT_EQ(store_->get_job(job.id).value().total_files, 1u);
    std::vector<storage_object> next{{"n", 20}};
    ASSERT_TRUE(store_->append_manifest(job.id, next).has_value());
    EXPECT_EQ(store_->get_job(job.id).value().total_files, 2u);
}

TEST_F(JobStoreTest, ManifestIsClosedAfterFinalize) {
    auto job = create();
    ASSERT_TRUE(store_->finalize_manifest(job.id).has_value());

    std::vector<storage_object> page{{"late", 1}};
    auto appended = store_->append_manifest(job.id, page);
    ASSERT_FALSE(appended.has_value());
    EXPECT_EQ(appended.error().code, error_code::invalid_job_state);

    auto reset = store_->reset_manifest(job.id);
    ASSERT_FALSE(reset.has_value());
    EXPECT_EQ(reset.error().code, error_code::invalid_job_state);
}

TEST_F(JobStoreTest, ResetManifest) {
    auto job = create();
    std::vector<storage_object> page{{"a", 10}, {"b", 20}};
    ASSERT_TRUE(store_->append_manifest(job.id, page).has_value());

    ASSERT_TRUE(store_->reset_manifest(job.id).has_value());
    auto reset = store_->get_job(job.id);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(reset.value().total_files, 0u);
    EXPECT_EQ(reset.value().total_bytes, 0u);
    EXPECT_TRUE(store_->records(job.id).value().empty());

    ASSERT_TRUE(store_->append_manifest(job.id, page).has_value());
    EXPECT_EQ(store_->get_job(job.id).value().total_files, 2u);
}

// ============================================================================
// Records
// ============================================================================

TEST_F(JobStoreTest, ClaimRequiresRunningJob) {
    auto job = create();
    auto claimed = store_->claim_next(job.id);
    ASSERT_FALSE(claimed.has_value());
    EXPECT_EQ(claimed.error().code, error_code::invalid_job_state);
}

TEST_F(JobStoreTest, ClaimInManifestOrder) {
    auto job = create_running(3);

    EXPECT_EQ(claim(job.id).path, "file-0");
    EXPECT_EQ(claim(job.id).path, "file-1");
    EXPECT_EQ(claim(job.id).path, "file-2");

    auto none = store_->claim_next(job.id);
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none.value().has_value());

    EXPECT_EQ(store_->record(job.id, "file-1").value().status, file_status::copying);
}

TEST_F(JobStoreTest, CommitUpdatesCounters) {
    auto job = create_running(3);

    commit(job.id, claim(job.id), file_status::verified);
    commit(job.id, claim(job.id), file_status::failed);

    auto current = store_->get_job(job.id);
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current.value().migrated_files, 1u);
    EXPECT_EQ(current.value().migrated_bytes, 100u);
    EXPECT_EQ(current.value().failed_files, 1u);

    auto failed = store_->record(job.id, "file-1");
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed.value().status, file_status::failed);
    EXPECT_EQ(failed.value().last_error, "checksum mismatch");
}

TEST_F(JobStoreTest, CommitRunsMutatorInSameUpdate) {
    auto job = create_running(1);
    auto record = claim(job.id);
    record.status = file_status::verified;

    auto committed = store_->commit_record(job.id, record, [](migration_job& j) {
        j.status = job_status::completed;
    });
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed.value().status, job_status::completed);
    EXPECT_EQ(committed.value().migrated_files, 1u);
}

TEST_F(JobStoreTest, CommitRejectsUnclaimedOrNonTerminal) {
    auto job = create_running(2);

    file_migration_record unclaimed;
    unclaimed.path = "file-1";
    unclaimed.status = file_status::verified;
    auto result = store_->commit_record(job.id, unclaimed);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_job_state);

    auto record = claim(job.id);
    record.status = file_status::pending;
    result = store_->commit_record(job.id, record);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_argument);

    file_migration_record unknown;
    unknown.path = "missing";
    unknown.status = file_status::verified;
    result = store_->commit_record(job.id, unknown);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::object_not_found);
}

TEST_F(JobStoreTest, ReleaseReturnsRecordToPending) {
    auto job = create_running(2);
    auto first = claim(job.id);
    auto second = claim(job.id);

    ASSERT_TRUE(store_->release_record(job.id, first.path).has_value());
    EXPECT_EQ(store_->record(job.id, first.path).value().status, file_status::pending);

    EXPECT_EQ(claim(job.id).path, first.path);
    commit(job.id, second, file_status::verified);
}

TEST_F(JobStoreTest, ResetFailedRecords) {
    auto job = create_running(3);
    commit(job.id, claim(job.id), file_status::verified);
    commit(job.id, claim(job.id), file_status::failed);
    commit(job.id, claim(job.id), file_status::failed);

    auto reset = store_->reset_failed_records(job.id);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(reset.value(), 2u);

    auto current = store_->get_job(job.id).value();
    EXPECT_EQ(current.failed_files, 0u);
    EXPECT_EQ(current.migrated_files, 1u);

    auto record = store_->record(job.id, "file-1").value();
    EXPECT_EQ(record.status, file_status::pending);
    EXPECT_EQ(record.attempts, 0u);
    EXPECT_TRUE(record.last_error.empty());

    EXPECT_EQ(claim(job.id).path, "file-1");
    EXPECT_EQ(claim(job.id).path, "file-2");
}

TEST_F(JobStoreTest, ErrorListIsBounded) {
    auto job = create();
    for (int i = 0; i < 5; ++i) {
        migration_error_entry entry;
        entry.path = "file-" + std::to_string(i);
        entry.kind = error_kind::checksum_mismatch;
        entry.message = "mismatch";
        entry.attempt = 3;
        ASSERT_TRUE(store_->record_error(job.id, entry).has_value());
    }

    auto current = store_->get_job(job.id).value();
    EXPECT_EQ(current.error_count, 5u);
    ASSERT_EQ(current.errors.size(), 3u);
    EXPECT_EQ(current.errors.front().path, "file-2");
    EXPECT_EQ(current.errors.back().path, "file-4");
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(JobStoreTest, ReopenReplaysJournal) {
    auto job = create_running(4);
    commit(job.id, claim(job.id), file_status::verified);
    commit(job.id, claim(job.id), file_status::failed);
    claim(job.id);

    reopen();

    auto loaded = store_->get_job(job.id);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value().status, job_status::in_progress);
    EXPECT_EQ(loaded.value().total_files, 4u);
    EXPECT_EQ(loaded.value().migrated_files, 1u);
    EXPECT_EQ(loaded.value().failed_files, 1u);
    EXPECT_EQ(loaded.value().source_config.at("root"), "/data/source");
    EXPECT_TRUE(loaded.value().manifest_complete);

    EXPECT_EQ(store_->record(job.id, "file-0").value().status, file_status::verified);
    EXPECT_EQ(store_->record(job.id, "file-2").value().status, file_status::pending);

    auto active = store_->find_active_job("ws-1");
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->id, job.id);
    EXPECT_FALSE(store_->create_job(request()).has_value());
}

TEST_F(JobStoreTest, ClaimsAfterReopenSkipSettledRecords) {
    auto job = create_running(5);
    commit(job.id, claim(job.id), file_status::verified);
    claim(job.id);
    commit(job.id, claim(job.id), file_status::verified);

    reopen();

    // file-1 was in flight and is pending again
    EXPECT_EQ(claim(job.id).path, "file-1");
    EXPECT_EQ(claim(job.id).path, "file-3");
    EXPECT_EQ(claim(job.id).path, "file-4");
    auto none = store_->claim_next(job.id);
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none.value().has_value());
}

TEST_F(JobStoreTest, RecordsOfFinishedJobAreReadFromDisk) {
    auto job = create_running(3);
    commit(job.id, claim(job.id), file_status::verified);
    commit(job.id, claim(job.id), file_status::failed);
    commit(job.id, claim(job.id), file_status::verified);
    ASSERT_TRUE(store_->update_job(job.id, [](migration_job& j) {
        j.status = job_status::completed;
    }).has_value());

    reopen();

    auto loaded = store_->get_job(job.id).value();
    EXPECT_EQ(loaded.status, job_status::completed);
    EXPECT_EQ(loaded.total_files, 3u);
    EXPECT_EQ(loaded.migrated_files, 2u);
    EXPECT_EQ(loaded.failed_files, 1u);

    auto records = store_->records(job.id);
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records.value().size(), 3u);
    EXPECT_EQ(records.value()[0].status, file_status::verified);
    EXPECT_EQ(records.value()[1].status, file_status::failed);
    EXPECT_EQ(records.value()[1].last_error, "checksum mismatch");
    EXPECT_EQ(records.value()[2].status, file_status::verified);
    EXPECT_EQ(records.value()[2].size_bytes, 100u);
}

TEST_F(JobStoreTest, PausedJobResumesAfterReopen) {
    auto job = create_running(3);
    commit(job.id, claim(job.id), file_status::verified);
    ASSERT_TRUE(store_->update_job(job.id, [](migration_job& j) {
        j.status = job_status::paused;
    }).has_value());

    reopen();

    EXPECT_EQ(store_->get_job(job.id).value().migrated_files, 1u);
    ASSERT_TRUE(store_->update_job(job.id, [](migration_job& j) {
        j.status = job_status::in_progress;
    }).has_value());
    EXPECT_EQ(claim(job.id).path, "file-1");
}

TEST_F(JobStoreTest, TerminalJobsReleaseSlotAcrossReopen) {
    auto job = create();
    ASSERT_TRUE(store_->update_job(job.id, [](migration_job& j) {
        j.status = job_status::cancelled;
    }).has_value());

    reopen();

    EXPECT_FALSE(store_->find_active_job("ws-1").has_value());
    auto latest = store_->find_latest_job("ws-1");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->status, job_status::cancelled);
    EXPECT_TRUE(store_->create_job(request()).has_value());
}

TEST_F(JobStoreTest, StaleLockIsReclaimed) {
    std::filesystem::create_directories(state_dir_ / "workspaces");
    {
        std::ofstream lock(state_dir_ / "workspaces" / "ws-9.lock");
        lock << job_id::generate().to_string();
    }
    reopen();

    EXPECT_TRUE(store_->create_job(request("ws-9")).has_value());
}

TEST_F(JobStoreTest, ListJobsNewestFirst) {
    auto first = create();
    ASSERT_TRUE(store_->update_job(first.id, [](migration_job& j) {
        j.status = job_status::failed;
    }).has_value());
    auto second = create();
    create("ws-2");

    auto jobs = store_->list_jobs("ws-1");
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].id, second.id);
    EXPECT_EQ(jobs[1].id, first.id);
    EXPECT_EQ(store_->list_all_jobs().size(), 3u);
}

TEST_F(JobStoreTest, DiscardOnlyInactiveJobs) {
    auto job = create();
    auto refused = store_->discard_job(job.id);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, error_code::invalid_job_state);

    ASSERT_TRUE(store_->update_job(job.id, [](migration_job& j) {
        j.status = job_status::failed;
    }).has_value());
    ASSERT_TRUE(store_->discard_job(job.id).has_value());

    EXPECT_FALSE(std::filesystem::exists(state_dir_ / "jobs" / job.id.to_string()));
    auto missing = store_->get_job(job.id);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::job_not_found);
}

TEST_F(JobStoreTest, UnknownJob) {
    auto id = job_id::generate();
    EXPECT_EQ(store_->get_job(id).error().code, error_code::job_not_found);
    EXPECT_EQ(store_->claim_next(id).error().code, error_code::job_not_found);
    EXPECT_EQ(store_->checkpoint(id).error().code, error_code::job_not_found);
}

TEST_F(JobStoreTest, CorruptHeaderIsSkipped) {
    auto job = create();
    ASSERT_TRUE(store_->update_job(job.id, [](migration_job& j) {
        j.status = job_status::failed;
    }).has_value());
    {
        std::ofstream out(state_dir_ / "jobs" / job.id.to_string() / "job.json",
                          std::ios::trunc);
        out << "{not json";
    }

    reopen();
    EXPECT_FALSE(store_->get_job(job.id).has_value());
}

// ============================================================================
// Sealed provider configs
// ============================================================================

TEST_F(JobStoreTest, SealedConfigsRoundTrip) {
    auto key = config_cipher::generate_key_base64();
    ASSERT_TRUE(key.has_value());
    auto cipher = config_cipher::from_base64(key.value());
    ASSERT_TRUE(cipher.has_value());
    std::shared_ptr<const config_cipher> shared(std::move(cipher.value()));

    reopen(shared);
    auto job = create();
    auto text = header_text(job.id);
    EXPECT_EQ(text.find("s3cr3t"), std::string::npos);
    EXPECT_NE(text.find("target_config_sealed"), std::string::npos);

    reopen(shared);
    auto loaded = store_->get_job(job.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().target_config.at("secret_access_key"), "s3cr3t");
}

TEST_F(JobStoreTest, SealedConfigsNeedKey) {
    auto key = config_cipher::generate_key_base64();
    ASSERT_TRUE(key.has_value());
    auto cipher = config_cipher::from_base64(key.value());
    ASSERT_TRUE(cipher.has_value());

    reopen(std::shared_ptr<const config_cipher>(std::move(cipher.value())));
    auto job = create();

    reopen();
    EXPECT_FALSE(store_->get_job(job.id).has_value());
}

}  // namespace kcenon::storage_migration::test
