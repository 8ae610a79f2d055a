/**
 * @file progress_tracker.cpp
 * @brief Implementation of the progress tracker
 */

#include "kcenon/storage_migration/migration/progress_tracker.h"

#include "kcenon/storage_migration/core/logging.h"

#include <deque>
#include <exception>
#include <mutex>
#include <unordered_map>

namespace kcenon::storage_migration {

namespace {

using steady_time = std::chrono::steady_clock::time_point;

struct rate_sample {
    steady_time timestamp;
    uint64_t bytes;
};

struct run_state {
    steady_time started;
    uint64_t bytes = 0;
    uint64_t files = 0;
    std::deque<rate_sample> samples;
};

auto seconds_between(steady_time from, steady_time to) -> double {
    return std::chrono::duration<double>(to - from).count();
}

}  // namespace

struct progress_tracker::impl {
    job_store& store;
    config cfg;

    mutable std::mutex mutex;
    std::unordered_map<job_id, run_state> runs;

    std::mutex listener_mutex;
    std::shared_ptr<const progress_listener> listener;

    impl(job_store& s, config c) : store(s), cfg(c) {}

    [[nodiscard]] auto current_rate(const run_state& run) const -> double {
        if (run.samples.size() < 2) {
            return 0.0;
        }
        const auto& oldest = run.samples.front();
        const auto& newest = run.samples.back();
        double seconds = seconds_between(oldest.timestamp, newest.timestamp);
        if (seconds <= 0.0) {
            return 0.0;
        }
        return static_cast<double>(newest.bytes - oldest.bytes) / seconds;
    }

    [[nodiscard]] static auto average_rate(const run_state& run, steady_time now) -> double {
        double seconds = seconds_between(run.started, now);
        if (seconds <= 0.0) {
            return 0.0;
        }
        return static_cast<double>(run.bytes) / seconds;
    }

    /**
     * @brief Account one result and refresh the job's ETA
     *
     * Runs inside the job store's per-job critical section.
     */
    void account(const job_id& id, const file_migration_record& record, migration_job& job) {
        std::lock_guard lock(mutex);
        auto it = runs.find(id);
        if (it == runs.end()) {
            return;
        }

        auto& run = it->second;
        const auto now = std::chrono::steady_clock::now();
        run.files += 1;
        if (record.status == file_status::verified) {
            run.bytes += record.size_bytes;
        }
        run.samples.push_back({now, run.bytes});
        while (run.samples.size() > cfg.rate_window_size) {
            run.samples.pop_front();
        }

        if (now - run.started < cfg.min_eta_elapsed) {
            return;
        }
        double rate = average_rate(run, now);
        if (rate <= 0.0) {
            return;
        }
        uint64_t remaining =
            job.total_bytes > job.migrated_bytes ? job.total_bytes - job.migrated_bytes : 0;
        auto eta = std::chrono::milliseconds(
            static_cast<int64_t>(static_cast<double>(remaining) * 1000.0 / rate));
        job.estimated_completion_at =
            std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::system_clock::now() + eta);
    }
};

progress_tracker::progress_tracker(job_store& store)
    : progress_tracker(store, config{}) {}

progress_tracker::progress_tracker(job_store& store, config cfg)
    : impl_(std::make_unique<impl>(store, cfg)) {}

progress_tracker::~progress_tracker() = default;

void progress_tracker::set_listener(progress_listener listener) {
    std::shared_ptr<const progress_listener> shared;
    if (listener) {
        shared = std::make_shared<const progress_listener>(std::move(listener));
    }
    std::lock_guard lock(impl_->listener_mutex);
    impl_->listener = std::move(shared);
}

void progress_tracker::begin_run(const job_id& id) {
    std::lock_guard lock(impl_->mutex);
    run_state run;
    run.started = std::chrono::steady_clock::now();
    run.samples.push_back({run.started, 0});
    impl_->runs[id] = std::move(run);
}

void progress_tracker::end_run(const job_id& id) {
    std::lock_guard lock(impl_->mutex);
    impl_->runs.erase(id);
}

auto progress_tracker::record_result(const job_id& id, const file_migration_record& record)
    -> result<migration_job> {
    auto job = impl_->store.commit_record(id, record, [this, &id, &record](migration_job& j) {
        impl_->account(id, record, j);
    });
    if (!job) {
        return job;
    }
    notify(job.value());
    return job;
}

auto progress_tracker::record_error(const job_id& id, const migration_error_entry& entry)
    -> result<void> {
    return impl_->store.record_error(id, entry);
}

auto progress_tracker::transition(const job_id& id, const job_mutator& mutator)
    -> result<migration_job> {
    auto job = impl_->store.update_job(id, mutator);
    if (!job) {
        return job;
    }
    notify(job.value());
    return job;
}

auto progress_tracker::throughput(const job_id& id) const -> std::optional<throughput_snapshot> {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->runs.find(id);
    if (it == impl_->runs.end()) {
        return std::nullopt;
    }

    const auto& run = it->second;
    const auto now = std::chrono::steady_clock::now();
    throughput_snapshot snap;
    snap.bytes_this_run = run.bytes;
    snap.files_this_run = run.files;
    snap.current_rate = impl_->current_rate(run);
    snap.average_rate = impl::average_rate(run, now);
    snap.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - run.started);
    return snap;
}

void progress_tracker::publish(const job_id& id) {
    auto job = impl_->store.get_job(id);
    if (job) {
        notify(job.value());
    }
}

void progress_tracker::notify(const migration_job& job) {
    std::shared_ptr<const progress_listener> listener;
    {
        std::lock_guard lock(impl_->listener_mutex);
        listener = impl_->listener;
    }
    if (!listener) {
        return;
    }

    try {
        (*listener)(job);
    } catch (const std::exception& e) {
        SM_LOG_WARN(log_category::coordinator,
            "Progress listener threw for job " + job.id.to_string() + ": " + e.what());
    }
}

}  // namespace kcenon::storage_migration
