/**
 * @file progress_tracker.h
 * @brief Single update path for job counters, throughput and ETA
 *
 * Workers never touch a job directly. Per-file results, error entries and
 * status transitions go through the tracker, which persists them via the
 * job store, refreshes the estimated completion time from the observed
 * throughput and notifies the progress listener.
 */

#ifndef KCENON_STORAGE_MIGRATION_MIGRATION_PROGRESS_TRACKER_H
#define KCENON_STORAGE_MIGRATION_MIGRATION_PROGRESS_TRACKER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "kcenon/storage_migration/core/job_id.h"
#include "kcenon/storage_migration/core/types.h"
#include "kcenon/storage_migration/migration/job_store.h"
#include "kcenon/storage_migration/migration/migration_types.h"

namespace kcenon::storage_migration {

/**
 * @brief Callback invoked with a fresh job snapshot
 *
 * Called on worker or supervisor threads with no tracker or store lock
 * held; it may call back into the engine.
 */
using progress_listener = std::function<void(const migration_job&)>;

/**
 * @brief Throughput figures of the current run of a job
 */
struct throughput_snapshot {
    uint64_t bytes_this_run = 0;
    uint64_t files_this_run = 0;
    double current_rate = 0.0;  ///< bytes/sec over the sample window
    double average_rate = 0.0;  ///< bytes/sec since the run started
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Progress tracker
 *
 * A run starts when workers are launched for a job (first start or a
 * resume) and ends when they have all stopped. Throughput is only derived
 * from bytes moved during the current run, so resumed jobs do not count
 * bytes verified by an earlier process.
 *
 * @note Thread-safe.
 */
class progress_tracker {
public:
    struct config {
        std::size_t rate_window_size = 16;  ///< Samples kept for the current rate
        std::chrono::milliseconds min_eta_elapsed{250};  ///< Run age before ETAs are published
    };

    explicit progress_tracker(job_store& store);
    progress_tracker(job_store& store, config cfg);
    ~progress_tracker();

    progress_tracker(const progress_tracker&) = delete;
    auto operator=(const progress_tracker&) -> progress_tracker& = delete;

    void set_listener(progress_listener listener);

    /**
     * @brief Start throughput accounting for a run of @p id
     */
    void begin_run(const job_id& id);

    /**
     * @brief Stop throughput accounting for @p id
     */
    void end_run(const job_id& id);

    /**
     * @brief Persist the terminal result of a claimed record
     *
     * Counters and the estimated completion time are updated in the same
     * store critical section as the journal append.
     */
    [[nodiscard]] auto record_result(const job_id& id, const file_migration_record& record)
        -> result<migration_job>;

    /**
     * @brief Append an error entry to the job
     */
    [[nodiscard]] auto record_error(const job_id& id, const migration_error_entry& entry)
        -> result<void>;

    /**
     * @brief Apply a status change (or any header mutation) and notify
     */
    [[nodiscard]] auto transition(const job_id& id, const job_mutator& mutator)
        -> result<migration_job>;

    [[nodiscard]] auto throughput(const job_id& id) const -> std::optional<throughput_snapshot>;

    /**
     * @brief Notify the listener with the current snapshot of @p id
     */
    void publish(const job_id& id);

private:
    void notify(const migration_job& job);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_MIGRATION_PROGRESS_TRACKER_H
