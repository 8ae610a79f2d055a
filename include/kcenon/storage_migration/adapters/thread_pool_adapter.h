// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Per-job worker pools for the copy pipeline
 *
 * Each running migration job owns one pool sized to its concurrency. The
 * pool is backed by thread_system when the library is built with it and
 * by one detached std::thread per task otherwise.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::storage_migration::adapters {

/**
 * @brief Pool running the worker loops of a single job
 *
 * An exception thrown by a task is delivered through its future.
 */
class migration_worker_pool {
public:
    explicit migration_worker_pool(std::string name, size_t worker_count);
    virtual ~migration_worker_pool() = default;

    migration_worker_pool(const migration_worker_pool&) = delete;
    migration_worker_pool& operator=(const migration_worker_pool&) = delete;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Stop accepting work; tasks already running finish normally
     */
    virtual void shutdown() = 0;

    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] size_t worker_count() const { return worker_count_; }

    /**
     * @brief Tasks submitted and not yet finished
     */
    [[nodiscard]] size_t active_tasks() const { return active_->load(); }

    [[nodiscard]] bool is_running() const { return running_.load(); }

protected:
    /**
     * @brief Wrap @p task so that it fulfils @p promise and keeps
     *        active_tasks() current
     */
    std::function<void()> track(std::function<void()> task,
                                std::shared_ptr<std::promise<void>> promise);

    std::atomic<bool> running_{true};

private:
    std::string name_;
    size_t worker_count_;
    std::shared_ptr<std::atomic<size_t>> active_;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Pool backed by a started kcenon::thread::thread_pool
 */
class thread_system_worker_pool : public migration_worker_pool {
public:
    thread_system_worker_pool(std::string name, size_t worker_count);
    ~thread_system_worker_pool() override;

    std::future<void> submit(std::function<void()> task) override;
    void shutdown() override;

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool: one detached std::thread per task
 *
 * The coordinator submits exactly worker_count() loops per job, so the
 * thread count stays bounded.
 */
class async_worker_pool : public migration_worker_pool {
public:
    async_worker_pool(std::string name, size_t worker_count);

    std::future<void> submit(std::function<void()> task) override;
    void shutdown() override;
};

class migration_pool_factory {
public:
    /**
     * @param worker_count Worker threads; 0 selects hardware concurrency
     * @param name Pool label, typically "copy:<job id>"
     */
    [[nodiscard]] static std::unique_ptr<migration_worker_pool> create(size_t worker_count,
                                                                       const std::string& name);

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::storage_migration::adapters
