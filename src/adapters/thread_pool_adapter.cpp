// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Per-job worker pool implementations
 */

#include "kcenon/storage_migration/adapters/thread_pool_adapter.h"

#include <stdexcept>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::storage_migration::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

auto rejected_future(const std::string& name) -> std::future<void> {
    std::promise<void> promise;
    promise.set_exception(std::make_exception_ptr(
        std::runtime_error("worker pool " + name + " is shut down")));
    return promise.get_future();
}

}  // namespace

// ============================================================================
// migration_worker_pool
// ============================================================================

migration_worker_pool::migration_worker_pool(std::string name, size_t worker_count)
    : name_(std::move(name)),
      worker_count_(resolve_worker_count(worker_count)),
      active_(std::make_shared<std::atomic<size_t>>(0)) {}

std::function<void()> migration_worker_pool::track(
    std::function<void()> task, std::shared_ptr<std::promise<void>> promise) {
    active_->fetch_add(1);
    // The counter is shared so a task may outlive the pool object.
    return [task = std::move(task), promise = std::move(promise), active = active_]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        active->fetch_sub(1);
    };
}

// ============================================================================
// thread_system_worker_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

class copy_loop_job : public kcenon::thread::job {
public:
    copy_loop_job(std::function<void()> body, const std::string& name)
        : job(name), body_(std::move(body)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        body_();
        return common::ok();
    }

private:
    std::function<void()> body_;
};

}  // namespace

thread_system_worker_pool::thread_system_worker_pool(std::string name, size_t worker_count)
    : migration_worker_pool(std::move(name), worker_count),
      pool_(std::make_shared<kcenon::thread::thread_pool>(this->name())) {
    for (size_t i = 0; i < this->worker_count(); ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool_->get_job_queue());
        pool_->enqueue(std::move(worker));
    }
    pool_->start();
}

thread_system_worker_pool::~thread_system_worker_pool() {
    shutdown();
}

std::future<void> thread_system_worker_pool::submit(std::function<void()> task) {
    if (!running_.load()) {
        return rejected_future(name());
    }
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pool_->enqueue(std::make_unique<copy_loop_job>(track(std::move(task), promise), name()));
    return future;
}

void thread_system_worker_pool::shutdown() {
    bool expected = true;
    if (running_.compare_exchange_strong(expected, false)) {
        pool_->stop(false);
    }
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool
// ============================================================================

async_worker_pool::async_worker_pool(std::string name, size_t worker_count)
    : migration_worker_pool(std::move(name), worker_count) {}

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    if (!running_.load()) {
        return rejected_future(name());
    }
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    std::thread(track(std::move(task), std::move(promise))).detach();
    return future;
}

void async_worker_pool::shutdown() {
    running_.store(false);
}

// ============================================================================
// migration_pool_factory
// ============================================================================

std::unique_ptr<migration_worker_pool> migration_pool_factory::create(
    size_t worker_count, const std::string& name) {
#if KCENON_WITH_THREAD_SYSTEM
    return std::make_unique<thread_system_worker_pool>(name, worker_count);
#else
    return std::make_unique<async_worker_pool>(name, worker_count);
#endif
}

}  // namespace kcenon::storage_migration::adapters
