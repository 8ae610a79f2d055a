/**
 * @file migration_coordinator.cpp
 * @brief Implementation of the migration coordinator
 */

#include "kcenon/storage_migration/migration/migration_coordinator.h"

#include "kcenon/storage_migration/adapters/thread_pool_adapter.h"
#include "kcenon/storage_migration/core/cancellation_token.h"
#include "kcenon/storage_migration/core/logging.h"
#include "kcenon/storage_migration/migration/copy_worker.h"
#include "kcenon/storage_migration/migration/job_store.h"
#include "kcenon/storage_migration/migration/scope_calculator.h"
#include "kcenon/storage_migration/security/config_cipher.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace kcenon::storage_migration {

namespace {

auto now() -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::now();
}

auto job_error(const error& err, const std::string& path = {}) -> migration_error_entry {
    migration_error_entry entry;
    entry.path = path;
    entry.kind = kind_of(err.code);
    entry.message = err.message;
    entry.timestamp = now();
    entry.retryable = is_retryable(entry.kind);
    return entry;
}

/**
 * @brief Supervision state of one running job
 */
struct job_run {
    job_id id;
    std::string workspace_id;
    cancellation_token token;
    std::unique_ptr<storage_backend> source;
    std::unique_ptr<storage_backend> target;
    std::thread supervisor;

    /// Guarded by the coordinator mutex
    bool finished = false;
};

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct migration_coordinator::impl {
    engine_config config;
    std::string owner;
    std::shared_ptr<backend_registry> registry;
    std::shared_ptr<const config_cipher> cipher;
    std::unique_ptr<job_store> store;
    std::unique_ptr<workspace_config_store> configs;
    std::unique_ptr<progress_tracker> tracker;
    std::unique_ptr<cutover_manager> cutover;

    std::mutex mutex;
    std::condition_variable cv;
    std::unordered_map<job_id, std::shared_ptr<job_run>> runs;
    bool shutting_down = false;

    ~impl() { shutdown(); }

    // ------------------------------------------------------------------------
    // Helpers
    // ------------------------------------------------------------------------

    auto open_backend(const std::string& provider, const storage_config& cfg) const
        -> result<std::unique_ptr<storage_backend>> {
        auto backend = registry->create(provider, cfg);
        if (!backend) {
            return backend;
        }
        auto connected = backend.value()->connect();
        if (!connected) {
            SM_LOG_WARN(log_category::coordinator,
                "Connection test against " + provider + " " + redact_config(cfg) +
                    " failed: " + connected.error().message);
            return unexpected(connected.error());
        }
        return backend;
    }

    /// Joins supervisors that have finished; requires mutex
    void reap_locked() {
        for (auto it = runs.begin(); it != runs.end();) {
            if (it->second->finished) {
                if (it->second->supervisor.joinable()) {
                    it->second->supervisor.join();
                }
                it = runs.erase(it);
            } else {
                ++it;
            }
        }
    }

    /// Requires mutex
    [[nodiscard]] auto live_run_locked(const job_id& id) const -> std::shared_ptr<job_run> {
        auto it = runs.find(id);
        if (it == runs.end() || it->second->finished) {
            return nullptr;
        }
        return it->second;
    }

    [[nodiscard]] auto is_orphaned(const migration_job& job) const -> bool {
        if (job.owner_id.empty() || job.owner_id == owner || !job.heartbeat_at) {
            return true;
        }
        return now() - *job.heartbeat_at > config.owner_lease;
    }

    /**
     * @brief Claim the run slot of @p id before its stored state changes
     *
     * The slot is a placeholder without a supervisor until start_run(); it
     * counts as a live run for pause, cancel, wait and discard. Only the
     * holder of the returned run may start or abandon it.
     */
    auto reserve(const job_id& id) -> result<std::shared_ptr<job_run>> {
        std::lock_guard lock(mutex);
        if (shutting_down) {
            return unexpected(error{error_code::operation_cancelled,
                                    "coordinator is shutting down"});
        }
        reap_locked();
        if (runs.count(id) > 0) {
            return unexpected(error{error_code::invalid_job_state,
                                    "job " + id.to_string() + " is still running"});
        }

        auto run = std::make_shared<job_run>();
        run->id = id;
        runs.emplace(id, run);
        return run;
    }

    /// Hand the backends of a reserved slot to a new supervisor
    auto start_run(const std::shared_ptr<job_run>& run, const migration_job& job,
                   std::unique_ptr<storage_backend> source,
                   std::unique_ptr<storage_backend> target) -> result<void> {
        std::lock_guard lock(mutex);
        auto it = runs.find(run->id);
        if (shutting_down || it == runs.end() || it->second != run) {
            return unexpected(error{error_code::operation_cancelled,
                                    "coordinator is shutting down"});
        }
        run->workspace_id = job.workspace_id;
        run->source = std::move(source);
        run->target = std::move(target);
        run->supervisor = std::thread([this, run] { supervise(run); });
        return {};
    }

    /**
     * @brief Give up a slot whose supervisor never started
     *
     * A cancellation requested while the slot was held is applied to the
     * stored job before the slot is released.
     */
    void abandon(const std::shared_ptr<job_run>& run) {
        if (run->token.reason() == stop_reason::cancel) {
            auto cancelled = tracker->transition(run->id, [](migration_job& j) {
                if (is_active(j.status)) {
                    j.status = job_status::cancelled;
                    j.completed_at = now();
                    j.owner_id.clear();
                }
            });
            if (!cancelled) {
                SM_LOG_ERROR(log_category::coordinator,
                    "Cannot cancel job " + run->id.to_string() + ": " +
                        cancelled.error().message);
            }
        }
        {
            std::lock_guard lock(mutex);
            auto it = runs.find(run->id);
            if (it != runs.end() && it->second == run) {
                runs.erase(it);
            }
            run->finished = true;
        }
        cv.notify_all();
    }

    void finish(const std::shared_ptr<job_run>& run) {
        {
            std::lock_guard lock(mutex);
            run->finished = true;
        }
        cv.notify_all();
    }

    void heartbeat(const job_run& run) {
        auto beat = store->update_job(run.id, [](migration_job& j) { j.heartbeat_at = now(); });
        if (!beat) {
            SM_LOG_WARN(log_category::coordinator,
                "Heartbeat of job " + run.id.to_string() + " failed: " + beat.error().message);
        }
    }

    void fail_job(const job_id& id, const migration_error_entry& entry) {
        auto failed = tracker->transition(id, [&entry](migration_job& j) {
            j.status = job_status::failed;
            j.completed_at = now();
            if (!j.fatal_error) {
                j.fatal_error = entry;
            }
        });
        if (!failed) {
            SM_LOG_ERROR(log_category::coordinator,
                "Cannot mark job " + id.to_string() + " failed: " + failed.error().message);
        }
    }

    // ------------------------------------------------------------------------
    // Supervision
    // ------------------------------------------------------------------------

    void supervise(const std::shared_ptr<job_run>& run) {
        auto loaded = store->get_job(run->id);
        if (!loaded) {
            SM_LOG_ERROR(log_category::coordinator,
                "Supervisor cannot load job " + run->id.to_string() + ": " +
                    loaded.error().message);
            finish(run);
            return;
        }

        if (!loaded.value().manifest_complete && !enumerate_scope(*run, loaded.value())) {
            finish(run);
            return;
        }

        const auto estimate = config.assumed_throughput_bytes_per_second;
        auto started = tracker->transition(run->id, [this, estimate](migration_job& j) {
            if (j.status != job_status::pending && j.status != job_status::in_progress) {
                return;
            }
            j.status = job_status::in_progress;
            if (!j.started_at) {
                j.started_at = now();
            }
            if (!j.estimated_completion_at) {
                auto remaining = j.total_bytes - std::min(j.total_bytes, j.migrated_bytes);
                j.estimated_completion_at =
                    now() + std::chrono::seconds(static_cast<int64_t>(remaining / estimate));
            }
            j.owner_id = owner;
            j.heartbeat_at = now();
        });
        if (!started) {
            SM_LOG_ERROR(log_category::coordinator,
                "Cannot start job " + run->id.to_string() + ": " + started.error().message);
            fail_job(run->id, job_error(started.error()));
            finish(run);
            return;
        }
        if (started.value().status != job_status::in_progress) {
            SM_LOG_INFO(log_category::coordinator,
                "Job " + run->id.to_string() + " became " + to_string(started.value().status) +
                    " before its workers started");
            finish(run);
            return;
        }

        run_workers(*run, started.value());
        settle(*run);
        finish(run);
    }

    /**
     * @brief Build the manifest of a pending job
     * @return true when workers may be launched
     */
    auto enumerate_scope(job_run& run, const migration_job& job) -> bool {
        scope_calculator calculator({config.list_page_size,
                                     config.assumed_throughput_bytes_per_second});
        auto scope = calculator.build_manifest(*run.source, *store, run.id,
                                               job.options.filter_prefix, &run.token);
        if (scope) {
            migration_log_context ctx;
            ctx.job_id = run.id.to_string();
            ctx.workspace_id = run.workspace_id;
            ctx.size_bytes = scope.value().total_bytes;
            SM_LOG_INFO_CTX(log_category::coordinator,
                "Scope of " + std::to_string(scope.value().file_count) + " file(s), about " +
                    scope.value().formatted_duration,
                ctx);
            return true;
        }

        const auto& err = scope.error();
        const auto reason = run.token.reason();
        if (err.code == error_code::operation_cancelled && reason == stop_reason::cancel) {
            auto cancelled = tracker->transition(run.id, [](migration_job& j) {
                j.status = job_status::cancelled;
                j.completed_at = now();
            });
            if (!cancelled) {
                SM_LOG_ERROR(log_category::coordinator,
                    "Cannot cancel job " + run.id.to_string() + ": " +
                        cancelled.error().message);
            }
            return false;
        }
        if (err.code == error_code::operation_cancelled) {
            auto released = store->update_job(run.id, [](migration_job& j) {
                j.owner_id.clear();
                j.heartbeat_at.reset();
            });
            if (!released) {
                SM_LOG_WARN(log_category::coordinator,
                    "Cannot release job " + run.id.to_string() + ": " + released.error().message);
            }
            SM_LOG_INFO(log_category::coordinator,
                "Scope enumeration of job " + run.id.to_string() + " interrupted by " +
                    to_string(reason));
            return false;
        }

        SM_LOG_ERROR(log_category::coordinator,
            "Scope enumeration of job " + run.id.to_string() + " failed: " + err.message);
        fail_job(run.id, job_error(err));
        return false;
    }

    void run_workers(job_run& run, const migration_job& job) {
        const auto concurrency = std::max<std::size_t>(1, job.options.concurrency);
        const auto stage = "copy:" + run.id.to_string();

        copy_context ctx;
        ctx.id = run.id;
        ctx.workspace_id = run.workspace_id;
        ctx.source = run.source.get();
        ctx.target = run.target.get();
        ctx.store = store.get();
        ctx.tracker = tracker.get();
        ctx.token = &run.token;
        ctx.settings = copy_settings::from(job.options, config);

        tracker->begin_run(run.id);
        auto pool = adapters::migration_pool_factory::create(concurrency, stage);

        std::atomic<uint64_t> processed{0};
        std::vector<std::future<void>> workers;
        workers.reserve(concurrency);
        for (std::size_t i = 0; i < concurrency; ++i) {
            workers.push_back(pool->submit([&ctx, &processed] {
                copy_worker worker(ctx);
                processed += worker.run();
            }));
        }

        SM_LOG_INFO(log_category::coordinator,
            "Job " + run.id.to_string() + " running with " + std::to_string(concurrency) +
                " worker(s)");

        for (auto& worker : workers) {
            while (worker.wait_for(config.heartbeat_interval) != std::future_status::ready) {
                heartbeat(run);
            }
            try {
                worker.get();
            } catch (const std::exception& e) {
                SM_LOG_ERROR(log_category::coordinator,
                    "Worker of job " + run.id.to_string() + " terminated: " + e.what());
                auto entry = job_error(error{error_code::internal_error, e.what()});
                auto recorded = tracker->transition(run.id, [&entry](migration_job& j) {
                    if (!j.fatal_error) {
                        j.fatal_error = entry;
                    }
                });
                if (!recorded) {
                    SM_LOG_ERROR(log_category::coordinator,
                        "Cannot record worker failure: " + recorded.error().message);
                }
                run.token.request(stop_reason::abort);
            }
        }

        pool->shutdown();
        tracker->end_run(run.id);
        SM_LOG_DEBUG(log_category::coordinator,
            "Workers of job " + run.id.to_string() + " stopped after " +
                std::to_string(processed.load()) + " file(s)");
    }

    /**
     * @brief Decide the status once all workers have stopped
     *
     * Precedence: fatal error or threshold, cancel, pause, shutdown,
     * then completion.
     */
    void settle(job_run& run) {
        auto current = store->get_job(run.id);
        if (!current) {
            SM_LOG_ERROR(log_category::coordinator,
                "Cannot settle job " + run.id.to_string() + ": " + current.error().message);
            return;
        }
        const auto& job = current.value();
        const auto reason = run.token.reason();
        const auto settled_at = now();

        job_mutator mutator;
        if (job.fatal_error || reason == stop_reason::abort) {
            mutator = [settled_at](migration_job& j) {
                j.status = job_status::failed;
                j.completed_at = settled_at;
                if (!j.fatal_error) {
                    j.fatal_error = job_error(error{error_code::job_aborted, "job aborted"});
                }
            };
        } else if (reason == stop_reason::cancel) {
            mutator = [settled_at](migration_job& j) {
                j.status = job_status::cancelled;
                j.completed_at = settled_at;
            };
        } else if (reason == stop_reason::pause) {
            mutator = [](migration_job& j) {
                j.status = job_status::paused;
                j.estimated_completion_at.reset();
            };
        } else if (reason == stop_reason::shutdown) {
            mutator = [](migration_job& j) {
                j.owner_id.clear();
                j.heartbeat_at.reset();
            };
        } else if (job.migrated_files + job.failed_files >= job.total_files) {
            mutator = [settled_at](migration_job& j) {
                j.status = job_status::completed;
                j.completed_at = settled_at;
                j.estimated_completion_at = settled_at;
            };
        } else {
            const auto unfinished = job.total_files - job.migrated_files - job.failed_files;
            mutator = [settled_at, unfinished](migration_job& j) {
                j.status = job_status::failed;
                j.completed_at = settled_at;
                if (!j.fatal_error) {
                    j.fatal_error = job_error(error{error_code::internal_error,
                        "workers stopped with " + std::to_string(unfinished) +
                            " unfinished file(s)"});
                }
            };
        }

        auto settled = tracker->transition(run.id, mutator);
        if (!settled) {
            SM_LOG_ERROR(log_category::coordinator,
                "Cannot settle job " + run.id.to_string() + ": " + settled.error().message);
            return;
        }

        const auto& final_job = settled.value();
        migration_log_context ctx;
        ctx.job_id = run.id.to_string();
        ctx.workspace_id = run.workspace_id;
        ctx.size_bytes = final_job.total_bytes;
        ctx.bytes_migrated = final_job.migrated_bytes;
        ctx.progress_percent = final_job.progress_percent();
        if (final_job.started_at) {
            ctx.duration_ms = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(settled_at -
                                                                      *final_job.started_at)
                    .count());
        }
        if (final_job.fatal_error) {
            ctx.error_message = final_job.fatal_error->message;
        }
        SM_LOG_INFO_CTX(log_category::coordinator,
            std::string("Job ") + to_string(final_job.status) + ": " +
                std::to_string(final_job.migrated_files) + " migrated, " +
                std::to_string(final_job.failed_files) + " failed of " +
                std::to_string(final_job.total_files),
            ctx);
    }

    void shutdown() {
        std::unordered_map<job_id, std::shared_ptr<job_run>> stopping;
        {
            std::lock_guard lock(mutex);
            shutting_down = true;
            for (auto& [id, run] : runs) {
                if (!run->finished) {
                    run->token.request(stop_reason::shutdown);
                }
            }
            stopping.swap(runs);
        }

        for (auto& [id, run] : stopping) {
            if (run->supervisor.joinable()) {
                run->supervisor.join();
            }
        }
        if (!stopping.empty()) {
            SM_LOG_INFO(log_category::coordinator,
                "Coordinator " + owner + " stopped " + std::to_string(stopping.size()) +
                    " supervisor(s)");
        }
        cv.notify_all();
    }
};

// ============================================================================
// Builder
// ============================================================================

migration_coordinator::builder::builder() = default;

auto migration_coordinator::builder::with_config(engine_config config) -> builder& {
    config_ = std::move(config);
    has_config_ = true;
    return *this;
}

auto migration_coordinator::builder::with_backend_registry(
    std::shared_ptr<backend_registry> registry) -> builder& {
    registry_ = std::move(registry);
    return *this;
}

auto migration_coordinator::builder::with_owner_id(std::string owner_id) -> builder& {
    owner_id_ = std::move(owner_id);
    return *this;
}

auto migration_coordinator::builder::build() -> result<migration_coordinator> {
    if (!has_config_) {
        return unexpected(error{error_code::invalid_configuration,
                                "engine configuration is required"});
    }
    auto valid = config_.validate();
    if (!valid) {
        return unexpected(valid.error());
    }

    get_logger().initialize();

    std::shared_ptr<const config_cipher> cipher;
    if (config_.encryption_key_base64) {
        auto created = config_cipher::from_base64(*config_.encryption_key_base64);
        if (!created) {
            return unexpected(created.error());
        }
        cipher = std::move(created.value());
    }

    job_store_options store_options;
    store_options.state_directory = config_.state_directory;
    store_options.checkpoint_interval = config_.checkpoint_interval;
    store_options.max_error_entries = config_.max_error_entries;
    store_options.cipher = cipher;
    auto store = job_store::open(std::move(store_options));
    if (!store) {
        return unexpected(store.error());
    }

    auto configs = workspace_config_store::open(config_.state_directory, cipher);
    if (!configs) {
        return unexpected(configs.error());
    }

    migration_coordinator coordinator;
    auto& state = *coordinator.impl_;
    state.config = config_;
    state.owner = owner_id_.empty() ? "coordinator-" + job_id::generate().to_string() : owner_id_;
    state.registry = registry_ ? registry_ : std::make_shared<backend_registry>();
    state.cipher = std::move(cipher);
    state.store = std::move(store.value());
    state.configs = std::move(configs.value());
    state.tracker = std::make_unique<progress_tracker>(*state.store);
    state.cutover = std::make_unique<cutover_manager>(*state.store, *state.configs);

    SM_LOG_INFO(log_category::coordinator,
        "Coordinator " + state.owner + " opened " + config_.state_directory.string() +
            (state.cipher ? " (sealed configs)" : ""));
    return coordinator;
}

// ============================================================================
// Coordinator
// ============================================================================

migration_coordinator::migration_coordinator() : impl_(std::make_unique<impl>()) {}

migration_coordinator::migration_coordinator(migration_coordinator&&) noexcept = default;
auto migration_coordinator::operator=(migration_coordinator&&) noexcept
    -> migration_coordinator& = default;

migration_coordinator::~migration_coordinator() = default;

auto migration_coordinator::set_workspace_storage(const std::string& workspace_id,
                                                  const std::string& provider,
                                                  const storage_config& config)
    -> result<workspace_storage_config> {
    if (!impl_->registry->has_provider(provider)) {
        return unexpected(error{error_code::unknown_provider, "unknown provider: " + provider});
    }
    if (auto active = impl_->store->find_active_job(workspace_id)) {
        return unexpected(error{error_code::job_already_active,
                                "workspace " + workspace_id + " is being migrated by job " +
                                    active->id.to_string()});
    }
    return impl_->configs->put(workspace_id, provider, config);
}

auto migration_coordinator::workspace_storage(const std::string& workspace_id) const
    -> result<workspace_storage_config> {
    return impl_->configs->get(workspace_id);
}

auto migration_coordinator::calculate_scope(const std::string& workspace_id,
                                            const std::string& prefix)
    -> result<migration_scope> {
    auto active = impl_->configs->get(workspace_id);
    if (!active) {
        return unexpected(active.error());
    }
    auto source = impl_->open_backend(active.value().provider, active.value().config);
    if (!source) {
        return unexpected(source.error());
    }

    scope_calculator calculator({impl_->config.list_page_size,
                                 impl_->config.assumed_throughput_bytes_per_second});
    return calculator.calculate(*source.value(), prefix);
}

auto migration_coordinator::start_migration(const start_request& request) -> result<job_id> {
    auto valid = job_store::validate_workspace_id(request.workspace_id);
    if (!valid) {
        return unexpected(valid.error());
    }
    auto options = request.options.value_or(impl_->config.default_options);
    auto options_valid = options.validate();
    if (!options_valid) {
        return unexpected(options_valid.error());
    }

    if (auto active = impl_->store->find_active_job(request.workspace_id)) {
        return unexpected(error{error_code::job_already_active,
                                "workspace " + request.workspace_id + " already has job " +
                                    active->id.to_string() + " " + to_string(active->status)});
    }

    auto source_config = impl_->configs->get(request.workspace_id);
    if (!source_config) {
        if (source_config.error().code == error_code::object_not_found) {
            return unexpected(error{error_code::invalid_argument,
                                    source_config.error().message});
        }
        return unexpected(source_config.error());
    }
    const auto& active = source_config.value();
    if (active.fingerprint ==
        workspace_config_store::fingerprint(request.target_provider, request.target_config)) {
        return unexpected(error{error_code::invalid_argument,
                                "target is already the active storage of " +
                                    request.workspace_id});
    }

    auto source = impl_->open_backend(active.provider, active.config);
    if (!source) {
        return unexpected(source.error());
    }
    auto target = impl_->open_backend(request.target_provider, request.target_config);
    if (!target) {
        return unexpected(target.error());
    }

    new_job_request job_request;
    job_request.workspace_id = request.workspace_id;
    job_request.source_provider = active.provider;
    job_request.source_config = active.config;
    job_request.target_provider = request.target_provider;
    job_request.target_config = request.target_config;
    job_request.options = options;
    job_request.owner_id = impl_->owner;

    auto job = impl_->store->create_job(job_request);
    if (!job) {
        return unexpected(job.error());
    }

    migration_log_context ctx;
    ctx.job_id = job.value().id.to_string();
    ctx.workspace_id = request.workspace_id;
    ctx.provider = request.target_provider;
    SM_LOG_INFO_CTX(log_category::coordinator,
        "Migration " + active.provider + " -> " + request.target_provider + " " +
            redact_config(request.target_config) + " created",
        ctx);

    auto run = impl_->reserve(job.value().id);
    if (!run) {
        impl_->fail_job(job.value().id, job_error(run.error()));
        return unexpected(run.error());
    }
    auto launched = impl_->start_run(run.value(), job.value(), std::move(source.value()),
                                     std::move(target.value()));
    if (!launched) {
        impl_->fail_job(job.value().id, job_error(launched.error()));
        impl_->abandon(run.value());
        return unexpected(launched.error());
    }
    return job.value().id;
}

auto migration_coordinator::get_progress(const job_id& id) const -> result<migration_job> {
    return impl_->store->get_job(id);
}

auto migration_coordinator::cancel_migration(const job_id& id) -> result<void> {
    auto job = impl_->store->get_job(id);
    if (!job) {
        return unexpected(job.error());
    }

    {
        std::lock_guard lock(impl_->mutex);
        impl_->reap_locked();
        if (auto run = impl_->live_run_locked(id)) {
            run->token.request(stop_reason::cancel);
            SM_LOG_INFO(log_category::coordinator,
                "Cancellation of job " + id.to_string() + " requested");
            return {};
        }
    }

    if (job.value().status == job_status::cancelled) {
        return {};
    }
    if (!is_active(job.value().status)) {
        return unexpected(error{error_code::invalid_job_state,
                                std::string("job is already ") + to_string(job.value().status)});
    }

    auto cancelled = impl_->tracker->transition(id, [](migration_job& j) {
        if (is_active(j.status)) {
            j.status = job_status::cancelled;
            j.completed_at = now();
            j.owner_id.clear();
        }
    });
    if (!cancelled) {
        return unexpected(cancelled.error());
    }
    impl_->cv.notify_all();
    SM_LOG_INFO(log_category::coordinator, "Job " + id.to_string() + " cancelled");
    return {};
}

auto migration_coordinator::pause_migration(const job_id& id) -> result<void> {
    auto job = impl_->store->get_job(id);
    if (!job) {
        return unexpected(job.error());
    }
    if (job.value().status != job_status::in_progress) {
        return unexpected(error{error_code::invalid_job_state,
                                std::string("cannot pause a job that is ") +
                                    to_string(job.value().status)});
    }

    std::lock_guard lock(impl_->mutex);
    impl_->reap_locked();
    auto run = impl_->live_run_locked(id);
    if (!run) {
        return unexpected(error{error_code::invalid_job_state,
                                "job " + id.to_string() + " is not supervised here"});
    }
    run->token.request(stop_reason::pause);
    SM_LOG_INFO(log_category::coordinator, "Pause of job " + id.to_string() + " requested");
    return {};
}

auto migration_coordinator::resume_migration(const job_id& id, bool reset_failed)
    -> result<void> {
    if (auto known = impl_->store->get_job(id); !known) {
        return unexpected(known.error());
    }

    // Holding the slot keeps a concurrent resume or recovery off this job
    // until the supervisor owns it.
    auto reserved = impl_->reserve(id);
    if (!reserved) {
        return unexpected(reserved.error());
    }
    const auto run = reserved.value();
    auto give_up = [this, &run](error err) -> result<void> {
        impl_->abandon(run);
        return unexpected(std::move(err));
    };

    auto job = impl_->store->get_job(id);
    if (!job) {
        return give_up(job.error());
    }
    const auto& snapshot = job.value();
    if (!snapshot.can_resume()) {
        return give_up(error{error_code::not_resumable,
                             "job " + id.to_string() + " is " + to_string(snapshot.status) +
                                 (snapshot.manifest_complete ? "" : " without a manifest")});
    }

    auto source = impl_->open_backend(snapshot.source_provider, snapshot.source_config);
    if (!source) {
        return give_up(source.error());
    }
    auto target = impl_->open_backend(snapshot.target_provider, snapshot.target_config);
    if (!target) {
        return give_up(target.error());
    }

    if (reset_failed) {
        auto reset = impl_->store->reset_failed_records(id);
        if (!reset) {
            return give_up(reset.error());
        }
    }

    const auto& owner = impl_->owner;
    auto resumed = impl_->tracker->transition(id, [&owner](migration_job& j) {
        if (!j.can_resume()) {
            return;
        }
        j.status = job_status::in_progress;
        j.fatal_error.reset();
        j.completed_at.reset();
        j.estimated_completion_at.reset();
        j.owner_id = owner;
        j.heartbeat_at = now();
    });
    if (!resumed) {
        return give_up(resumed.error());
    }
    if (resumed.value().status != job_status::in_progress ||
        resumed.value().owner_id != owner) {
        return give_up(error{error_code::not_resumable,
                             "job " + id.to_string() + " became " +
                                 to_string(resumed.value().status)});
    }

    SM_LOG_INFO(log_category::coordinator,
        "Resuming job " + id.to_string() + " at " + std::to_string(resumed.value().migrated_files) +
            "/" + std::to_string(resumed.value().total_files) + " file(s)");

    auto launched = impl_->start_run(run, resumed.value(), std::move(source.value()),
                                     std::move(target.value()));
    if (!launched) {
        // Still reserved: no other run of this coordinator can own the job.
        auto released = impl_->store->update_job(id, [&owner](migration_job& j) {
            if (j.status == job_status::in_progress && j.owner_id == owner) {
                j.status = job_status::paused;
                j.owner_id.clear();
                j.heartbeat_at.reset();
            }
        });
        if (!released) {
            SM_LOG_WARN(log_category::coordinator,
                "Cannot return job " + id.to_string() + " to paused: " +
                    released.error().message);
        }
        return give_up(launched.error());
    }
    return {};
}

auto migration_coordinator::complete_migration(const cutover_request& request)
    -> result<cutover_result> {
    return impl_->cutover->complete_migration(request);
}

auto migration_coordinator::discard_job(const job_id& id) -> result<void> {
    {
        std::lock_guard lock(impl_->mutex);
        impl_->reap_locked();
        if (impl_->live_run_locked(id)) {
            return unexpected(error{error_code::invalid_job_state,
                                    "job " + id.to_string() + " is still running"});
        }
    }
    return impl_->store->discard_job(id);
}

auto migration_coordinator::list_jobs(const std::string& workspace_id) const
    -> std::vector<migration_job> {
    return impl_->store->list_jobs(workspace_id);
}

auto migration_coordinator::recover_jobs() -> result<std::size_t> {
    std::size_t recovered = 0;

    for (const auto& listed : impl_->store->list_all_jobs()) {
        if (listed.status != job_status::pending && listed.status != job_status::in_progress) {
            continue;
        }
        auto reserved = impl_->reserve(listed.id);
        if (!reserved) {
            if (reserved.error().code == error_code::operation_cancelled) {
                return unexpected(reserved.error());
            }
            continue;
        }
        const auto run = reserved.value();

        // Re-read under the reservation; the listing may be stale.
        auto fresh = impl_->store->get_job(listed.id);
        if (!fresh) {
            impl_->abandon(run);
            continue;
        }
        const auto job = fresh.value();
        if (job.status != job_status::pending && job.status != job_status::in_progress) {
            impl_->abandon(run);
            continue;
        }
        if (!impl_->is_orphaned(job)) {
            SM_LOG_DEBUG(log_category::coordinator,
                "Job " + job.id.to_string() + " is still owned by " + job.owner_id);
            impl_->abandon(run);
            continue;
        }

        if (job.status == job_status::pending && !job.manifest_complete) {
            auto reset = impl_->store->reset_manifest(job.id);
            if (!reset) {
                SM_LOG_ERROR(log_category::coordinator,
                    "Cannot restart scope of job " + job.id.to_string() + ": " +
                        reset.error().message);
                impl_->abandon(run);
                continue;
            }
        }

        auto source = impl_->open_backend(job.source_provider, job.source_config);
        auto target = source ? impl_->open_backend(job.target_provider, job.target_config)
                             : result<std::unique_ptr<storage_backend>>(
                                   unexpected(source.error()));
        if (!source || !target) {
            const auto& err = !source ? source.error() : target.error();
            SM_LOG_ERROR(log_category::coordinator,
                "Cannot recover job " + job.id.to_string() + ": " + err.message);
            impl_->fail_job(job.id, job_error(err));
            impl_->abandon(run);
            continue;
        }

        const auto& owner = impl_->owner;
        const auto previous_owner = job.owner_id;
        auto claimed = impl_->store->update_job(job.id, [&](migration_job& j) {
            if (j.owner_id != previous_owner) {
                return;
            }
            j.owner_id = owner;
            j.heartbeat_at = now();
        });
        if (!claimed || claimed.value().owner_id != owner) {
            SM_LOG_ERROR(log_category::coordinator,
                "Cannot take over job " + job.id.to_string() + ": " +
                    (claimed ? "owner changed to " + claimed.value().owner_id
                             : claimed.error().message));
            impl_->abandon(run);
            continue;
        }

        auto launched = impl_->start_run(run, claimed.value(), std::move(source.value()),
                                         std::move(target.value()));
        if (!launched) {
            SM_LOG_WARN(log_category::coordinator,
                "Cannot relaunch job " + job.id.to_string() + ": " + launched.error().message);
            impl_->abandon(run);
            continue;
        }

        SM_LOG_INFO(log_category::coordinator,
            "Recovered " + std::string(to_string(job.status)) + " job " + job.id.to_string() +
                " of workspace " + job.workspace_id);
        ++recovered;
    }
    return recovered;
}

auto migration_coordinator::wait_for_terminal(const job_id& id,
                                              std::chrono::milliseconds timeout)
    -> result<migration_job> {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock lock(impl_->mutex);
    while (true) {
        auto job = impl_->store->get_job(id);
        if (!job) {
            return job;
        }
        const auto status = job.value().status;
        const bool running = impl_->live_run_locked(id) != nullptr;
        if (!running && status != job_status::pending && status != job_status::in_progress) {
            return job;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return unexpected(error{error_code::operation_cancelled,
                                    "timed out waiting for job " + id.to_string()});
        }
        impl_->cv.wait_until(lock, deadline);
    }
}

void migration_coordinator::on_progress(progress_listener listener) {
    impl_->tracker->set_listener(std::move(listener));
}

auto migration_coordinator::throughput(const job_id& id) const
    -> std::optional<throughput_snapshot> {
    return impl_->tracker->throughput(id);
}

void migration_coordinator::shutdown() {
    if (impl_) {
        impl_->shutdown();
    }
}

auto migration_coordinator::owner_id() const -> const std::string& {
    return impl_->owner;
}

auto migration_coordinator::registry() const -> backend_registry& {
    return *impl_->registry;
}

auto migration_coordinator::config() const -> const engine_config& {
    return impl_->config;
}

}  // namespace kcenon::storage_migration
