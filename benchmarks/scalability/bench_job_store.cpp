/**
 * @file bench_job_store.cpp
 * @brief Cost of the per-file bookkeeping in the job store
 */

#include <benchmark/benchmark.h>

#include <kcenon/storage_migration/migration/job_store.h>

#include "utils/benchmark_helpers.h"

#include <vector>

namespace kcenon::storage_migration::benchmark {

namespace {

auto make_manifest(std::size_t count) -> std::vector<storage_object> {
    std::vector<storage_object> manifest;
    manifest.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        manifest.push_back({"dir-" + std::to_string(i % 64) + "/object-" + std::to_string(i),
                            4096});
    }
    return manifest;
}

}  // namespace

/**
 * @brief claim_next + commit_record for every record of a job
 *
 * range(0): manifest size, range(1): checkpoint interval
 */
static void BM_JobStore_ClaimCommit(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto manifest = make_manifest(count);

    temp_object_tree tree("job_store");

    job_store_options options;
    options.state_directory = tree.path();
    options.checkpoint_interval = static_cast<std::size_t>(state.range(1));
    auto opened = job_store::open(options);
    if (!opened) {
        state.SkipWithError(opened.error().message.c_str());
        return;
    }
    auto& store = *opened.value();

    std::size_t iteration = 0;
    for (auto _ : state) {
        state.PauseTiming();
        new_job_request request;
        request.workspace_id = "bench-" + std::to_string(iteration++);
        request.source_provider = "local";
        request.target_provider = "local";
        auto job = store.create_job(request);
        if (!job ||
            !store.append_manifest(job.value().id, manifest) ||
            !store.finalize_manifest(job.value().id) ||
            !store.update_job(job.value().id, [](migration_job& j) {
                j.status = job_status::in_progress;
            })) {
            state.SkipWithError("job setup failed");
            return;
        }
        const auto id = job.value().id;
        state.ResumeTiming();

        while (true) {
            auto claimed = store.claim_next(id);
            if (!claimed) {
                state.SkipWithError(claimed.error().message.c_str());
                return;
            }
            if (!claimed.value()) {
                break;
            }
            auto record = *claimed.value();
            record.status = file_status::verified;
            record.attempts = 1;
            auto committed = store.commit_record(id, record);
            if (!committed) {
                state.SkipWithError(committed.error().message.c_str());
                return;
            }
        }

        state.PauseTiming();
        auto finished = store.update_job(id, [](migration_job& j) {
            j.status = job_status::completed;
        });
        ::benchmark::DoNotOptimize(finished);
        state.ResumeTiming();
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Reopening a store replays every job journal
 */
static void BM_JobStore_Reopen(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto manifest = make_manifest(count);

    temp_object_tree tree("job_store_reopen");

    job_store_options options;
    options.state_directory = tree.path();
    {
        auto opened = job_store::open(options);
        if (!opened) {
            state.SkipWithError(opened.error().message.c_str());
            return;
        }
        auto& store = *opened.value();
        new_job_request request;
        request.workspace_id = "bench";
        request.source_provider = "local";
        request.target_provider = "local";
        auto job = store.create_job(request);
        if (!job || !store.append_manifest(job.value().id, manifest) ||
            !store.finalize_manifest(job.value().id)) {
            state.SkipWithError("job setup failed");
            return;
        }
    }

    for (auto _ : state) {
        auto reopened = job_store::open(options);
        if (!reopened) {
            state.SkipWithError(reopened.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(reopened.value()->list_all_jobs());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_JobStore_ClaimCommit)
    ->Args({1000, 1})
    ->Args({1000, 10})
    ->Args({10000, 100})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_JobStore_Reopen)
    ->Arg(1000)
    ->Arg(10000)
    ->Arg(100000)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::storage_migration::benchmark
