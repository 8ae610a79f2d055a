/**
 * @file bench_copy_throughput.cpp
 * @brief End-to-end migration throughput between two local directories
 */

#include <benchmark/benchmark.h>

#include <kcenon/storage_migration/storage_migration.h>

#include "utils/benchmark_helpers.h"

#include <chrono>

namespace kcenon::storage_migration::benchmark {

/**
 * @brief Full job: scope enumeration, copy, verification and bookkeeping
 *
 * range(0): object count, range(1): object size, range(2): worker count
 */
static void BM_Migration_LocalToLocal(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto size = static_cast<std::size_t>(state.range(1));
    const auto workers = static_cast<std::size_t>(state.range(2));

    temp_object_tree tree("copy");
    tree.populate("source", count, size);

    auto config = engine_config_builder()
        .with_state_directory(tree.sub("state"))
        .with_concurrency(workers)
        .build();
    if (!config) {
        state.SkipWithError(config.error().message.c_str());
        return;
    }
    auto coordinator = migration_coordinator::builder().with_config(config.value()).build();
    if (!coordinator) {
        state.SkipWithError(coordinator.error().message.c_str());
        return;
    }
    auto& engine = coordinator.value();

    std::size_t iteration = 0;
    for (auto _ : state) {
        state.PauseTiming();
        tree.clear("target");
        const auto workspace = "bench-" + std::to_string(iteration++);
        auto set = engine.set_workspace_storage(workspace, "local",
                                                {{"root", tree.sub("source").string()}});
        state.ResumeTiming();

        if (!set) {
            state.SkipWithError(set.error().message.c_str());
            return;
        }

        auto id = engine.start_migration(
            {workspace, "local", {{"root", tree.sub("target").string()}}, std::nullopt});
        if (!id) {
            state.SkipWithError(id.error().message.c_str());
            return;
        }

        auto job = engine.wait_for_terminal(id.value(), std::chrono::minutes(10));
        if (!job || job.value().status != job_status::completed) {
            state.SkipWithError("migration did not complete");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(count * size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Migration_LocalToLocal)
    ->Args({1000, static_cast<int64_t>(sizes::small_object), 1})
    ->Args({1000, static_cast<int64_t>(sizes::small_object), 5})
    ->Args({100, static_cast<int64_t>(sizes::medium_object), 5})
    ->Args({16, static_cast<int64_t>(sizes::large_object), 5})
    ->Args({16, static_cast<int64_t>(sizes::large_object), 16})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime()
    ->Iterations(3);

}  // namespace kcenon::storage_migration::benchmark
