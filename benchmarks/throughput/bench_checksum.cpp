/**
 * @file bench_checksum.cpp
 * @brief Benchmarks for one-shot and streaming SHA-256
 */

#include <benchmark/benchmark.h>

#include <kcenon/storage_migration/core/checksum.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <span>

namespace kcenon::storage_migration::benchmark {

static void BM_Checksum_SHA256(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(size, 42);

    for (auto _ : state) {
        auto hash = checksum::sha256(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(hash);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Streaming digest fed in copy-buffer sized blocks
 */
static void BM_Checksum_Streaming(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const auto block = static_cast<std::size_t>(state.range(1));
    auto data = generate_random_data(size, 42);

    streaming_checksum hasher;
    for (auto _ : state) {
        for (std::size_t offset = 0; offset < size; offset += block) {
            auto len = std::min(block, size - offset);
            hasher.update(std::span<const std::byte>(data.data() + offset, len));
        }
        auto hash = hasher.finalize();
        ::benchmark::DoNotOptimize(hash);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Checksum_SHA256)
    ->Arg(static_cast<int64_t>(sizes::small_object))
    ->Arg(static_cast<int64_t>(sizes::medium_object))
    ->Arg(static_cast<int64_t>(sizes::large_object))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_Streaming)
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(64 * sizes::KB)})
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(256 * sizes::KB)})
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(1 * sizes::MB)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::storage_migration::benchmark
