/**
 * @file retry_policy.cpp
 * @brief Backoff delay calculation
 */

#include <kcenon/storage_migration/core/retry_policy.h>

#include <algorithm>
#include <random>

namespace kcenon::storage_migration {

auto retry_policy::delay_for(std::size_t attempt) const -> std::chrono::milliseconds {
    if (attempt <= 1) {
        return std::chrono::milliseconds{0};
    }

    auto delay = static_cast<double>(initial_delay.count());
    for (std::size_t i = 2; i < attempt; ++i) {
        delay *= backoff_multiplier;
        if (delay >= static_cast<double>(max_delay.count())) {
            break;
        }
    }

    delay = std::min(delay, static_cast<double>(max_delay.count()));

    if (use_jitter) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace kcenon::storage_migration
