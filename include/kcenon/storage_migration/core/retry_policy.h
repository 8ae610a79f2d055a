/**
 * @file retry_policy.h
 * @brief Per-file retry policy with exponential backoff
 */

#ifndef KCENON_STORAGE_MIGRATION_CORE_RETRY_POLICY_H
#define KCENON_STORAGE_MIGRATION_CORE_RETRY_POLICY_H

#include <chrono>
#include <cstddef>

namespace kcenon::storage_migration {

/**
 * @brief Retry policy for per-file copy attempts
 *
 * The delay before attempt n (n >= 2) is
 * initial_delay * backoff_multiplier^(n - 2), capped at max_delay.
 */
struct retry_policy {
    /// Maximum number of attempts per file (first attempt included)
    std::size_t max_attempts = 3;

    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{1000};

    /// Maximum delay between retries
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Scale delays by a random factor in [0.5, 1.5)
    bool use_jitter = false;

    /**
     * @brief Delay to wait before the given attempt
     * @param attempt 1-based attempt number about to start
     * @return Zero for the first attempt
     */
    [[nodiscard]] auto delay_for(std::size_t attempt) const -> std::chrono::milliseconds;

    /**
     * @brief Check whether another attempt is allowed after @p attempts_made
     */
    [[nodiscard]] auto allows_another(std::size_t attempts_made) const noexcept -> bool {
        return attempts_made < max_attempts;
    }

    /**
     * @brief Policy without delays, for tests and tooling
     */
    [[nodiscard]] static auto immediate(std::size_t attempts) -> retry_policy {
        retry_policy policy;
        policy.max_attempts = attempts;
        policy.initial_delay = std::chrono::milliseconds{0};
        policy.max_delay = std::chrono::milliseconds{0};
        return policy;
    }
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_CORE_RETRY_POLICY_H
