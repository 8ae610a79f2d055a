/**
 * @file cancellation_token.h
 * @brief Cooperative stop signal shared between a job supervisor and its workers
 */

#ifndef KCENON_STORAGE_MIGRATION_CORE_CANCELLATION_TOKEN_H
#define KCENON_STORAGE_MIGRATION_CORE_CANCELLATION_TOKEN_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace kcenon::storage_migration {

/**
 * @brief Why workers were asked to stop, in increasing priority
 */
enum class stop_reason : int {
    none = 0,
    shutdown = 1,  ///< Process is going away; job stays in_progress for recovery
    pause = 2,     ///< Operational backpressure; job becomes paused
    cancel = 3,    ///< Operator cancellation; job becomes cancelled
    abort = 4      ///< Fatal error or failure threshold; job becomes failed
};

[[nodiscard]] constexpr auto to_string(stop_reason reason) -> const char* {
    switch (reason) {
        case stop_reason::none: return "none";
        case stop_reason::shutdown: return "shutdown";
        case stop_reason::pause: return "pause";
        case stop_reason::cancel: return "cancel";
        case stop_reason::abort: return "abort";
        default: return "unknown";
    }
}

/**
 * @brief Cancellation token checked by workers between files
 *
 * Workers poll stop_requested() before claiming a record and after each
 * file completes; it is never consulted while bytes are streaming.
 * A later request only replaces the reason when it has higher priority.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    void request(stop_reason reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto current = reason_.load();
            if (static_cast<int>(reason) > static_cast<int>(current)) {
                reason_.store(reason);
            }
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto stop_requested() const noexcept -> bool {
        return reason_.load() != stop_reason::none;
    }

    [[nodiscard]] auto reason() const noexcept -> stop_reason {
        return reason_.load();
    }

    /**
     * @brief Sleep for @p duration unless a stop is requested first
     * @return true if a stop was requested
     */
    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> duration) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return stop_requested(); });
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        reason_.store(stop_reason::none);
    }

private:
    std::atomic<stop_reason> reason_{stop_reason::none};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_CORE_CANCELLATION_TOKEN_H
