/**
 * @file types.h
 * @brief Core type definitions for storage_migration
 */

#ifndef KCENON_STORAGE_MIGRATION_CORE_TYPES_H
#define KCENON_STORAGE_MIGRATION_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::storage_migration {

/**
 * @brief Error codes for storage migration operations
 *
 * Error code ranges:
 * - -100 to -119: Storage I/O errors
 * - -120 to -139: Integrity errors
 * - -140 to -159: Access errors
 * - -160 to -179: Capacity errors
 * - -180 to -199: Object errors
 * - -200 to -219: Job errors
 * - -220 to -239: Configuration errors
 * - -240 to -259: Persistence errors
 * - -260 to -279: Internal errors
 */
enum class error_code {
    success = 0,

    // Storage I/O errors (-100 to -119)
    transient_io = -100,
    connection_failed = -101,
    connection_timeout = -102,
    throttled = -103,
    storage_read_failed = -104,
    storage_write_failed = -105,
    service_unavailable = -106,

    // Integrity errors (-120 to -139)
    checksum_mismatch = -120,
    size_mismatch = -121,

    // Access errors (-140 to -159)
    authentication_failed = -140,
    authorization_failed = -141,

    // Capacity errors (-160 to -179)
    quota_exceeded = -160,
    storage_full = -161,

    // Object errors (-180 to -199)
    object_not_found = -180,
    invalid_object_key = -181,

    // Job errors (-200 to -219)
    job_not_found = -200,
    job_already_active = -201,
    not_resumable = -202,
    invalid_job_state = -203,
    job_aborted = -204,

    // Configuration errors (-220 to -239)
    invalid_configuration = -220,
    invalid_argument = -221,
    unknown_provider = -222,
    encryption_failed = -223,
    decryption_failed = -224,

    // Persistence errors (-240 to -259)
    state_write_failed = -240,
    state_read_failed = -241,
    state_corrupted = -242,

    // Internal errors (-260 to -279)
    internal_error = -260,
    not_initialized = -261,
    operation_cancelled = -262,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::transient_io:
            return "transient I/O error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::throttled:
            return "request throttled";
        case error_code::storage_read_failed:
            return "storage read failed";
        case error_code::storage_write_failed:
            return "storage write failed";
        case error_code::service_unavailable:
            return "service unavailable";
        case error_code::checksum_mismatch:
            return "checksum mismatch";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::authorization_failed:
            return "authorization failed";
        case error_code::quota_exceeded:
            return "quota exceeded";
        case error_code::storage_full:
            return "storage full";
        case error_code::object_not_found:
            return "object not found";
        case error_code::invalid_object_key:
            return "invalid object key";
        case error_code::job_not_found:
            return "job not found";
        case error_code::job_already_active:
            return "job already active";
        case error_code::not_resumable:
            return "job not resumable";
        case error_code::invalid_job_state:
            return "invalid job state";
        case error_code::job_aborted:
            return "job aborted";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::unknown_provider:
            return "unknown storage provider";
        case error_code::encryption_failed:
            return "encryption failed";
        case error_code::decryption_failed:
            return "decryption failed";
        case error_code::state_write_failed:
            return "state write failed";
        case error_code::state_read_failed:
            return "state read failed";
        case error_code::state_corrupted:
            return "state corrupted";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::operation_cancelled:
            return "operation cancelled";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_CORE_TYPES_H
