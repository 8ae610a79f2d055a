/**
 * @file error_codes.h
 * @brief Migration error taxonomy and classification of error codes
 *
 * Every failure observed by the copy pipeline is reduced to an error_kind,
 * which decides whether the file is retried, counted as a soft failure,
 * or aborts the whole job.
 */

#ifndef KCENON_STORAGE_MIGRATION_CORE_ERROR_CODES_H
#define KCENON_STORAGE_MIGRATION_CORE_ERROR_CODES_H

#include <optional>
#include <string_view>

#include "types.h"

namespace kcenon::storage_migration {

/**
 * @brief Migration error taxonomy
 */
enum class error_kind {
    transient_io,        ///< Network blip, throttling, timeout; retried
    checksum_mismatch,   ///< Integrity failure; retried like transient
    authorization,       ///< Bad credentials against source or target; fatal
    quota_exceeded,      ///< Target rejects writes; fatal
    object_not_found,    ///< Source object vanished after the snapshot; fail-soft
    job_already_active,  ///< Caller-correctness signal on startMigration
    not_resumable,       ///< Resume of a job whose state cannot be resumed
    invalid_request,     ///< Malformed arguments or configuration
    internal             ///< Persistence or programming error
};

/**
 * @brief Convert error_kind to its taxonomy name
 */
[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case error_kind::transient_io: return "TransientIOError";
        case error_kind::checksum_mismatch: return "ChecksumMismatchError";
        case error_kind::authorization: return "AuthorizationError";
        case error_kind::quota_exceeded: return "QuotaExceededError";
        case error_kind::object_not_found: return "ObjectNotFoundError";
        case error_kind::job_already_active: return "JobAlreadyActiveError";
        case error_kind::not_resumable: return "NotResumableError";
        case error_kind::invalid_request: return "InvalidRequestError";
        case error_kind::internal: return "InternalError";
        default: return "InternalError";
    }
}

/**
 * @brief Parse a taxonomy name produced by to_string(error_kind)
 */
[[nodiscard]] constexpr auto error_kind_from_string(std::string_view name) noexcept
    -> std::optional<error_kind> {
    if (name == "TransientIOError") return error_kind::transient_io;
    if (name == "ChecksumMismatchError") return error_kind::checksum_mismatch;
    if (name == "AuthorizationError") return error_kind::authorization;
    if (name == "QuotaExceededError") return error_kind::quota_exceeded;
    if (name == "ObjectNotFoundError") return error_kind::object_not_found;
    if (name == "JobAlreadyActiveError") return error_kind::job_already_active;
    if (name == "NotResumableError") return error_kind::not_resumable;
    if (name == "InvalidRequestError") return error_kind::invalid_request;
    if (name == "InternalError") return error_kind::internal;
    return std::nullopt;
}

/**
 * @brief Check if error code is in storage I/O error range
 */
[[nodiscard]] constexpr auto is_storage_io_error(int code) noexcept -> bool {
    return code <= -100 && code >= -119;
}

/**
 * @brief Check if error code is in integrity error range
 */
[[nodiscard]] constexpr auto is_integrity_error(int code) noexcept -> bool {
    return code <= -120 && code >= -139;
}

/**
 * @brief Check if error code is in access error range
 */
[[nodiscard]] constexpr auto is_access_error(int code) noexcept -> bool {
    return code <= -140 && code >= -159;
}

/**
 * @brief Check if error code is in capacity error range
 */
[[nodiscard]] constexpr auto is_capacity_error(int code) noexcept -> bool {
    return code <= -160 && code >= -179;
}

/**
 * @brief Check if error code is in job error range
 */
[[nodiscard]] constexpr auto is_job_error(int code) noexcept -> bool {
    return code <= -200 && code >= -219;
}

/**
 * @brief Map an error code onto the migration taxonomy
 *
 * Storage failures that carry no more specific code are treated as
 * transient so that they go through the normal retry policy.
 */
[[nodiscard]] constexpr auto kind_of(error_code code) noexcept -> error_kind {
    const auto value = static_cast<int>(code);
    if (is_storage_io_error(value)) {
        return error_kind::transient_io;
    }
    if (is_integrity_error(value)) {
        return error_kind::checksum_mismatch;
    }
    if (is_access_error(value)) {
        return error_kind::authorization;
    }
    if (is_capacity_error(value)) {
        return error_kind::quota_exceeded;
    }
    switch (code) {
        case error_code::object_not_found:
            return error_kind::object_not_found;
        case error_code::invalid_object_key:
        case error_code::invalid_configuration:
        case error_code::invalid_argument:
        case error_code::unknown_provider:
        case error_code::job_not_found:
        case error_code::invalid_job_state:
            return error_kind::invalid_request;
        case error_code::job_already_active:
            return error_kind::job_already_active;
        case error_code::not_resumable:
            return error_kind::not_resumable;
        default:
            return error_kind::internal;
    }
}

/**
 * @brief Check if a failure of this kind is retried under the retry policy
 */
[[nodiscard]] constexpr auto is_retryable(error_kind kind) noexcept -> bool {
    return kind == error_kind::transient_io ||
           kind == error_kind::checksum_mismatch;
}

/**
 * @brief Check if a failure of this kind aborts the whole job
 */
[[nodiscard]] constexpr auto is_fatal(error_kind kind) noexcept -> bool {
    return kind == error_kind::authorization ||
           kind == error_kind::quota_exceeded;
}

/**
 * @brief Check if a failure of this kind is counted per file without retry
 */
[[nodiscard]] constexpr auto is_fail_soft(error_kind kind) noexcept -> bool {
    return kind == error_kind::object_not_found ||
           kind == error_kind::invalid_request;
}

[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return is_retryable(kind_of(code));
}

[[nodiscard]] constexpr auto is_fatal(error_code code) noexcept -> bool {
    return is_fatal(kind_of(code));
}

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_CORE_ERROR_CODES_H
