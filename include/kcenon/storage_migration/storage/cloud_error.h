/**
 * @file cloud_error.h
 * @brief Failure vocabulary of cloud object-store clients (-800 to -899)
 *
 * Clients report failures with make_cloud_error(), which folds the cloud
 * code into the migration error_code space so the copy pipeline classifies
 * provider failures like any other backend failure.
 */

#ifndef KCENON_STORAGE_MIGRATION_STORAGE_CLOUD_ERROR_H
#define KCENON_STORAGE_MIGRATION_STORAGE_CLOUD_ERROR_H

#include <cstdint>
#include <string>
#include <string_view>

#include "kcenon/storage_migration/core/types.h"

namespace kcenon::storage_migration {

/**
 * @brief Provider failure codes
 *
 * The tens digit names the family: -80x credentials, -81x permissions,
 * -82x network, -83x bucket, -84x object, -85x transfer, -86x quota,
 * -88x configuration, -89x client state.
 */
enum class cloud_error_code : int32_t {
    success = 0,

    auth_failed = -800,
    auth_expired = -801,
    auth_invalid_credentials = -802,

    access_denied = -810,
    permission_denied = -811,

    connection_failed = -820,
    connection_timeout = -821,
    network_error = -822,
    connection_reset = -825,
    service_unavailable = -826,
    rate_limited = -827,

    bucket_not_found = -830,
    bucket_access_denied = -834,
    bucket_quota_exceeded = -835,

    object_not_found = -840,
    invalid_object_key = -842,
    checksum_mismatch = -845,

    upload_failed = -850,
    download_failed = -851,
    transfer_timeout = -857,

    storage_quota_exceeded = -860,
    request_limit_exceeded = -862,

    config_invalid = -880,
    config_missing_endpoint = -881,
    config_missing_bucket = -883,

    not_initialized = -891,
};

/**
 * @brief Family of a cloud code, i.e. its tens digit (0 for -80x)
 */
[[nodiscard]] constexpr auto family_of(cloud_error_code code) noexcept -> int {
    const auto value = -static_cast<int32_t>(code);
    return value < 800 || value > 899 ? -1 : (value - 800) / 10;
}

[[nodiscard]] constexpr auto to_string(cloud_error_code code) noexcept -> std::string_view {
    using c = cloud_error_code;
    switch (code) {
        case c::success:                  return "success";
        case c::auth_failed:              return "authentication failed";
        case c::auth_expired:             return "authentication token expired";
        case c::auth_invalid_credentials: return "invalid credentials provided";
        case c::access_denied:            return "access denied to resource";
        case c::permission_denied:        return "permission denied for operation";
        case c::connection_failed:        return "failed to connect to cloud provider";
        case c::connection_timeout:       return "connection timeout";
        case c::network_error:            return "network error occurred";
        case c::connection_reset:         return "connection reset by peer";
        case c::service_unavailable:      return "cloud service temporarily unavailable";
        case c::rate_limited:             return "request rate limited";
        case c::bucket_not_found:         return "bucket/container not found";
        case c::bucket_access_denied:     return "access denied to bucket/container";
        case c::bucket_quota_exceeded:    return "bucket quota exceeded";
        case c::object_not_found:         return "object/blob not found";
        case c::invalid_object_key:       return "invalid object key/path";
        case c::checksum_mismatch:        return "checksum verification failed";
        case c::upload_failed:            return "upload operation failed";
        case c::download_failed:          return "download operation failed";
        case c::transfer_timeout:         return "transfer operation timeout";
        case c::storage_quota_exceeded:   return "storage quota exceeded";
        case c::request_limit_exceeded:   return "request limit exceeded";
        case c::config_invalid:           return "invalid configuration";
        case c::config_missing_endpoint:  return "missing endpoint configuration";
        case c::config_missing_bucket:    return "missing bucket configuration";
        case c::not_initialized:          return "cloud storage not initialized";
    }
    return "unknown cloud error";
}

/**
 * @brief Translate a cloud code into the migration error space
 *
 * An expired token is retried like any transient failure. Every other
 * credential or permission failure is fatal for the job.
 */
[[nodiscard]] constexpr auto to_error_code(cloud_error_code code) noexcept -> error_code {
    using c = cloud_error_code;
    switch (code) {
        case c::success:                return error_code::success;
        case c::auth_expired:           return error_code::transient_io;
        case c::connection_timeout:
        case c::transfer_timeout:       return error_code::connection_timeout;
        case c::service_unavailable:    return error_code::service_unavailable;
        case c::rate_limited:
        case c::request_limit_exceeded: return error_code::throttled;
        case c::bucket_access_denied:   return error_code::authorization_failed;
        case c::bucket_quota_exceeded:  return error_code::quota_exceeded;
        case c::object_not_found:       return error_code::object_not_found;
        case c::invalid_object_key:     return error_code::invalid_object_key;
        case c::checksum_mismatch:      return error_code::checksum_mismatch;
        case c::upload_failed:          return error_code::storage_write_failed;
        case c::download_failed:        return error_code::storage_read_failed;
        case c::not_initialized:        return error_code::not_initialized;
        default:                        break;
    }

    switch (family_of(code)) {
        case 0: return error_code::authentication_failed;
        case 1: return error_code::authorization_failed;
        case 2: return error_code::connection_failed;
        case 3:
        case 8: return error_code::invalid_configuration;
        case 6: return error_code::quota_exceeded;
        default: return error_code::internal_error;
    }
}

[[nodiscard]] inline auto make_cloud_error(cloud_error_code code, const std::string& detail = {})
    -> error {
    std::string message(to_string(code));
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return error{to_error_code(code), std::move(message)};
}

}  // namespace kcenon::storage_migration

#endif  // KCENON_STORAGE_MIGRATION_STORAGE_CLOUD_ERROR_H
