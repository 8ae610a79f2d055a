/**
 * @file engine_config.cpp
 * @brief Engine configuration validation and builder
 */

#include "kcenon/storage_migration/config/engine_config.h"

#include "kcenon/storage_migration/security/config_cipher.h"

namespace kcenon::storage_migration {

namespace {

auto invalid(const std::string& message) -> unexpected {
    return unexpected(error{error_code::invalid_configuration, message});
}

}  // namespace

auto engine_config::validate() const -> result<void> {
    if (state_directory.empty()) {
        return invalid("state_directory must be set");
    }

    auto options = default_options.validate();
    if (!options) {
        return invalid("default options: " + options.error().message);
    }

    if (retry.backoff_multiplier < 1.0) {
        return invalid("retry backoff_multiplier must be >= 1.0");
    }
    if (retry.max_delay < retry.initial_delay) {
        return invalid("retry max_delay must be >= initial_delay");
    }
    if (assumed_throughput_bytes_per_second == 0) {
        return invalid("assumed throughput must be positive");
    }
    if (list_page_size == 0) {
        return invalid("list_page_size must be positive");
    }
    if (stream_buffer_size < 4096) {
        return invalid("stream_buffer_size must be at least 4 KiB");
    }
    if (max_error_entries == 0) {
        return invalid("max_error_entries must be positive");
    }
    if (checkpoint_interval == 0) {
        return invalid("checkpoint_interval must be positive");
    }
    if (heartbeat_interval.count() <= 0 || owner_lease <= heartbeat_interval) {
        return invalid("owner_lease must exceed a positive heartbeat_interval");
    }

    if (encryption_key_base64) {
        auto cipher = config_cipher::from_base64(*encryption_key_base64);
        if (!cipher) {
            return invalid(cipher.error().message);
        }
    }
    return {};
}

auto engine_config_builder::with_state_directory(std::filesystem::path dir)
    -> engine_config_builder& {
    config_.state_directory = std::move(dir);
    return *this;
}

auto engine_config_builder::with_default_options(const migration_options& options)
    -> engine_config_builder& {
    config_.default_options = options;
    return *this;
}

auto engine_config_builder::with_concurrency(std::size_t workers) -> engine_config_builder& {
    config_.default_options.concurrency = workers;
    return *this;
}

auto engine_config_builder::with_retry_policy(const retry_policy& policy)
    -> engine_config_builder& {
    config_.retry = policy;
    return *this;
}

auto engine_config_builder::with_assumed_throughput(uint64_t bytes_per_second)
    -> engine_config_builder& {
    config_.assumed_throughput_bytes_per_second = bytes_per_second;
    return *this;
}

auto engine_config_builder::with_list_page_size(std::size_t entries) -> engine_config_builder& {
    config_.list_page_size = entries;
    return *this;
}

auto engine_config_builder::with_stream_buffer_size(std::size_t bytes)
    -> engine_config_builder& {
    config_.stream_buffer_size = bytes;
    return *this;
}

auto engine_config_builder::with_max_error_entries(std::size_t entries)
    -> engine_config_builder& {
    config_.max_error_entries = entries;
    return *this;
}

auto engine_config_builder::with_checkpoint_interval(std::size_t updates)
    -> engine_config_builder& {
    config_.checkpoint_interval = updates;
    return *this;
}

auto engine_config_builder::with_owner_lease(std::chrono::milliseconds lease)
    -> engine_config_builder& {
    config_.owner_lease = lease;
    return *this;
}

auto engine_config_builder::with_heartbeat_interval(std::chrono::milliseconds interval)
    -> engine_config_builder& {
    config_.heartbeat_interval = interval;
    return *this;
}

auto engine_config_builder::with_unverified_checksums(unverified_checksum_mode mode)
    -> engine_config_builder& {
    config_.checksum_when_unverified = mode;
    return *this;
}

auto engine_config_builder::with_encryption_key(std::string base64_key)
    -> engine_config_builder& {
    config_.encryption_key_base64 = std::move(base64_key);
    return *this;
}

auto engine_config_builder::build() const -> result<engine_config> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected(valid.error());
    }
    return config_;
}

}  // namespace kcenon::storage_migration
