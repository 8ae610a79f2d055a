// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"
#include "json_utils.h"

#if STORAGE_MIGRATION_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::storage_migration {

/**
 * @brief Log categories for the migration engine
 */
struct log_category {
    static constexpr std::string_view coordinator = "storage_migration.coordinator";
    static constexpr std::string_view worker = "storage_migration.worker";
    static constexpr std::string_view job_store = "storage_migration.job_store";
    static constexpr std::string_view scope = "storage_migration.scope";
    static constexpr std::string_view cutover = "storage_migration.cutover";
    static constexpr std::string_view storage = "storage_migration.storage";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
    }
    return "UNKNOWN";
}

namespace detail {

inline auto format_fixed(double value) -> std::string {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

inline auto format_time(std::chrono::system_clock::time_point tp, bool utc) -> std::string {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    utc ? gmtime_s(&tm_buf, &seconds) : localtime_s(&tm_buf, &seconds);
#else
    utc ? gmtime_r(&seconds, &tm_buf) : localtime_r(&seconds, &tm_buf);
#endif

    char date[32];
    std::strftime(date, sizeof(date), utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S", &tm_buf);
    char full[48];
    std::snprintf(full, sizeof(full), "%s.%03d%s", date, static_cast<int>(ms), utc ? "Z" : "");
    return full;
}

}  // namespace detail

// ============================================================================
// Masking
// ============================================================================

/**
 * @brief What sensitive_info_masker hides
 */
struct masking_config {
    /// Hide the directory part of object paths
    bool mask_paths = false;

    /// Hide all but the last octet of IPv4 endpoints
    bool mask_ips = false;

    char mask_char = '*';

    static masking_config all_masked() { return {true, true, '*'}; }
    static masking_config none() { return {false, false, '*'}; }
};

/**
 * @brief Replace every value of a storage configuration with a mask
 *
 * Storage configurations carry credentials (access keys, connection
 * strings, service account JSON). Keys are kept so operators can still
 * see which settings were supplied.
 */
[[nodiscard]] inline auto redact_config(const std::map<std::string, std::string>& config)
    -> std::string {
    std::string out = "{";
    for (const auto& [key, value] : config) {
        if (out.size() > 1) {
            out += ',';
        }
        out += key + "=" + (value.empty() ? "" : "****");
    }
    return out + "}";
}

/**
 * @brief Masks object paths and endpoint addresses in log output
 *
 * Free text is scanned word by word: words shaped like an IPv4 address or
 * an absolute path are masked, everything else is left untouched.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths && !config_.mask_ips) {
            return input;
        }

        std::string out;
        out.reserve(input.size());
        std::size_t pos = 0;
        while (pos < input.size()) {
            auto end = input.find_first_of(" \t\n,;()[]\"'", pos);
            if (end == pos) {
                out += input[pos++];
                continue;
            }
            if (end == std::string::npos) {
                end = input.size();
            }
            out += mask_word(input.substr(pos, end - pos));
            pos = end;
        }
        return out;
    }

    /**
     * @brief Keep the last path segment, mask the directories before it
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last = path.find_last_of("/\\");
        if (last == std::string::npos) {
            return path;
        }
        return std::string(last, config_.mask_char) + "/" + path.substr(last + 1);
    }

    [[nodiscard]] auto mask_ip(const std::string& ip) const -> std::string {
        if (!config_.mask_ips || ip.empty()) {
            return ip;
        }
        auto last_dot = ip.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(ip.size(), config_.mask_char);
        }
        return std::string(last_dot, config_.mask_char) + ip.substr(last_dot);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    [[nodiscard]] auto mask_word(const std::string& word) const -> std::string {
        if (config_.mask_ips) {
            auto colon = word.find(':');
            auto host = word.substr(0, colon);
            if (is_ipv4(host)) {
                return mask_ip(host) + (colon == std::string::npos ? "" : word.substr(colon));
            }
        }
        if (config_.mask_paths && word.size() > 1 && word.front() == '/') {
            return mask_path(word);
        }
        return word;
    }

    static auto is_ipv4(std::string_view text) -> bool {
        int octets = 0;
        std::size_t digits = 0;
        for (char c : text) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                if (++digits > 3) {
                    return false;
                }
            } else if (c == '.' && digits > 0) {
                ++octets;
                digits = 0;
            } else {
                return false;
            }
        }
        return octets == 3 && digits > 0;
    }

    masking_config config_;
};

// ============================================================================
// Structured records
// ============================================================================

/**
 * @brief Structured fields attached to a log line
 */
struct migration_log_context {
    std::string job_id;
    std::string workspace_id;
    std::string path;
    std::optional<std::string> provider;
    std::optional<uint64_t> size_bytes;
    std::optional<uint64_t> bytes_migrated;
    std::optional<uint32_t> attempt;
    std::optional<double> progress_percent;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        json::object_writer w;
        append_to(w, masker);
        return w.str();
    }

    void append_to(json::object_writer& w, const sensitive_info_masker* masker) const {
        if (!job_id.empty()) w.add("job_id", job_id);
        if (!workspace_id.empty()) w.add("workspace_id", workspace_id);
        if (!path.empty()) w.add("path", masker ? masker->mask_path(path) : path);
        if (provider) w.add("provider", *provider);
        if (size_bytes) w.add("size", *size_bytes);
        if (bytes_migrated) w.add("bytes_migrated", *bytes_migrated);
        if (attempt) w.add("attempt", static_cast<uint64_t>(*attempt));
        if (progress_percent) w.add_raw("progress_percent", detail::format_fixed(*progress_percent));
        if (rate_mbps) w.add_raw("rate_mbps", detail::format_fixed(*rate_mbps));
        if (duration_ms) w.add("duration_ms", *duration_ms);
        if (error_message) {
            w.add("error_message", masker ? masker->mask(*error_message) : *error_message);
        }
    }
};

/**
 * @brief One emitted log line, as handed to JSON callbacks
 */
struct log_record {
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now();
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<migration_log_context> context;

    /// ISO-8601 UTC with milliseconds
    [[nodiscard]] auto timestamp() const -> std::string { return detail::format_time(time, true); }

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        json::object_writer w;
        w.add("timestamp", timestamp())
            .add("level", log_level_to_string(level))
            .add("category", category)
            .add("message", masker ? masker->mask(message) : message);
        if (context) {
            context->append_to(w, masker);
        }
        return w.str();
    }
};

// ============================================================================
// Logger
// ============================================================================

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the migration engine
 *
 * Routes to kcenon logger_system when built with it, otherwise writes
 * to stderr. Callbacks see every enabled message before it is written.
 */
class migration_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const migration_log_context*)>;
    using json_log_callback = std::function<void(const log_record&, const std::string&)>;

    migration_logger() = default;

    migration_logger(const migration_logger&) = delete;
    migration_logger& operator=(const migration_logger&) = delete;

    /**
     * @brief Start the backend; repeated calls are no-ops
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if STORAGE_MIGRATION_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();
        if (built) {
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if STORAGE_MIGRATION_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if STORAGE_MIGRATION_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void enable_json_output(bool enable = true) {
        std::lock_guard lock(mutex_);
        format_ = enable ? log_output_format::json : log_output_format::text;
    }

    void enable_masking(bool enable = true) {
        std::lock_guard lock(mutex_);
        masker_.set_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    void set_masking_config(masking_config config) {
        std::lock_guard lock(mutex_);
        masker_.set_config(config);
    }

    void set_callback(log_callback callback) {
        std::lock_guard lock(mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard lock(mutex_);
        json_callback_ = std::move(callback);
    }

    void log(log_level level, std::string_view category, std::string_view message,
             const migration_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr, [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) {
            return;
        }

        log_callback callback;
        json_log_callback json_callback;
        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard lock(mutex_);
            callback = callback_;
            json_callback = json_callback_;
            format = format_;
            masker = masker_;
        }

        if (callback) {
            callback(level, category, message, context);
        }

        std::string line_text;
        if (format == log_output_format::json) {
            log_record record;
            record.level = level;
            record.category = std::string(category);
            record.message = std::string(message);
            if (context) {
                record.context = *context;
            }
            line_text = record.to_json(&masker);
            if (json_callback) {
                json_callback(record, line_text);
            }
        } else {
            line_text = "[" + std::string(category) + "] " + masker.mask(std::string(message));
            if (context) {
                line_text += " " + context->to_json(&masker);
            }
        }

#if STORAGE_MIGRATION_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            line_text = detail::format_time(std::chrono::system_clock::now(), false) + " [" +
                        std::string(log_level_to_string(level)) + "] " + line_text;
        }
        write_stderr(line_text);
    }

    void flush() {
#if STORAGE_MIGRATION_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void write_stderr(const std::string& text) {
        static std::mutex stderr_mutex;
        std::lock_guard lock(stderr_mutex);
        std::cerr << text << "\n";
    }

#if STORAGE_MIGRATION_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
        }
        return kcenon::logger::log_level::info;
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    std::mutex mutex_;
    log_callback callback_;
    json_log_callback json_callback_;
    log_output_format format_{log_output_format::text};
    sensitive_info_masker masker_;
};

inline migration_logger& get_logger() {
    static migration_logger instance;
    return instance;
}

#define SM_LOG(level, category, message) \
    kcenon::storage_migration::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define SM_LOG_CTX(level, category, message, context) \
    kcenon::storage_migration::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define SM_LOG_TRACE(category, message) \
    SM_LOG(kcenon::storage_migration::log_level::trace, category, message)

#define SM_LOG_DEBUG(category, message) \
    SM_LOG(kcenon::storage_migration::log_level::debug, category, message)

#define SM_LOG_INFO(category, message) \
    SM_LOG(kcenon::storage_migration::log_level::info, category, message)

#define SM_LOG_WARN(category, message) \
    SM_LOG(kcenon::storage_migration::log_level::warn, category, message)

#define SM_LOG_ERROR(category, message) \
    SM_LOG(kcenon::storage_migration::log_level::error, category, message)

#define SM_LOG_FATAL(category, message) \
    SM_LOG(kcenon::storage_migration::log_level::fatal, category, message)

#define SM_LOG_DEBUG_CTX(category, message, ctx) \
    SM_LOG_CTX(kcenon::storage_migration::log_level::debug, category, message, ctx)

#define SM_LOG_INFO_CTX(category, message, ctx) \
    SM_LOG_CTX(kcenon::storage_migration::log_level::info, category, message, ctx)

#define SM_LOG_WARN_CTX(category, message, ctx) \
    SM_LOG_CTX(kcenon::storage_migration::log_level::warn, category, message, ctx)

#define SM_LOG_ERROR_CTX(category, message, ctx) \
    SM_LOG_CTX(kcenon::storage_migration::log_level::error, category, message, ctx)

}  // namespace kcenon::storage_migration
