/**
 * @file scope_calculator.cpp
 * @brief Scope calculator implementation
 */

#include "kcenon/storage_migration/migration/scope_calculator.h"

#include "kcenon/storage_migration/core/logging.h"
#include "kcenon/storage_migration/migration/job_store.h"

#include <cmath>
#include <cstdio>

namespace kcenon::storage_migration {

scope_calculator::scope_calculator(settings config) : settings_(config) {
    if (settings_.page_size == 0) {
        settings_.page_size = 1000;
    }
    if (settings_.assumed_throughput_bytes_per_second == 0) {
        settings_.assumed_throughput_bytes_per_second = 1024 * 1024;
    }
}

template <typename PageSink>
auto scope_calculator::enumerate(storage_backend& source, const std::string& prefix,
                                 const cancellation_token* token, PageSink&& sink) const
    -> result<migration_scope> {
    list_storage_options options;
    options.prefix = prefix;
    options.max_results = settings_.page_size;

    uint64_t file_count = 0;
    uint64_t total_bytes = 0;
    std::size_t pages = 0;

    while (true) {
        if (token && token->stop_requested()) {
            return unexpected(error{error_code::operation_cancelled,
                                    "scope enumeration interrupted"});
        }

        auto page = source.list(options);
        if (!page) {
            return unexpected(page.error());
        }
        ++pages;

        auto& listing = page.value();
        auto consumed = sink(listing.objects);
        if (!consumed) {
            return unexpected(consumed.error());
        }
        for (const auto& object : listing.objects) {
            ++file_count;
            total_bytes += object.size;
        }

        if (!listing.is_truncated || !listing.continuation_token) {
            break;
        }
        options.continuation_token = std::move(listing.continuation_token);
    }

    SM_LOG_DEBUG(log_category::scope,
        "Enumerated " + std::to_string(file_count) + " object(s) in " +
            std::to_string(pages) + " page(s) from " + std::string(source.name()));
    return summarize(file_count, total_bytes);
}

auto scope_calculator::calculate(storage_backend& source, const std::string& prefix,
                                 const cancellation_token* token) const
    -> result<migration_scope> {
    return enumerate(source, prefix, token,
                     [](const std::vector<storage_object>&) -> result<void> { return {}; });
}

auto scope_calculator::build_manifest(storage_backend& source, job_store& store,
                                      const job_id& id, const std::string& prefix,
                                      const cancellation_token* token) const
    -> result<migration_scope> {
    auto scope = enumerate(source, prefix, token,
        [&store, &id](const std::vector<storage_object>& objects) -> result<void> {
            return store.append_manifest(id, objects);
        });
    if (!scope) {
        return scope;
    }

    auto finalized = store.finalize_manifest(id);
    if (!finalized) {
        return unexpected(finalized.error());
    }

    SM_LOG_INFO(log_category::scope,
        "Manifest of job " + id.to_string() + ": " + std::to_string(scope.value().file_count) +
            " files, " + scope.value().formatted_size);
    return scope;
}

auto scope_calculator::summarize(uint64_t file_count, uint64_t total_bytes) const
    -> migration_scope {
    migration_scope scope;
    scope.file_count = file_count;
    scope.total_bytes = total_bytes;

    double seconds = static_cast<double>(total_bytes) /
                     static_cast<double>(settings_.assumed_throughput_bytes_per_second);
    scope.estimated_duration = std::chrono::seconds(static_cast<int64_t>(std::llround(seconds)));
    scope.formatted_size = format_size(total_bytes);
    scope.formatted_duration = format_duration(seconds);
    return scope;
}

auto scope_calculator::format_size(uint64_t bytes) -> std::string {
    constexpr double kib = 1024.0;
    constexpr double mib = kib * 1024.0;
    constexpr double gib = mib * 1024.0;
    constexpr double tib = gib * 1024.0;

    const auto value = static_cast<double>(bytes);
    char buffer[64];
    if (value < kib) {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    } else if (value < mib) {
        std::snprintf(buffer, sizeof(buffer), "%.1f KB", value / kib);
    } else if (value < gib) {
        std::snprintf(buffer, sizeof(buffer), "%.1f MB", value / mib);
    } else if (value < tib) {
        std::snprintf(buffer, sizeof(buffer), "%.1f GB", value / gib);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f TB", value / tib);
    }
    return buffer;
}

auto scope_calculator::format_duration(double seconds) -> std::string {
    char buffer[64];
    if (seconds < 60.0) {
        std::snprintf(buffer, sizeof(buffer), "%lld seconds",
                      static_cast<long long>(std::llround(seconds)));
    } else if (seconds < 3600.0) {
        std::snprintf(buffer, sizeof(buffer), "%lld minutes",
                      static_cast<long long>(std::llround(seconds / 60.0)));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f hours", seconds / 3600.0);
    }
    return buffer;
}

}  // namespace kcenon::storage_migration
