/**
 * @file copy_worker.cpp
 * @brief Implementation of the copy/verify worker
 */

#include "kcenon/storage_migration/migration/copy_worker.h"

#include "kcenon/storage_migration/core/checksum.h"
#include "kcenon/storage_migration/core/error_codes.h"
#include "kcenon/storage_migration/core/logging.h"
#include "kcenon/storage_migration/migration/job_store.h"
#include "kcenon/storage_migration/migration/progress_tracker.h"

#include <span>

namespace kcenon::storage_migration {

auto copy_settings::from(const migration_options& options, const engine_config& config)
    -> copy_settings {
    copy_settings settings;
    settings.retry = config.retry;
    settings.retry.max_attempts = options.max_attempts;
    settings.max_attempts = options.max_attempts;
    settings.buffer_size = config.stream_buffer_size;
    settings.verify_integrity = options.verify_integrity;
    settings.unverified_mode = config.checksum_when_unverified;
    settings.continue_on_error = options.continue_on_error;
    settings.abort_threshold = options.abort_threshold;
    return settings;
}

copy_worker::copy_worker(const copy_context& context)
    : ctx_(context), buffer_(context.settings.buffer_size) {}

auto copy_worker::run() -> uint64_t {
    uint64_t processed = 0;

    while (!ctx_.token->stop_requested()) {
        auto claimed = ctx_.store->claim_next(ctx_.id);
        if (!claimed) {
            if (claimed.error().code != error_code::invalid_job_state) {
                migration_error_entry entry;
                entry.kind = error_kind::internal;
                entry.message = claimed.error().message;
                entry.timestamp = std::chrono::system_clock::now();
                raise_fatal(entry, "cannot claim records");
            } else {
                SM_LOG_DEBUG(log_category::worker,
                    "Worker of job " + ctx_.id.to_string() + " stops: " +
                        claimed.error().message);
            }
            break;
        }
        if (!claimed.value()) {
            break;
        }

        auto outcome = process(std::move(*claimed.value()));
        if (outcome == file_outcome::terminal) {
            ++processed;
        } else if (outcome == file_outcome::stop) {
            break;
        }
    }
    return processed;
}

auto copy_worker::process(file_migration_record record) -> file_outcome {
    const auto& settings = ctx_.settings;

    for (std::size_t attempt = 1;; ++attempt) {
        if (attempt > 1) {
            // Backoff is a safe point: nothing is being written.
            if (ctx_.token->wait_for(settings.retry.delay_for(attempt))) {
                auto released = ctx_.store->release_record(ctx_.id, record.path);
                if (!released) {
                    SM_LOG_WARN(log_category::worker,
                        "Cannot release " + record.path + ": " + released.error().message);
                }
                return file_outcome::released;
            }
        }

        auto copied = copy_once(record);
        record.attempts += 1;

        if (copied) {
            record.status = file_status::verified;
            record.source_checksum = copied.value().source_checksum;
            record.target_checksum = copied.value().target_checksum;
            record.last_error.clear();

            auto committed = ctx_.tracker->record_result(ctx_.id, record);
            if (!committed) {
                auto entry = make_entry(record, committed.error(), attempt);
                auto released = ctx_.store->release_record(ctx_.id, record.path);
                if (!released) {
                    SM_LOG_WARN(log_category::worker,
                        "Cannot release " + record.path + ": " + released.error().message);
                }
                raise_fatal(entry, "cannot persist result");
                return file_outcome::stop;
            }

            migration_log_context log_ctx;
            log_ctx.job_id = ctx_.id.to_string();
            log_ctx.workspace_id = ctx_.workspace_id;
            log_ctx.path = record.path;
            log_ctx.size_bytes = record.size_bytes;
            log_ctx.attempt = static_cast<uint32_t>(attempt);
            log_ctx.progress_percent = committed.value().progress_percent();
            SM_LOG_DEBUG_CTX(log_category::worker, "Object verified", log_ctx);
            return file_outcome::terminal;
        }

        const auto& err = copied.error();
        const auto kind = kind_of(err.code);
        record.last_error = err.message;

        if (is_fatal(kind)) {
            auto entry = make_entry(record, err, attempt);
            auto released = ctx_.store->release_record(ctx_.id, record.path);
            if (!released) {
                SM_LOG_WARN(log_category::worker,
                    "Cannot release " + record.path + ": " + released.error().message);
            }
            auto logged = ctx_.tracker->record_error(ctx_.id, entry);
            if (!logged) {
                SM_LOG_WARN(log_category::worker,
                    "Cannot record error for " + record.path + ": " + logged.error().message);
            }
            raise_fatal(entry, std::string(to_string(kind)) + " on " + record.path);
            return file_outcome::stop;
        }

        if (is_retryable(kind) && attempt < settings.max_attempts) {
            migration_log_context log_ctx;
            log_ctx.job_id = ctx_.id.to_string();
            log_ctx.path = record.path;
            log_ctx.attempt = static_cast<uint32_t>(attempt);
            log_ctx.error_message = err.message;
            SM_LOG_WARN_CTX(log_category::worker, "Copy attempt failed, retrying", log_ctx);
            continue;
        }

        report_failure(record, err, attempt);
        return ctx_.token->reason() == stop_reason::abort ? file_outcome::stop
                                                          : file_outcome::terminal;
    }
}

auto copy_worker::copy_once(const file_migration_record& record) -> result<copy_attempt> {
    const auto& settings = ctx_.settings;

    auto reader = ctx_.source->open_read(record.path);
    if (!reader) {
        return unexpected(reader.error());
    }
    auto writer = ctx_.target->open_write(record.path, record.size_bytes);
    if (!writer) {
        return unexpected(writer.error());
    }

    auto& source = *reader.value();
    auto& target = *writer.value();

    auto fail = [&target, &record](error err) -> result<copy_attempt> {
        auto aborted = target.abort();
        if (!aborted) {
            SM_LOG_WARN(log_category::worker,
                "Abort of partial write " + record.path + " failed: " + aborted.error().message);
        }
        return unexpected(std::move(err));
    };

    const bool hashing = settings.computes_checksums();
    streaming_checksum hasher;
    uint64_t copied = 0;

    while (true) {
        auto n = source.read(std::span<std::byte>(buffer_));
        if (!n) {
            return fail(n.error());
        }
        if (n.value() == 0) {
            break;
        }

        std::span<const std::byte> block(buffer_.data(), n.value());
        if (hashing) {
            hasher.update(block);
        }
        auto written = target.write(block);
        if (!written) {
            return fail(written.error());
        }
        copied += n.value();
    }

    if (copied != record.size_bytes) {
        return fail(error{error_code::size_mismatch,
                          record.path + ": read " + std::to_string(copied) +
                              " bytes, manifest has " + std::to_string(record.size_bytes)});
    }

    copy_attempt attempt;
    attempt.bytes_copied = copied;
    if (hashing) {
        attempt.source_checksum = hasher.finalize();
        auto stored = source.checksum();
        if (settings.verify_integrity && stored && !stored->empty() &&
            *stored != attempt.source_checksum) {
            return fail(error{error_code::checksum_mismatch,
                              record.path + ": source bytes do not match stored checksum"});
        }
    }

    auto finalized = target.finalize();
    if (!finalized) {
        return fail(finalized.error());
    }
    if (finalized.value().bytes_written != copied) {
        return unexpected(error{error_code::size_mismatch,
                                record.path + ": target persisted " +
                                    std::to_string(finalized.value().bytes_written) +
                                    " of " + std::to_string(copied) + " bytes"});
    }

    if (hashing) {
        attempt.target_checksum = finalized.value().checksum;
        if (attempt.source_checksum != attempt.target_checksum) {
            if (settings.verify_integrity) {
                return unexpected(error{error_code::checksum_mismatch,
                                        record.path + ": source " + attempt.source_checksum +
                                            " != target " + attempt.target_checksum});
            }
            SM_LOG_WARN(log_category::worker,
                "Checksum mismatch ignored for " + record.path + " (verification off)");
        }
    }
    return attempt;
}

void copy_worker::report_failure(file_migration_record& record, const error& err,
                                 std::size_t attempt) {
    auto entry = make_entry(record, err, attempt);
    record.status = file_status::failed;

    auto logged = ctx_.tracker->record_error(ctx_.id, entry);
    if (!logged) {
        SM_LOG_WARN(log_category::worker,
            "Cannot record error for " + record.path + ": " + logged.error().message);
    }

    migration_log_context log_ctx;
    log_ctx.job_id = ctx_.id.to_string();
    log_ctx.workspace_id = ctx_.workspace_id;
    log_ctx.path = record.path;
    log_ctx.attempt = static_cast<uint32_t>(attempt);
    log_ctx.error_message = err.message;
    SM_LOG_ERROR_CTX(log_category::worker, "Object failed", log_ctx);

    auto committed = ctx_.tracker->record_result(ctx_.id, record);
    if (!committed) {
        auto released = ctx_.store->release_record(ctx_.id, record.path);
        if (!released) {
            SM_LOG_WARN(log_category::worker,
                "Cannot release " + record.path + ": " + released.error().message);
        }
        raise_fatal(make_entry(record, committed.error(), attempt), "cannot persist result");
        return;
    }

    const auto& job = committed.value();
    const auto& settings = ctx_.settings;
    if (!settings.continue_on_error && job.failed_files > settings.abort_threshold) {
        auto threshold = entry;
        threshold.message = std::to_string(job.failed_files) +
                            " failed file(s) exceed abort threshold " +
                            std::to_string(settings.abort_threshold) + "; last: " + err.message;
        raise_fatal(threshold, "failure threshold exceeded");
    }
}

void copy_worker::raise_fatal(const migration_error_entry& entry, const std::string& reason) {
    auto updated = ctx_.tracker->transition(ctx_.id, [&entry](migration_job& job) {
        if (!job.fatal_error) {
            job.fatal_error = entry;
        }
    });
    if (!updated) {
        SM_LOG_ERROR(log_category::worker,
            "Cannot record fatal error on job " + ctx_.id.to_string() + ": " +
                updated.error().message);
    }

    SM_LOG_ERROR(log_category::worker,
        "Aborting job " + ctx_.id.to_string() + ": " + reason + " (" + entry.message + ")");
    ctx_.token->request(stop_reason::abort);
}

auto copy_worker::make_entry(const file_migration_record& record, const error& err,
                             std::size_t attempt) const -> migration_error_entry {
    migration_error_entry entry;
    entry.path = record.path;
    entry.kind = kind_of(err.code);
    entry.message = err.message;
    entry.attempt = attempt;
    entry.timestamp = std::chrono::system_clock::now();
    entry.retryable = is_retryable(entry.kind);
    return entry;
}

}  // namespace kcenon::storage_migration
