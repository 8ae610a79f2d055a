/**
 * @file job_store.cpp
 * @brief Implementation of the durable job store
 */

#include "kcenon/storage_migration/migration/job_store.h"

#include "kcenon/storage_migration/core/json_utils.h"
#include "kcenon/storage_migration/core/logging.h"
#include "kcenon/storage_migration/security/config_cipher.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <deque>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace kcenon::storage_migration {

namespace {

constexpr int64_t header_format_version = 1;

auto write_failed(const std::string& what) -> unexpected {
    return unexpected(error{error_code::state_write_failed, what});
}

auto write_error_entry(const migration_error_entry& entry) -> std::string {
    return json::object_writer()
        .add("path", entry.path)
        .add("kind", to_string(entry.kind))
        .add("message", entry.message)
        .add("attempt", static_cast<uint64_t>(entry.attempt))
        .add("timestamp", json::time_point_to_int64(entry.timestamp))
        .add("retryable", entry.retryable)
        .str();
}

auto read_error_entry(std::string_view text) -> std::optional<migration_error_entry> {
    auto m = json::parse_object(text);
    if (!m) {
        return std::nullopt;
    }
    migration_error_entry entry;
    entry.path = json::get_string(*m, "path");
    entry.kind = error_kind_from_string(json::get_string(*m, "kind")).value_or(error_kind::internal);
    entry.message = json::get_string(*m, "message");
    entry.attempt = static_cast<std::size_t>(json::get_uint(*m, "attempt"));
    entry.timestamp = json::int64_to_time_point(json::get_int(*m, "timestamp"));
    entry.retryable = json::get_bool(*m, "retryable");
    return entry;
}

auto write_options(const migration_options& options) -> std::string {
    return json::object_writer()
        .add("continue_on_error", options.continue_on_error)
        .add("concurrency", static_cast<uint64_t>(options.concurrency))
        .add("verify_integrity", options.verify_integrity)
        .add("max_attempts", static_cast<uint64_t>(options.max_attempts))
        .add("abort_threshold", options.abort_threshold)
        .add("filter_prefix", options.filter_prefix)
        .str();
}

auto read_options(std::string_view text) -> migration_options {
    migration_options options;
    auto m = json::parse_object(text);
    if (!m) {
        return options;
    }
    options.continue_on_error = json::get_bool(*m, "continue_on_error", options.continue_on_error);
    options.concurrency = static_cast<std::size_t>(
        json::get_uint(*m, "concurrency", options.concurrency));
    options.verify_integrity = json::get_bool(*m, "verify_integrity", options.verify_integrity);
    options.max_attempts = static_cast<std::size_t>(
        json::get_uint(*m, "max_attempts", options.max_attempts));
    options.abort_threshold = json::get_uint(*m, "abort_threshold", options.abort_threshold);
    options.filter_prefix = json::get_string(*m, "filter_prefix");
    return options;
}

void add_time(json::object_writer& writer, std::string_view key,
              const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp) {
        writer.add(key, json::time_point_to_int64(*tp));
    }
}

auto read_time(const json::members& m, const std::string& key)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (!m.contains(key)) {
        return std::nullopt;
    }
    return json::int64_to_time_point(json::get_int(m, key));
}

auto write_record_line(std::size_t seq, const file_migration_record& record) -> std::string {
    return json::object_writer()
        .add("seq", static_cast<uint64_t>(seq))
        .add("path", record.path)
        .add("size", record.size_bytes)
        .add("status", to_string(record.status))
        .add("src", record.source_checksum)
        .add("dst", record.target_checksum)
        .add("attempts", static_cast<uint64_t>(record.attempts))
        .add("error", record.last_error)
        .str();
}

/**
 * @brief One journal line: the result of the manifest entry at seq
 */
struct journal_line {
    std::size_t seq = 0;
    file_migration_record record;
};

auto read_record_line(std::string_view text) -> std::optional<journal_line> {
    auto m = json::parse_object(text);
    if (!m || !m->contains("seq")) {
        return std::nullopt;
    }
    auto status = file_status_from_string(json::get_string(*m, "status"));
    if (!status) {
        return std::nullopt;
    }
    journal_line line;
    line.seq = static_cast<std::size_t>(json::get_uint(*m, "seq"));
    line.record.path = json::get_string(*m, "path");
    line.record.size_bytes = json::get_uint(*m, "size");
    // A claim never reaches the journal; treat one as pending regardless
    line.record.status = *status == file_status::copying ? file_status::pending : *status;
    line.record.source_checksum = json::get_string(*m, "src");
    line.record.target_checksum = json::get_string(*m, "dst");
    line.record.attempts = static_cast<std::size_t>(json::get_uint(*m, "attempts"));
    line.record.last_error = json::get_string(*m, "error");
    return line;
}

template <typename Fn>
void for_each_line(const std::filesystem::path& path, Fn&& fn) {
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            fn(std::string_view(line));
        }
    }
}

struct manifest_entry {
    std::size_t seq = 0;
    std::string path;
    uint64_t size = 0;
};

/**
 * @brief Sequential reader of manifest.jsonl
 *
 * Sequence numbers count well-formed lines, so every reader of the same
 * file assigns the same number to an entry.
 */
class manifest_reader {
public:
    explicit manifest_reader(const std::filesystem::path& path) : in_(path) {}

    auto next() -> std::optional<manifest_entry> {
        std::string line;
        while (std::getline(in_, line)) {
            if (line.empty()) {
                continue;
            }
            auto m = json::parse_object(line);
            auto path = m ? json::get_string(*m, "path") : std::string{};
            if (path.empty()) {
                ++malformed_;
                continue;
            }
            return manifest_entry{next_seq_++, std::move(path), json::get_uint(*m, "size")};
        }
        return std::nullopt;
    }

    [[nodiscard]] auto malformed() const noexcept -> std::size_t { return malformed_; }

private:
    std::ifstream in_;
    std::size_t next_seq_ = 0;
    std::size_t malformed_ = 0;
};

auto write_file_atomically(const std::filesystem::path& path, const std::string& content)
    -> result<void> {
    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return write_failed("cannot open " + temp.string());
        }
        out << content << '\n';
        out.flush();
        if (!out) {
            return write_failed("cannot write " + temp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        return write_failed("cannot rename " + temp.string() + ": " + ec.message());
    }
    return {};
}

}  // namespace

// ============================================================================
// Job entry
// ============================================================================

namespace {

struct claimed_record {
    std::size_t seq = 0;
    file_migration_record record;
};

/**
 * @brief Claim state of a job whose manifest is final
 *
 * One status per manifest entry plus the records currently claimed or
 * released; paths and results of all other records stay on disk. The
 * reader hands out pending entries in manifest order.
 */
struct work_state {
    std::vector<file_status> status;
    std::optional<manifest_reader> reader;
    std::unordered_map<std::string, claimed_record> claimed;
    std::deque<claimed_record> returned;
};

/// Counters recomputed from manifest and journal
struct replay_totals {
    uint64_t total_files = 0;
    uint64_t total_bytes = 0;
    uint64_t migrated_files = 0;
    uint64_t migrated_bytes = 0;
    uint64_t failed_files = 0;
};

struct job_entry {
    mutable std::mutex mutex;
    migration_job job;
    std::unique_ptr<work_state> work;

    /// Last key appended to the manifest; listings arrive in key order
    std::string last_manifest_key;
    std::size_t pending_updates = 0;
    std::filesystem::path dir;
    std::ofstream manifest;
    std::ofstream journal;
    std::ofstream errors;

    auto append(std::ofstream& stream, const char* file, const std::string& line)
        -> result<void> {
        if (!stream.is_open()) {
            stream.open(dir / file, std::ios::app);
            if (!stream) {
                return write_failed("cannot open " + (dir / file).string());
            }
        }
        stream << line << '\n';
        stream.flush();
        if (!stream) {
            stream.close();
            return write_failed("cannot append to " + (dir / file).string());
        }
        return {};
    }

    void close_streams() {
        if (manifest.is_open()) manifest.close();
        if (journal.is_open()) journal.close();
        if (errors.is_open()) errors.close();
    }

    void push_error(const migration_error_entry& entry, std::size_t max_entries) {
        job.errors.push_back(entry);
        if (job.errors.size() > max_entries) {
            job.errors.erase(job.errors.begin(),
                             job.errors.begin() +
                                 static_cast<std::ptrdiff_t>(job.errors.size() - max_entries));
        }
        ++job.error_count;
    }
};

}  // namespace

// ============================================================================
// job_store::impl
// ============================================================================

struct job_store::impl {
    job_store_options options;
    std::filesystem::path jobs_dir;
    std::filesystem::path workspaces_dir;

    /// Guards jobs and slots; never held while waiting for a job_entry mutex
    mutable std::mutex mutex;
    std::unordered_map<job_id, std::shared_ptr<job_entry>> jobs;
    std::unordered_map<std::string, job_id> slots;

    explicit impl(job_store_options opts) : options(std::move(opts)) {
        jobs_dir = options.state_directory / "jobs";
        workspaces_dir = options.state_directory / "workspaces";
    }

    auto find(const job_id& id) const -> std::shared_ptr<job_entry> {
        std::lock_guard lock(mutex);
        auto it = jobs.find(id);
        return it == jobs.end() ? nullptr : it->second;
    }

    auto snapshot_entries() const -> std::vector<std::shared_ptr<job_entry>> {
        std::lock_guard lock(mutex);
        std::vector<std::shared_ptr<job_entry>> entries;
        entries.reserve(jobs.size());
        for (const auto& [id, entry] : jobs) {
            entries.push_back(entry);
        }
        return entries;
    }

    auto lock_path(const std::string& workspace_id) const -> std::filesystem::path {
        return workspaces_dir / (workspace_id + ".lock");
    }

    // ------------------------------------------------------------------------
    // Workspace slots (caller holds mutex)
    // ------------------------------------------------------------------------

    auto owner_on_disk_is_active(const std::string& owner) const -> bool {
        auto owner_id = job_id::from_string(owner);
        if (!owner_id) {
            return false;
        }
        if (jobs.contains(*owner_id)) {
            // Known jobs that hold a slot are tracked in slots
            return false;
        }
        auto header = jobs_dir / owner / "job.json";
        std::ifstream in(header);
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        auto m = json::parse_object(text);
        if (!m) {
            return false;
        }
        auto status = job_status_from_string(json::get_string(*m, "status"));
        return status && is_active(*status);
    }

    auto acquire_slot(const std::string& workspace_id, const job_id& id) -> result<void> {
        auto slot = slots.find(workspace_id);
        if (slot != slots.end()) {
            if (slot->second == id) {
                return {};
            }
            return unexpected(error{error_code::job_already_active,
                                    "workspace '" + workspace_id + "' already has active job " +
                                        slot->second.to_string()});
        }

        auto path = lock_path(workspace_id);
        for (int attempt = 0; attempt < 2; ++attempt) {
            errno = 0;
            std::FILE* file = std::fopen(path.c_str(), "wx");
            if (file) {
                auto text = id.to_string();
                bool ok = std::fputs(text.c_str(), file) >= 0;
                ok = (std::fclose(file) == 0) && ok;
                if (!ok) {
                    std::error_code ec;
                    std::filesystem::remove(path, ec);
                    return write_failed("cannot write " + path.string());
                }
                slots[workspace_id] = id;
                return {};
            }
            if (errno != EEXIST) {
                return write_failed("cannot create " + path.string());
            }

            std::ifstream in(path);
            std::string owner;
            std::getline(in, owner);
            in.close();

            if (owner == id.to_string()) {
                slots[workspace_id] = id;
                return {};
            }
            if (owner_on_disk_is_active(owner)) {
                return unexpected(error{error_code::job_already_active,
                                        "workspace '" + workspace_id +
                                            "' is held by job " + owner});
            }

            SM_LOG_WARN(log_category::job_store,
                "Removing stale workspace lock " + path.string() + " held by " + owner);
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
        return unexpected(error{error_code::job_already_active,
                                "cannot take workspace lock " + path.string()});
    }

    void release_slot(const std::string& workspace_id, const job_id& id) {
        auto slot = slots.find(workspace_id);
        if (slot == slots.end() || slot->second != id) {
            return;
        }
        slots.erase(slot);

        auto path = lock_path(workspace_id);
        std::ifstream in(path);
        std::string owner;
        std::getline(in, owner);
        in.close();
        if (owner == id.to_string()) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) {
                SM_LOG_WARN(log_category::job_store,
                    "Failed to remove workspace lock " + path.string() + ": " + ec.message());
            }
        }
    }

    // ------------------------------------------------------------------------
    // Header serialization
    // ------------------------------------------------------------------------

    auto write_config(json::object_writer& writer, const std::string& key,
                      const storage_config& config, const job_id& id) const -> result<void> {
        auto plain = json::serialize_string_map(config);
        if (!options.cipher) {
            writer.add_raw(key, plain);
            return {};
        }
        auto sealed = options.cipher->seal(plain, id.to_string());
        if (!sealed) {
            return unexpected(sealed.error());
        }
        writer.add(key + "_sealed", sealed.value());
        return {};
    }

    auto read_config(const json::members& m, const std::string& key, const job_id& id) const
        -> result<storage_config> {
        auto sealed = m.find(key + "_sealed");
        if (sealed != m.end()) {
            if (!options.cipher) {
                return unexpected(error{error_code::decryption_failed,
                                        key + " is sealed but no encryption key is configured"});
            }
            auto plain = options.cipher->open(sealed->second, id.to_string());
            if (!plain) {
                return unexpected(plain.error());
            }
            auto parsed = json::parse_string_map(plain.value());
            if (!parsed) {
                return unexpected(error{error_code::state_corrupted, key + " is malformed"});
            }
            return *parsed;
        }

        auto raw = m.find(key);
        if (raw == m.end()) {
            return storage_config{};
        }
        auto parsed = json::parse_string_map(raw->second);
        if (!parsed) {
            return unexpected(error{error_code::state_corrupted, key + " is malformed"});
        }
        return *parsed;
    }

    auto serialize_header(const migration_job& job) const -> result<std::string> {
        json::object_writer writer;
        writer.add("format_version", header_format_version)
            .add("id", job.id.to_string())
            .add("workspace_id", job.workspace_id)
            .add("source_provider", job.source_provider);
        auto src = write_config(writer, "source_config", job.source_config, job.id);
        if (!src) {
            return unexpected(src.error());
        }
        writer.add("target_provider", job.target_provider);
        auto dst = write_config(writer, "target_config", job.target_config, job.id);
        if (!dst) {
            return unexpected(dst.error());
        }

        writer.add_raw("options", write_options(job.options))
            .add("status", to_string(job.status))
            .add("total_files", job.total_files)
            .add("migrated_files", job.migrated_files)
            .add("failed_files", job.failed_files)
            .add("total_bytes", job.total_bytes)
            .add("migrated_bytes", job.migrated_bytes)
            .add("current_file", job.current_file)
            .add("created_at", json::time_point_to_int64(job.created_at));
        add_time(writer, "started_at", job.started_at);
        add_time(writer, "estimated_completion_at", job.estimated_completion_at);
        add_time(writer, "completed_at", job.completed_at);
        writer.add("error_count", job.error_count);
        if (job.fatal_error) {
            writer.add_raw("fatal_error", write_error_entry(*job.fatal_error));
        }
        writer.add("manifest_complete", job.manifest_complete)
            .add("committed", job.committed)
            .add("owner_id", job.owner_id);
        add_time(writer, "heartbeat_at", job.heartbeat_at);
        return writer.str();
    }

    auto parse_header(std::string_view text) const -> result<migration_job> {
        auto m = json::parse_object(text);
        if (!m) {
            return unexpected(error{error_code::state_corrupted, "job header is not valid JSON"});
        }

        auto id = job_id::from_string(json::get_string(*m, "id"));
        auto status = job_status_from_string(json::get_string(*m, "status"));
        if (!id || !status) {
            return unexpected(error{error_code::state_corrupted,
                                    "job header lacks a valid id or status"});
        }

        migration_job job;
        job.id = *id;
        job.status = *status;
        job.workspace_id = json::get_string(*m, "workspace_id");
        job.source_provider = json::get_string(*m, "source_provider");
        job.target_provider = json::get_string(*m, "target_provider");

        auto src = read_config(*m, "source_config", job.id);
        if (!src) {
            return unexpected(src.error());
        }
        job.source_config = std::move(src.value());
        auto dst = read_config(*m, "target_config", job.id);
        if (!dst) {
            return unexpected(dst.error());
        }
        job.target_config = std::move(dst.value());

        auto opts = m->find("options");
        if (opts != m->end()) {
            job.options = read_options(opts->second);
        }

        job.total_files = json::get_uint(*m, "total_files");
        job.migrated_files = json::get_uint(*m, "migrated_files");
        job.failed_files = json::get_uint(*m, "failed_files");
        job.total_bytes = json::get_uint(*m, "total_bytes");
        job.migrated_bytes = json::get_uint(*m, "migrated_bytes");
        job.current_file = json::get_string(*m, "current_file");
        job.created_at = json::int64_to_time_point(json::get_int(*m, "created_at"));
        job.started_at = read_time(*m, "started_at");
        job.estimated_completion_at = read_time(*m, "estimated_completion_at");
        job.completed_at = read_time(*m, "completed_at");
        job.error_count = json::get_uint(*m, "error_count");
        auto fatal = m->find("fatal_error");
        if (fatal != m->end()) {
            job.fatal_error = read_error_entry(fatal->second);
        }
        job.manifest_complete = json::get_bool(*m, "manifest_complete");
        job.committed = json::get_bool(*m, "committed");
        job.owner_id = json::get_string(*m, "owner_id");
        job.heartbeat_at = read_time(*m, "heartbeat_at");
        return job;
    }

    auto write_header(const job_entry& entry, const migration_job& job) const -> result<void> {
        auto text = serialize_header(job);
        if (!text) {
            return unexpected(text.error());
        }
        return write_file_atomically(entry.dir / "job.json", text.value());
    }

    // ------------------------------------------------------------------------
    // Loading
    // ------------------------------------------------------------------------

    /**
     * @brief Rebuild the claim state of @p entry from its manifest and journal
     *
     * Records that were being copied come back as pending.
     */
    auto build_work(const job_entry& entry, replay_totals& totals) const
        -> std::unique_ptr<work_state> {
        auto work = std::make_unique<work_state>();
        const auto manifest_path = entry.dir / "manifest.jsonl";

        manifest_reader sizes(manifest_path);
        while (auto next = sizes.next()) {
            totals.total_files += 1;
            totals.total_bytes += next->size;
        }
        if (sizes.malformed() > 0) {
            SM_LOG_WARN(log_category::job_store,
                "Skipped " + std::to_string(sizes.malformed()) + " malformed manifest line(s) in " +
                    entry.dir.string());
        }
        work->status.assign(static_cast<std::size_t>(totals.total_files), file_status::pending);

        std::size_t skipped = 0;
        for_each_line(entry.dir / "records.jsonl", [&](std::string_view text) {
            auto line = read_record_line(text);
            if (!line || line->seq >= work->status.size()) {
                ++skipped;
                return;
            }
            auto& current = work->status[line->seq];
            const auto size = line->record.size_bytes;
            if (current == file_status::verified) {
                totals.migrated_files -= 1;
                totals.migrated_bytes -= size;
            } else if (current == file_status::failed) {
                totals.failed_files -= 1;
            }
            current = line->record.status;
            if (current == file_status::verified) {
                totals.migrated_files += 1;
                totals.migrated_bytes += size;
            } else if (current == file_status::failed) {
                totals.failed_files += 1;
            }
        });
        if (skipped > 0) {
            SM_LOG_WARN(log_category::job_store,
                "Skipped " + std::to_string(skipped) + " malformed journal line(s) in " +
                    entry.dir.string());
        }

        work->reader.emplace(manifest_path);
        return work;
    }

    /// Claim state of a job with a final manifest, loaded on first use
    auto ensure_work(job_entry& entry) const -> work_state* {
        if (!entry.job.manifest_complete) {
            return nullptr;
        }
        if (!entry.work) {
            replay_totals ignored;
            entry.work = build_work(entry, ignored);
        }
        return entry.work.get();
    }

    static auto find_manifest_entry(const job_entry& entry, const std::string& path)
        -> std::optional<manifest_entry> {
        manifest_reader reader(entry.dir / "manifest.jsonl");
        while (auto next = reader.next()) {
            if (next->path == path) {
                return next;
            }
            if (next->path > path) {
                break;
            }
        }
        return std::nullopt;
    }

    void load_error_tail(job_entry& entry) const {
        std::deque<migration_error_entry> tail;
        uint64_t lines = 0;
        for_each_line(entry.dir / "errors.jsonl", [&](std::string_view text) {
            ++lines;
            if (auto parsed = read_error_entry(text)) {
                tail.push_back(std::move(*parsed));
                if (tail.size() > options.max_error_entries) {
                    tail.pop_front();
                }
            }
        });
        entry.job.errors.assign(std::make_move_iterator(tail.begin()),
                                std::make_move_iterator(tail.end()));
        entry.job.error_count = std::max<uint64_t>(entry.job.error_count, lines);
    }

    /**
     * @brief Load a job directory
     *
     * Inactive jobs keep their header counters and no records. Active jobs
     * replay the journal so counters reflect every committed result.
     */
    auto load_job(const std::filesystem::path& dir) const -> result<std::shared_ptr<job_entry>> {
        std::ifstream in(dir / "job.json");
        if (!in) {
            return unexpected(error{error_code::state_read_failed,
                                    "missing " + (dir / "job.json").string()});
        }
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        auto header = parse_header(text);
        if (!header) {
            return unexpected(header.error());
        }

        auto entry = std::make_shared<job_entry>();
        entry->dir = dir;
        entry->job = std::move(header.value());
        load_error_tail(*entry);

        if (!is_active(entry->job.status)) {
            return entry;
        }

        replay_totals totals;
        if (entry->job.manifest_complete) {
            entry->work = build_work(*entry, totals);
        } else {
            manifest_reader reader(dir / "manifest.jsonl");
            while (auto next = reader.next()) {
                totals.total_files += 1;
                totals.total_bytes += next->size;
                entry->last_manifest_key = std::move(next->path);
            }
        }
        entry->job.total_files = totals.total_files;
        entry->job.total_bytes = totals.total_bytes;
        entry->job.migrated_files = totals.migrated_files;
        entry->job.migrated_bytes = totals.migrated_bytes;
        entry->job.failed_files = totals.failed_files;
        return entry;
    }

    auto load_all() -> result<void> {
        std::error_code ec;
        std::filesystem::create_directories(jobs_dir, ec);
        if (ec) {
            return write_failed("cannot create " + jobs_dir.string() + ": " + ec.message());
        }
        std::filesystem::create_directories(workspaces_dir, ec);
        if (ec) {
            return write_failed("cannot create " + workspaces_dir.string() + ": " + ec.message());
        }

        std::vector<std::shared_ptr<job_entry>> loaded;
        for (const auto& dir : std::filesystem::directory_iterator(jobs_dir, ec)) {
            std::error_code type_ec;
            if (!dir.is_directory(type_ec)) {
                continue;
            }
            auto entry = load_job(dir.path());
            if (!entry) {
                SM_LOG_ERROR(log_category::job_store,
                    "Skipping job state in " + dir.path().string() + ": " +
                        entry.error().message);
                continue;
            }
            loaded.push_back(std::move(entry.value()));
        }
        if (ec) {
            return unexpected(error{error_code::state_read_failed,
                                    "cannot list " + jobs_dir.string() + ": " + ec.message()});
        }

        std::lock_guard lock(mutex);
        for (auto& entry : loaded) {
            jobs.emplace(entry->job.id, entry);
        }
        for (auto& entry : loaded) {
            if (!is_active(entry->job.status)) {
                continue;
            }
            auto slot = acquire_slot(entry->job.workspace_id, entry->job.id);
            if (!slot) {
                SM_LOG_ERROR(log_category::job_store,
                    "Job " + entry->job.id.to_string() + " is active but cannot hold workspace '" +
                        entry->job.workspace_id + "': " + slot.error().message);
            }
        }

        SM_LOG_INFO(log_category::job_store,
            "Loaded " + std::to_string(loaded.size()) + " job(s) from " +
                options.state_directory.string());
        return {};
    }
};

// ============================================================================
// job_store
// ============================================================================

job_store::job_store(job_store_options options)
    : impl_(std::make_unique<impl>(std::move(options))) {}

job_store::~job_store() = default;

auto job_store::open(job_store_options options) -> result<std::unique_ptr<job_store>> {
    if (options.state_directory.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "job store requires a state directory"});
    }
    if (options.checkpoint_interval == 0) {
        options.checkpoint_interval = 1;
    }
    if (options.max_error_entries == 0) {
        options.max_error_entries = 1;
    }

    std::unique_ptr<job_store> store(new job_store(std::move(options)));
    auto loaded = store->impl_->load_all();
    if (!loaded) {
        return unexpected(loaded.error());
    }
    return store;
}

auto job_store::validate_workspace_id(const std::string& workspace_id) -> result<void> {
    if (workspace_id.empty() || workspace_id == "." || workspace_id == "..") {
        return unexpected(error{error_code::invalid_argument, "workspace id is empty"});
    }
    for (char c : workspace_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        if (!ok) {
            return unexpected(error{error_code::invalid_argument,
                                    "workspace id contains invalid characters: " + workspace_id});
        }
    }
    return {};
}

auto job_store::create_job(const new_job_request& request) -> result<migration_job> {
    auto valid = validate_workspace_id(request.workspace_id);
    if (!valid) {
        return unexpected(valid.error());
    }
    auto options = request.options.validate();
    if (!options) {
        return unexpected(options.error());
    }

    auto entry = std::make_shared<job_entry>();
    auto& job = entry->job;
    job.id = job_id::generate();
    job.workspace_id = request.workspace_id;
    job.source_provider = request.source_provider;
    job.source_config = request.source_config;
    job.target_provider = request.target_provider;
    job.target_config = request.target_config;
    job.options = request.options;
    job.status = job_status::pending;
    job.created_at = std::chrono::system_clock::now();
    job.owner_id = request.owner_id;
    job.heartbeat_at = job.created_at;
    entry->dir = impl_->jobs_dir / job.id.to_string();

    std::lock_guard lock(impl_->mutex);
    auto slot = impl_->acquire_slot(job.workspace_id, job.id);
    if (!slot) {
        return unexpected(slot.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(entry->dir, ec);
    auto written = ec ? result<void>(write_failed("cannot create " + entry->dir.string()))
                      : impl_->write_header(*entry, job);
    if (!written) {
        impl_->release_slot(job.workspace_id, job.id);
        std::filesystem::remove_all(entry->dir, ec);
        return unexpected(written.error());
    }

    impl_->jobs.emplace(job.id, entry);
    SM_LOG_INFO(log_category::job_store,
        "Created job " + job.id.to_string() + " for workspace " + job.workspace_id);
    return job;
}

auto job_store::append_manifest(const job_id& id, std::span<const storage_object> entries)
    -> result<void> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }

    std::lock_guard lock(entry->mutex);
    if (entry->job.status != job_status::pending || entry->job.manifest_complete) {
        return unexpected(error{error_code::invalid_job_state,
                                "manifest of job " + id.to_string() + " is closed"});
    }

    std::string page;
    std::string last = entry->last_manifest_key;
    uint64_t added_files = 0;
    uint64_t added_bytes = 0;
    for (const auto& object : entries) {
        if (object.key.empty()) {
            continue;
        }
        if (!last.empty() && object.key <= last) {
            if (object.key == last) {
                continue;
            }
            return unexpected(error{error_code::invalid_argument,
                                    "listing is not in key order: '" + object.key +
                                        "' after '" + last + "'"});
        }
        page += json::object_writer().add("path", object.key).add("size", object.size).str();
        page += '\n';
        last = object.key;
        added_files += 1;
        added_bytes += object.size;
    }
    if (added_files == 0) {
        return {};
    }
    page.pop_back();

    auto appended = entry->append(entry->manifest, "manifest.jsonl", page);
    if (!appended) {
        return appended;
    }

    entry->last_manifest_key = std::move(last);
    entry->job.total_files += added_files;
    entry->job.total_bytes += added_bytes;
    return {};
}

auto job_store::finalize_manifest(const job_id& id) -> result<migration_job> {
    return update_job(id, [](migration_job& job) { job.manifest_complete = true; });
}

auto job_store::reset_manifest(const job_id& id) -> result<void> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }

    std::lock_guard lock(entry->mutex);
    if (entry->job.manifest_complete) {
        return unexpected(error{error_code::invalid_job_state,
                                "manifest of job " + id.to_string() + " is already final"});
    }

    entry->close_streams();
    std::error_code ec;
    std::filesystem::remove(entry->dir / "manifest.jsonl", ec);
    std::filesystem::remove(entry->dir / "records.jsonl", ec);
    if (ec) {
        return write_failed("cannot reset manifest of job " + id.to_string());
    }

    entry->work.reset();
    entry->last_manifest_key.clear();

    auto updated = entry->job;
    updated.total_files = 0;
    updated.total_bytes = 0;
    updated.migrated_files = 0;
    updated.migrated_bytes = 0;
    updated.failed_files = 0;
    auto written = impl_->write_header(*entry, updated);
    if (!written) {
        return written;
    }
    entry->job = std::move(updated);
    return {};
}

auto job_store::update_job(const job_id& id, const job_mutator& mutator)
    -> result<migration_job> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }

    std::lock_guard lock(entry->mutex);
    auto updated = entry->job;
    mutator(updated);
    updated.id = entry->job.id;
    updated.workspace_id = entry->job.workspace_id;

    const bool was_active = is_active(entry->job.status);
    const bool now_active = is_active(updated.status);

    if (!was_active && now_active) {
        std::lock_guard store_lock(impl_->mutex);
        auto slot = impl_->acquire_slot(updated.workspace_id, updated.id);
        if (!slot) {
            return unexpected(slot.error());
        }
    }

    auto written = impl_->write_header(*entry, updated);
    if (!written) {
        if (!was_active && now_active) {
            std::lock_guard store_lock(impl_->mutex);
            impl_->release_slot(updated.workspace_id, updated.id);
        }
        return unexpected(written.error());
    }

    if (entry->job.status != updated.status) {
        SM_LOG_DEBUG(log_category::job_store,
            "Job " + id.to_string() + ": " + to_string(entry->job.status) + " -> " +
                to_string(updated.status));
    }
    entry->job = std::move(updated);
    entry->pending_updates = 0;

    // Claim state is rebuilt from disk when a job runs again
    if (entry->work && entry->job.status != job_status::in_progress &&
        entry->work->claimed.empty()) {
        entry->work.reset();
    }

    if (was_active && !now_active) {
        std::lock_guard store_lock(impl_->mutex);
        impl_->release_slot(entry->job.workspace_id, entry->job.id);
    }
    return entry->job;
}

auto job_store::discard_job(const job_id& id) -> result<void> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }

    std::lock_guard lock(entry->mutex);
    const auto status = entry->job.status;
    if (status != job_status::failed && status != job_status::cancelled &&
        !entry->job.committed) {
        return unexpected(error{error_code::invalid_job_state,
                                std::string("cannot discard a job that is ") +
                                    to_string(status)});
    }

    entry->close_streams();
    entry->work.reset();
    std::error_code ec;
    std::filesystem::remove_all(entry->dir, ec);
    if (ec) {
        return write_failed("cannot remove " + entry->dir.string() + ": " + ec.message());
    }

    std::lock_guard store_lock(impl_->mutex);
    impl_->release_slot(entry->job.workspace_id, entry->job.id);
    impl_->jobs.erase(id);
    SM_LOG_INFO(log_category::job_store, "Discarded job " + id.to_string());
    return {};
}

auto job_store::get_job(const job_id& id) const -> result<migration_job> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }
    std::lock_guard lock(entry->mutex);
    return entry->job;
}

auto job_store::find_active_job(const std::string& workspace_id) const
    -> std::optional<migration_job> {
    std::shared_ptr<job_entry> entry;
    {
        std::lock_guard lock(impl_->mutex);
        auto slot = impl_->slots.find(workspace_id);
        if (slot == impl_->slots.end()) {
            return std::nullopt;
        }
        auto it = impl_->jobs.find(slot->second);
        if (it == impl_->jobs.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }
    std::lock_guard lock(entry->mutex);
    return entry->job;
}

auto job_store::find_latest_job(const std::string& workspace_id) const
    -> std::optional<migration_job> {
    auto jobs = list_jobs(workspace_id);
    if (jobs.empty()) {
        return std::nullopt;
    }
    return std::move(jobs.front());
}

auto job_store::list_jobs(const std::string& workspace_id) const -> std::vector<migration_job> {
    std::vector<migration_job> jobs;
    for (const auto& entry : impl_->snapshot_entries()) {
        std::lock_guard lock(entry->mutex);
        if (entry->job.workspace_id == workspace_id) {
            jobs.push_back(entry->job);
        }
    }
    std::sort(jobs.begin(), jobs.end(), [](const migration_job& a, const migration_job& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return b.id < a.id;
    });
    return jobs;
}

auto job_store::list_all_jobs() const -> std::vector<migration_job> {
    std::vector<migration_job> jobs;
    for (const auto& entry : impl_->snapshot_entries()) {
        std::lock_guard lock(entry->mutex);
        jobs.push_back(entry->job);
    }
    return jobs;
}

auto job_store::records(const job_id& id) const -> result<std::vector<file_migration_record>> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }
    std::lock_guard lock(entry->mutex);

    std::vector<file_migration_record> records;
    manifest_reader reader(entry->dir / "manifest.jsonl");
    while (auto next = reader.next()) {
        file_migration_record record;
        record.path = std::move(next->path);
        record.size_bytes = next->size;
        records.push_back(std::move(record));
    }

    for_each_line(entry->dir / "records.jsonl", [&records](std::string_view text) {
        auto line = read_record_line(text);
        if (line && line->seq < records.size()) {
            auto& record = records[line->seq];
            line->record.path = record.path;
            line->record.size_bytes = record.size_bytes;
            record = std::move(line->record);
        }
    });

    if (entry->work) {
        for (const auto& [path, claim] : entry->work->claimed) {
            if (claim.seq < records.size()) {
                records[claim.seq] = claim.record;
            }
        }
    }
    return records;
}

auto job_store::record(const job_id& id, const std::string& path) const
    -> result<file_migration_record> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }
    std::lock_guard lock(entry->mutex);

    if (entry->work) {
        auto claimed = entry->work->claimed.find(path);
        if (claimed != entry->work->claimed.end()) {
            return claimed->second.record;
        }
    }

    auto found = impl::find_manifest_entry(*entry, path);
    if (!found) {
        return unexpected(error{error_code::object_not_found, "no record for " + path});
    }
    file_migration_record record;
    record.path = found->path;
    record.size_bytes = found->size;
    for_each_line(entry->dir / "records.jsonl", [&record, &found](std::string_view text) {
        auto line = read_record_line(text);
        if (line && line->seq == found->seq) {
            line->record.path = record.path;
            line->record.size_bytes = record.size_bytes;
            record = std::move(line->record);
        }
    });
    return record;
}

auto job_store::claim_next(const job_id& id) -> result<std::optional<file_migration_record>> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }

    std::lock_guard lock(entry->mutex);
    if (entry->job.status != job_status::in_progress || !entry->job.manifest_complete) {
        return unexpected(error{error_code::invalid_job_state,
                                std::string("cannot claim records while job is ") +
                                    to_string(entry->job.status)});
    }

    auto* work = impl_->ensure_work(*entry);
    std::optional<claimed_record> next;
    while (!work->returned.empty() && !next) {
        auto candidate = std::move(work->returned.front());
        work->returned.pop_front();
        if (work->status[candidate.seq] == file_status::pending) {
            next = std::move(candidate);
        }
    }
    while (!next) {
        auto listed = work->reader->next();
        if (!listed) {
            return std::optional<file_migration_record>{};
        }
        if (listed->seq >= work->status.size() ||
            work->status[listed->seq] != file_status::pending) {
            continue;
        }
        claimed_record candidate;
        candidate.seq = listed->seq;
        candidate.record.path = std::move(listed->path);
        candidate.record.size_bytes = listed->size;
        next = std::move(candidate);
    }

    next->record.status = file_status::copying;
    work->status[next->seq] = file_status::copying;
    entry->job.current_file = next->record.path;
    auto claimed = next->record;
    work->claimed.emplace(claimed.path, std::move(*next));
    return std::optional<file_migration_record>{std::move(claimed)};
}

auto job_store::commit_record(const job_id& id, const file_migration_record& record,
                              const job_mutator& after) -> result<migration_job> {
    if (record.status != file_status::verified && record.status != file_status::failed) {
        return unexpected(error{error_code::invalid_argument,
                                "only verified or failed results can be committed"});
    }

    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }

    std::lock_guard lock(entry->mutex);
    auto* work = impl_->ensure_work(*entry);
    auto claim = work ? work->claimed.find(record.path)
                      : std::unordered_map<std::string, claimed_record>::iterator{};
    if (!work || claim == work->claimed.end()) {
        if (!impl::find_manifest_entry(*entry, record.path)) {
            return unexpected(error{error_code::object_not_found, "no record for " + record.path});
        }
        return unexpected(error{error_code::invalid_job_state,
                                "record " + record.path + " is not claimed"});
    }

    const auto seq = claim->second.seq;
    auto updated = claim->second.record;
    updated.status = record.status;
    updated.source_checksum = record.source_checksum;
    updated.target_checksum = record.target_checksum;
    updated.attempts = record.attempts;
    updated.last_error = record.last_error;

    auto appended =
        entry->append(entry->journal, "records.jsonl", write_record_line(seq, updated));
    if (!appended) {
        return unexpected(appended.error());
    }

    work->status[seq] = updated.status;
    work->claimed.erase(claim);

    auto& job = entry->job;
    if (updated.status == file_status::verified) {
        job.migrated_files += 1;
        job.migrated_bytes += updated.size_bytes;
    } else {
        job.failed_files += 1;
    }
    job.current_file = updated.path;
    if (after) {
        after(job);
    }

    if (++entry->pending_updates >= impl_->options.checkpoint_interval) {
        auto written = impl_->write_header(*entry, job);
        if (!written) {
            SM_LOG_WARN(log_category::job_store,
                "Checkpoint of job " + id.to_string() + " failed: " + written.error().message);
        } else {
            entry->pending_updates = 0;
        }
    }
    return job;
}

auto job_store::release_record(const job_id& id, const std::string& path) -> result<void> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }

    std::lock_guard lock(entry->mutex);
    auto* work = entry->work.get();
    auto claim = work ? work->claimed.find(path)
                      : std::unordered_map<std::string, claimed_record>::iterator{};
    if (!work || claim == work->claimed.end()) {
        if (!impl::find_manifest_entry(*entry, path)) {
            return unexpected(error{error_code::object_not_found, "no record for " + path});
        }
        return {};
    }

    auto released = std::move(claim->second);
    work->claimed.erase(claim);
    released.record.status = file_status::pending;
    work->status[released.seq] = file_status::pending;
    work->returned.push_back(std::move(released));
    return {};
}

auto job_store::record_error(const job_id& id, const migration_error_entry& error_entry)
    -> result<void> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }

    std::lock_guard lock(entry->mutex);
    auto appended = entry->append(entry->errors, "errors.jsonl", write_error_entry(error_entry));
    if (!appended) {
        return appended;
    }
    entry->push_error(error_entry, impl_->options.max_error_entries);
    return {};
}

auto job_store::reset_failed_records(const job_id& id) -> result<uint64_t> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }

    std::lock_guard lock(entry->mutex);
    auto* work = impl_->ensure_work(*entry);
    if (!work || std::find(work->status.begin(), work->status.end(), file_status::failed) ==
                     work->status.end()) {
        return uint64_t{0};
    }

    const auto manifest_path = entry->dir / "manifest.jsonl";
    uint64_t reset = 0;
    manifest_reader reader(manifest_path);
    while (auto next = reader.next()) {
        if (next->seq >= work->status.size() || work->status[next->seq] != file_status::failed) {
            continue;
        }
        file_migration_record cleared;
        cleared.path = std::move(next->path);
        cleared.size_bytes = next->size;
        cleared.status = file_status::pending;

        auto appended = entry->append(entry->journal, "records.jsonl",
                                      write_record_line(next->seq, cleared));
        if (!appended) {
            return unexpected(appended.error());
        }
        work->status[next->seq] = file_status::pending;
        entry->job.failed_files -= 1;
        ++reset;
    }

    // Claims restart from the top of the manifest to pick up the reset records
    work->reader.emplace(manifest_path);
    work->returned.clear();

    if (reset > 0) {
        auto written = impl_->write_header(*entry, entry->job);
        if (!written) {
            return unexpected(written.error());
        }
        entry->pending_updates = 0;
        SM_LOG_INFO(log_category::job_store,
            "Reset " + std::to_string(reset) + " failed record(s) of job " + id.to_string());
    }
    return reset;
}

auto job_store::checkpoint(const job_id& id) -> result<void> {
    auto entry = impl_->find(id);
    if (!entry) {
        return unexpected(error{error_code::job_not_found, "job not found: " + id.to_string()});
    }
    std::lock_guard lock(entry->mutex);
    auto written = impl_->write_header(*entry, entry->job);
    if (written) {
        entry->pending_updates = 0;
    }
    return written;
}

}  // namespace kcenon::storage_migration
