/**
 * @file local_storage_backend.cpp
 * @brief Implementation of the local filesystem storage backend
 */

#include "kcenon/storage_migration/storage/local_storage_backend.h"

#include "kcenon/storage_migration/core/checksum.h"
#include "kcenon/storage_migration/core/logging.h"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <optional>
#include <random>
#include <system_error>

namespace kcenon::storage_migration {

namespace {

constexpr std::string_view partial_suffix = ".sm-partial";

auto map_filesystem_error(const std::error_code& ec, const std::string& what) -> error {
    if (ec == std::errc::no_such_file_or_directory) {
        return error{error_code::object_not_found, what + ": " + ec.message()};
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return error{error_code::authorization_failed, what + ": " + ec.message()};
    }
    if (ec == std::errc::no_space_on_device) {
        return error{error_code::storage_full, what + ": " + ec.message()};
    }
    return error{error_code::transient_io, what + ": " + ec.message()};
}

auto last_errno_error(error_code fallback, const std::string& what) -> error {
    auto ec = std::error_code(errno, std::generic_category());
    if (errno == 0) {
        return error{fallback, what};
    }
    auto mapped = map_filesystem_error(ec, what);
    if (mapped.code == error_code::transient_io) {
        mapped.code = fallback;
    }
    return mapped;
}

auto random_suffix() -> std::string {
    thread_local std::mt19937_64 gen(std::random_device{}());
    static constexpr char digits[] = "0123456789abcdef";
    std::string out(12, '0');
    for (auto& c : out) {
        c = digits[gen() % 16];
    }
    return out;
}

/**
 * @brief Listing state shared by one walk over the tree
 */
struct sorted_walk {
    const std::string& prefix;
    const std::optional<std::string>& after;
    std::size_t wanted;
    std::vector<storage_object> found;
};

struct walk_child {
    /// Key of a file, or the key prefix (ending in '/') of a directory
    std::string key;
    std::filesystem::path path;
    bool directory = false;
};

/**
 * @brief Collect keys below @p dir in key order until walk.wanted are found
 *
 * Directories sort by their key prefix, so visiting children in order
 * yields keys in lexicographic order. Subtrees that hold only keys at or
 * before walk.after, or none under walk.prefix, are not opened.
 */
auto walk_sorted(const std::filesystem::path& dir, const std::string& key_prefix,
                 sorted_walk& walk) -> result<void> {
    std::error_code ec;
    std::filesystem::directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return unexpected(map_filesystem_error(ec, "cannot list " + dir.string()));
    }

    std::vector<walk_child> children;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return unexpected(map_filesystem_error(ec, "listing failed"));
        }
        std::error_code entry_ec;
        auto name = it->path().filename().string();
        if (std::filesystem::is_directory(it->symlink_status(entry_ec))) {
            children.push_back({key_prefix + name + "/", it->path(), true});
        } else if (it->is_regular_file(entry_ec)) {
            children.push_back({key_prefix + name, it->path(), false});
        }
    }
    std::sort(children.begin(), children.end(),
              [](const walk_child& a, const walk_child& b) { return a.key < b.key; });

    for (const auto& child : children) {
        if (walk.found.size() >= walk.wanted) {
            break;
        }
        const auto& key = child.key;
        const bool leads_to_prefix = child.directory && walk.prefix.starts_with(key);
        if (!walk.prefix.empty() && !key.starts_with(walk.prefix) && !leads_to_prefix) {
            continue;
        }
        const bool holds_after = child.directory && walk.after && walk.after->starts_with(key);
        if (walk.after && key <= *walk.after && !holds_after) {
            continue;
        }

        if (child.directory) {
            auto walked = walk_sorted(child.path, key, walk);
            if (!walked) {
                return walked;
            }
            continue;
        }
        if (key.ends_with(partial_suffix)) {
            continue;
        }
        std::error_code size_ec;
        auto size = std::filesystem::file_size(child.path, size_ec);
        if (size_ec) {
            continue;
        }
        walk.found.push_back(storage_object{key, size});
    }
    return {};
}

class local_read_stream : public object_read_stream {
public:
    local_read_stream(std::ifstream file, uint64_t size, std::string key)
        : file_(std::move(file)), size_(size), key_(std::move(key)) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (buffer.empty() || file_.eof()) {
            return std::size_t{0};
        }
        file_.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        if (file_.bad()) {
            return unexpected(error{error_code::storage_read_failed,
                                    "read failed: " + key_});
        }
        return static_cast<std::size_t>(file_.gcount());
    }

    auto size() const -> uint64_t override { return size_; }

    auto checksum() const -> std::optional<std::string> override { return std::nullopt; }

private:
    std::ifstream file_;
    uint64_t size_;
    std::string key_;
};

class local_write_stream : public object_write_stream {
public:
    local_write_stream(std::filesystem::path target, std::filesystem::path temp,
                       std::ofstream file)
        : target_(std::move(target)), temp_(std::move(temp)), file_(std::move(file)) {}

    ~local_write_stream() override {
        if (!done_) {
            discard();
        }
    }

    auto write(std::span<const std::byte> data) -> result<void> override {
        if (done_) {
            return unexpected(error{error_code::invalid_job_state, "stream already closed"});
        }
        errno = 0;
        file_.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        if (!file_) {
            return unexpected(last_errno_error(error_code::storage_write_failed,
                                               "write failed: " + target_.string()));
        }
        hasher_.update(data);
        bytes_ += data.size();
        return {};
    }

    auto finalize() -> result<write_result> override {
        if (done_) {
            return unexpected(error{error_code::invalid_job_state, "stream already closed"});
        }
        errno = 0;
        file_.flush();
        file_.close();
        if (file_.fail()) {
            auto err = last_errno_error(error_code::storage_write_failed,
                                        "flush failed: " + target_.string());
            discard();
            return unexpected(err);
        }

        std::error_code ec;
        std::filesystem::rename(temp_, target_, ec);
        if (ec) {
            discard();
            return unexpected(map_filesystem_error(ec, "rename failed: " + target_.string()));
        }
        done_ = true;

        write_result res;
        res.checksum = hasher_.finalize();
        res.bytes_written = bytes_;
        return res;
    }

    auto abort() -> result<void> override {
        if (!done_) {
            discard();
        }
        return {};
    }

    auto bytes_written() const -> uint64_t override { return bytes_; }

private:
    void discard() {
        done_ = true;
        if (file_.is_open()) {
            file_.close();
        }
        std::error_code ec;
        std::filesystem::remove(temp_, ec);
    }

    std::filesystem::path target_;
    std::filesystem::path temp_;
    std::ofstream file_;
    streaming_checksum hasher_;
    uint64_t bytes_ = 0;
    bool done_ = false;
};

}  // namespace

// ============================================================================
// local_storage_config
// ============================================================================

auto local_storage_config::from(const storage_config& config) -> result<local_storage_config> {
    auto root = config.find("root");
    if (root == config.end() || root->second.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "local storage requires a 'root' setting"});
    }

    local_storage_config cfg;
    cfg.root = root->second;

    auto prefix = config.find("key_prefix");
    if (prefix != config.end() && !prefix->second.empty()) {
        auto valid = local_storage_backend::validate_key(prefix->second);
        if (!valid) {
            return unexpected(error{error_code::invalid_configuration,
                                    "invalid key_prefix: " + valid.error().message});
        }
        cfg.key_prefix = prefix->second;
    }

    auto create = config.find("create_root");
    if (create != config.end()) {
        cfg.create_root = create->second != "false";
    }
    return cfg;
}

// ============================================================================
// local_storage_backend
// ============================================================================

struct local_storage_backend::impl {
    local_storage_config config;
    std::filesystem::path base;
    std::string display_name;
};

local_storage_backend::local_storage_backend(local_storage_config config)
    : impl_(std::make_unique<impl>()) {
    impl_->base = config.key_prefix.empty() ? config.root : config.root / config.key_prefix;
    impl_->display_name = "local:" + impl_->base.string();
    impl_->config = std::move(config);
}

local_storage_backend::~local_storage_backend() = default;

auto local_storage_backend::create(local_storage_config config)
    -> std::unique_ptr<local_storage_backend> {
    return std::unique_ptr<local_storage_backend>(new local_storage_backend(std::move(config)));
}

auto local_storage_backend::provider() const -> storage_provider {
    return storage_provider::local;
}

auto local_storage_backend::name() const -> std::string_view {
    return impl_->display_name;
}

auto local_storage_backend::connect() -> result<void> {
    std::error_code ec;
    if (std::filesystem::is_directory(impl_->base, ec)) {
        return {};
    }
    if (!impl_->config.create_root) {
        return unexpected(error{error_code::connection_failed,
                                "storage root does not exist: " + impl_->base.string()});
    }
    std::filesystem::create_directories(impl_->base, ec);
    if (ec) {
        SM_LOG_ERROR(log_category::storage,
            "Failed to create storage root " + impl_->base.string() + ": " + ec.message());
        return unexpected(map_filesystem_error(ec, "cannot create storage root"));
    }
    return {};
}

auto local_storage_backend::validate_key(std::string_view key) -> result<void> {
    if (key.empty()) {
        return unexpected(error{error_code::invalid_object_key, "empty key"});
    }
    if (key.front() == '/' || key.find('\\') != std::string_view::npos ||
        key.find('\0') != std::string_view::npos) {
        return unexpected(error{error_code::invalid_object_key,
                                "invalid key: " + std::string(key)});
    }

    std::size_t start = 0;
    while (start <= key.size()) {
        auto end = key.find('/', start);
        if (end == std::string_view::npos) {
            end = key.size();
        }
        auto segment = key.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return unexpected(error{error_code::invalid_object_key,
                                    "invalid key segment in: " + std::string(key)});
        }
        start = end + 1;
    }
    return {};
}

auto local_storage_backend::path_for(const std::string& key) const
    -> result<std::filesystem::path> {
    auto valid = validate_key(key);
    if (!valid) {
        return unexpected(valid.error());
    }
    return impl_->base / std::filesystem::path(key);
}

auto local_storage_backend::list(const list_storage_options& options)
    -> result<list_storage_result> {
    list_storage_result res;

    std::error_code ec;
    if (!std::filesystem::exists(impl_->base, ec)) {
        return res;
    }

    const auto limit = std::max<std::size_t>(options.max_results, 1);

    // One extra entry tells whether the page is truncated
    sorted_walk walk{options.prefix, options.continuation_token, limit + 1, {}};
    auto walked = walk_sorted(impl_->base, "", walk);
    if (!walked) {
        return unexpected(walked.error());
    }

    res.objects = std::move(walk.found);
    if (res.objects.size() > limit) {
        res.objects.pop_back();
        res.is_truncated = true;
        res.continuation_token = res.objects.back().key;
    }
    return res;
}

auto local_storage_backend::open_read(const std::string& key)
    -> result<std::unique_ptr<object_read_stream>> {
    auto path = path_for(key);
    if (!path) {
        return unexpected(path.error());
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path.value(), ec);
    if (ec) {
        return unexpected(map_filesystem_error(ec, "cannot stat " + key));
    }

    errno = 0;
    std::ifstream file(path.value(), std::ios::binary);
    if (!file) {
        return unexpected(last_errno_error(error_code::storage_read_failed,
                                           "cannot open " + key));
    }

    return std::unique_ptr<object_read_stream>(
        std::make_unique<local_read_stream>(std::move(file), size, key));
}

auto local_storage_backend::open_write(const std::string& key, uint64_t /*expected_size*/)
    -> result<std::unique_ptr<object_write_stream>> {
    auto path = path_for(key);
    if (!path) {
        return unexpected(path.error());
    }

    const auto& target = path.value();
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return unexpected(map_filesystem_error(ec, "cannot create directory for " + key));
    }

    auto temp = target.parent_path() /
                ("." + target.filename().string() + "." + random_suffix() +
                 std::string(partial_suffix));

    errno = 0;
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected(last_errno_error(error_code::storage_write_failed,
                                           "cannot open for writing: " + key));
    }

    return std::unique_ptr<object_write_stream>(
        std::make_unique<local_write_stream>(target, std::move(temp), std::move(file)));
}

auto local_storage_backend::remove(const std::string& key) -> result<void> {
    auto path = path_for(key);
    if (!path) {
        return unexpected(path.error());
    }

    std::error_code ec;
    if (!std::filesystem::remove(path.value(), ec)) {
        if (ec) {
            return unexpected(map_filesystem_error(ec, "cannot remove " + key));
        }
        return unexpected(error{error_code::object_not_found, "object not found: " + key});
    }
    return {};
}

auto local_storage_backend::exists(const std::string& key) -> result<bool> {
    auto path = path_for(key);
    if (!path) {
        return unexpected(path.error());
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(path.value(), ec);
}

}  // namespace kcenon::storage_migration
