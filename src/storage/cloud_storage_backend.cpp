/**
 * @file cloud_storage_backend.cpp
 * @brief Implementation of the cloud client adapter
 */

#include "kcenon/storage_migration/storage/cloud_storage_backend.h"

#include "kcenon/storage_migration/core/checksum.h"
#include "kcenon/storage_migration/core/logging.h"

namespace kcenon::storage_migration {

namespace {

class cloud_read_stream : public object_read_stream {
public:
    explicit cloud_read_stream(std::unique_ptr<cloud_download_stream> stream)
        : stream_(std::move(stream)) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (buffer.empty() || !stream_->has_more()) {
            return std::size_t{0};
        }
        return stream_->read(buffer);
    }

    auto size() const -> uint64_t override { return stream_->total_size(); }

    auto checksum() const -> std::optional<std::string> override {
        return stream_->metadata().sha256;
    }

private:
    std::unique_ptr<cloud_download_stream> stream_;
};

class cloud_write_stream : public object_write_stream {
public:
    explicit cloud_write_stream(std::unique_ptr<cloud_upload_stream> stream)
        : stream_(std::move(stream)) {}

    ~cloud_write_stream() override {
        if (!done_) {
            auto aborted = stream_->abort();
            if (!aborted) {
                SM_LOG_WARN(log_category::storage,
                    "Failed to abort upload: " + aborted.error().message);
            }
        }
    }

    auto write(std::span<const std::byte> data) -> result<void> override {
        while (!data.empty()) {
            auto accepted = stream_->write(data);
            if (!accepted) {
                return unexpected(accepted.error());
            }
            if (accepted.value() == 0) {
                return unexpected(error{error_code::storage_write_failed,
                                        "upload stream accepted no data"});
            }
            hasher_.update(data.first(accepted.value()));
            data = data.subspan(accepted.value());
        }
        return {};
    }

    auto finalize() -> result<write_result> override {
        done_ = true;
        auto uploaded = stream_->finalize();
        if (!uploaded) {
            return unexpected(uploaded.error());
        }

        write_result res;
        res.bytes_written = uploaded.value().bytes_uploaded;
        res.checksum = uploaded.value().sha256 ? *uploaded.value().sha256 : hasher_.finalize();
        return res;
    }

    auto abort() -> result<void> override {
        if (done_) {
            return {};
        }
        done_ = true;
        return stream_->abort();
    }

    auto bytes_written() const -> uint64_t override { return stream_->bytes_written(); }

private:
    std::unique_ptr<cloud_upload_stream> stream_;
    streaming_checksum hasher_;
    bool done_ = false;
};

}  // namespace

struct cloud_storage_backend::impl {
    std::unique_ptr<cloud_storage_interface> client;
    std::string display_name;
};

cloud_storage_backend::cloud_storage_backend(std::unique_ptr<cloud_storage_interface> client)
    : impl_(std::make_unique<impl>()) {
    impl_->display_name = std::string(client->provider_name());
    impl_->client = std::move(client);
}

cloud_storage_backend::~cloud_storage_backend() = default;

auto cloud_storage_backend::create(std::unique_ptr<cloud_storage_interface> client)
    -> std::unique_ptr<cloud_storage_backend> {
    if (!client) {
        return nullptr;
    }
    return std::unique_ptr<cloud_storage_backend>(new cloud_storage_backend(std::move(client)));
}

auto cloud_storage_backend::provider() const -> storage_provider {
    return impl_->client->provider();
}

auto cloud_storage_backend::name() const -> std::string_view {
    return impl_->display_name;
}

auto cloud_storage_backend::client() -> cloud_storage_interface& {
    return *impl_->client;
}

auto cloud_storage_backend::connect() -> result<void> {
    if (impl_->client->is_connected()) {
        return {};
    }
    auto res = impl_->client->connect();
    if (!res) {
        SM_LOG_ERROR(log_category::storage,
            "Connect to " + impl_->display_name + " failed: " + res.error().message);
    }
    return res;
}

auto cloud_storage_backend::list(const list_storage_options& options)
    -> result<list_storage_result> {
    list_objects_options cloud_options;
    if (!options.prefix.empty()) {
        cloud_options.prefix = options.prefix;
    }
    cloud_options.max_keys = options.max_results;
    cloud_options.continuation_token = options.continuation_token;

    auto page = impl_->client->list_objects(cloud_options);
    if (!page) {
        return unexpected(page.error());
    }

    list_storage_result res;
    res.objects.reserve(page.value().objects.size());
    for (auto& object : page.value().objects) {
        if (object.is_directory) {
            continue;
        }
        res.objects.push_back(storage_object{std::move(object.key), object.size});
    }
    res.is_truncated = page.value().is_truncated;
    res.continuation_token = std::move(page.value().continuation_token);
    return res;
}

auto cloud_storage_backend::open_read(const std::string& key)
    -> result<std::unique_ptr<object_read_stream>> {
    auto stream = impl_->client->create_download_stream(key);
    if (!stream) {
        return unexpected(stream.error());
    }
    return std::unique_ptr<object_read_stream>(
        std::make_unique<cloud_read_stream>(std::move(stream.value())));
}

auto cloud_storage_backend::open_write(const std::string& key, uint64_t expected_size)
    -> result<std::unique_ptr<object_write_stream>> {
    auto stream = impl_->client->create_upload_stream(key, expected_size);
    if (!stream) {
        return unexpected(stream.error());
    }
    return std::unique_ptr<object_write_stream>(
        std::make_unique<cloud_write_stream>(std::move(stream.value())));
}

auto cloud_storage_backend::remove(const std::string& key) -> result<void> {
    return impl_->client->delete_object(key);
}

auto cloud_storage_backend::exists(const std::string& key) -> result<bool> {
    return impl_->client->exists(key);
}

}  // namespace kcenon::storage_migration
