/**
 * @file workspace_config_store.cpp
 * @brief Implementation of the workspace configuration store
 */

#include "kcenon/storage_migration/migration/workspace_config_store.h"

#include "kcenon/storage_migration/core/checksum.h"
#include "kcenon/storage_migration/core/json_utils.h"
#include "kcenon/storage_migration/core/logging.h"
#include "kcenon/storage_migration/migration/job_store.h"
#include "kcenon/storage_migration/security/config_cipher.h"

#include <fstream>
#include <iterator>
#include <mutex>

namespace kcenon::storage_migration {

namespace {

constexpr uint64_t format_version = 1;

}  // namespace

struct workspace_config_store::impl {
    std::filesystem::path directory;
    std::shared_ptr<const config_cipher> cipher;
    mutable std::mutex mutex;

    [[nodiscard]] auto path_for(const std::string& workspace_id) const -> std::filesystem::path {
        return directory / (workspace_id + ".json");
    }

    [[nodiscard]] auto serialize(const workspace_storage_config& entry) const
        -> result<std::string> {
        json::object_writer writer;
        writer.add("format_version", format_version)
            .add("workspace_id", entry.workspace_id)
            .add("provider", entry.provider)
            .add("fingerprint", entry.fingerprint)
            .add("updated_at", json::time_point_to_int64(entry.updated_at));
        if (entry.cutover_job_id) {
            writer.add("cutover_job_id", entry.cutover_job_id->to_string());
        }

        auto plain = json::serialize_string_map(entry.config);
        if (cipher) {
            auto sealed = cipher->seal(plain, entry.workspace_id);
            if (!sealed) {
                return unexpected(sealed.error());
            }
            writer.add("config_sealed", sealed.value());
        } else {
            writer.add_raw("config", plain);
        }
        return writer.str();
    }

    [[nodiscard]] auto parse(const std::string& workspace_id, const std::string& text) const
        -> result<workspace_storage_config> {
        auto m = json::parse_object(text);
        if (!m) {
            return unexpected(error{error_code::state_corrupted,
                                    "storage configuration of " + workspace_id + " is malformed"});
        }

        workspace_storage_config entry;
        entry.workspace_id = json::get_string(*m, "workspace_id");
        entry.provider = json::get_string(*m, "provider");
        entry.fingerprint = json::get_string(*m, "fingerprint");
        entry.updated_at = json::int64_to_time_point(json::get_int(*m, "updated_at"));
        if (auto it = m->find("cutover_job_id"); it != m->end()) {
            entry.cutover_job_id = job_id::from_string(it->second);
        }

        std::string plain;
        if (auto sealed = m->find("config_sealed"); sealed != m->end()) {
            if (!cipher) {
                return unexpected(error{error_code::decryption_failed,
                                        "configuration of " + workspace_id +
                                            " is sealed but no encryption key is configured"});
            }
            auto opened = cipher->open(sealed->second, workspace_id);
            if (!opened) {
                return unexpected(opened.error());
            }
            plain = std::move(opened.value());
        } else if (auto raw = m->find("config"); raw != m->end()) {
            plain = raw->second;
        }

        if (!plain.empty()) {
            auto config = json::parse_string_map(plain);
            if (!config) {
                return unexpected(error{error_code::state_corrupted,
                                        "config of " + workspace_id + " is malformed"});
            }
            entry.config = std::move(*config);
        }
        return entry;
    }
};

workspace_config_store::workspace_config_store(std::filesystem::path directory,
                                               std::shared_ptr<const config_cipher> cipher)
    : impl_(std::make_unique<impl>()) {
    impl_->directory = std::move(directory);
    impl_->cipher = std::move(cipher);
}

workspace_config_store::~workspace_config_store() = default;

auto workspace_config_store::open(const std::filesystem::path& state_directory,
                                  std::shared_ptr<const config_cipher> cipher)
    -> result<std::unique_ptr<workspace_config_store>> {
    auto directory = state_directory / "workspace_configs";
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return unexpected(error{error_code::state_write_failed,
                                "cannot create " + directory.string() + ": " + ec.message()});
    }
    return std::unique_ptr<workspace_config_store>(
        new workspace_config_store(std::move(directory), std::move(cipher)));
}

auto workspace_config_store::fingerprint(const std::string& provider,
                                         const storage_config& config) -> std::string {
    return checksum::sha256(provider + "\n" + json::serialize_string_map(config));
}

auto workspace_config_store::get(const std::string& workspace_id) const
    -> result<workspace_storage_config> {
    auto valid = job_store::validate_workspace_id(workspace_id);
    if (!valid) {
        return unexpected(valid.error());
    }

    std::lock_guard lock(impl_->mutex);
    auto path = impl_->path_for(workspace_id);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return unexpected(error{error_code::object_not_found,
                                "workspace " + workspace_id + " has no storage configuration"});
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return unexpected(error{error_code::state_read_failed, "cannot read " + path.string()});
    }
    return impl_->parse(workspace_id, text);
}

auto workspace_config_store::put(const std::string& workspace_id, const std::string& provider,
                                 const storage_config& config,
                                 const std::optional<job_id>& cutover_job_id)
    -> result<workspace_storage_config> {
    auto valid = job_store::validate_workspace_id(workspace_id);
    if (!valid) {
        return unexpected(valid.error());
    }
    if (provider.empty()) {
        return unexpected(error{error_code::invalid_argument, "provider must not be empty"});
    }

    workspace_storage_config entry;
    entry.workspace_id = workspace_id;
    entry.provider = provider;
    entry.config = config;
    entry.fingerprint = fingerprint(provider, config);
    entry.cutover_job_id = cutover_job_id;
    entry.updated_at = std::chrono::system_clock::now();

    auto text = impl_->serialize(entry);
    if (!text) {
        return unexpected(text.error());
    }

    std::lock_guard lock(impl_->mutex);
    auto path = impl_->path_for(workspace_id);
    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error{error_code::state_write_failed,
                                    "cannot open " + temp.string()});
        }
        out << text.value() << '\n';
        out.flush();
        if (!out) {
            return unexpected(error{error_code::state_write_failed,
                                    "cannot write " + temp.string()});
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        return unexpected(error{error_code::state_write_failed,
                                "cannot replace " + path.string() + ": " + ec.message()});
    }

    SM_LOG_INFO(log_category::cutover,
        "Workspace " + workspace_id + " now uses " + provider + " " + redact_config(config));
    return entry;
}

}  // namespace kcenon::storage_migration
