/**
 * @file json_utils.h
 * @brief Minimal JSON helpers for state files (no external library)
 *
 * State files written by the job store and the workspace configuration
 * store are flat objects whose values are strings, numbers, booleans or
 * one level of nested string maps. These helpers cover exactly that shape.
 */

#ifndef KCENON_STORAGE_MIGRATION_CORE_JSON_UTILS_H
#define KCENON_STORAGE_MIGRATION_CORE_JSON_UTILS_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace kcenon::storage_migration::json {

/**
 * @brief Escape a string for inclusion between JSON quotes
 */
[[nodiscard]] auto escape(std::string_view input) -> std::string;

/**
 * @brief Reverse of escape(); \\uXXXX sequences are decoded as UTF-8
 */
[[nodiscard]] auto unescape(std::string_view input) -> std::string;

/**
 * @brief Top-level members of a JSON object
 *
 * String values are unescaped; any other value (number, literal, nested
 * object or array) is kept as its raw text.
 */
using members = std::map<std::string, std::string>;

/**
 * @brief Parse the top-level members of a JSON object
 * @return nullopt if the text is not a well-formed object
 */
[[nodiscard]] auto parse_object(std::string_view text) -> std::optional<members>;

/**
 * @brief Serialize a string map as a JSON object
 */
[[nodiscard]] auto serialize_string_map(const std::map<std::string, std::string>& values)
    -> std::string;

/**
 * @brief Parse a JSON object whose values are all strings
 */
[[nodiscard]] auto parse_string_map(std::string_view text)
    -> std::optional<std::map<std::string, std::string>>;

[[nodiscard]] inline auto time_point_to_int64(std::chrono::system_clock::time_point tp)
    -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

[[nodiscard]] inline auto int64_to_time_point(int64_t ms)
    -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

/**
 * @brief Builder for a single-line JSON object
 */
class object_writer {
public:
    auto add(std::string_view key, std::string_view value) -> object_writer& {
        begin(key);
        oss_ << '"' << escape(value) << '"';
        return *this;
    }

    auto add(std::string_view key, const char* value) -> object_writer& {
        return add(key, std::string_view(value));
    }

    auto add(std::string_view key, uint64_t value) -> object_writer& {
        begin(key);
        oss_ << value;
        return *this;
    }

    auto add(std::string_view key, int64_t value) -> object_writer& {
        begin(key);
        oss_ << value;
        return *this;
    }

    auto add(std::string_view key, bool value) -> object_writer& {
        begin(key);
        oss_ << (value ? "true" : "false");
        return *this;
    }

    /**
     * @brief Add a value that is already valid JSON text
     */
    auto add_raw(std::string_view key, std::string_view raw) -> object_writer& {
        begin(key);
        oss_ << raw;
        return *this;
    }

    [[nodiscard]] auto str() const -> std::string {
        return first_ ? std::string("{}") : oss_.str() + "}";
    }

private:
    void begin(std::string_view key) {
        oss_ << (first_ ? "{" : ",") << '"' << escape(key) << "\":";
        first_ = false;
    }

    std::ostringstream oss_;
    bool first_ = true;
};

/**
 * @brief Read an unsigned integer member, falling back to @p fallback
 */
[[nodiscard]] auto get_uint(const members& m, const std::string& key, uint64_t fallback = 0)
    -> uint64_t;

/**
 * @brief Read a signed integer member, falling back to @p fallback
 */
[[nodiscard]] auto get_int(const members& m, const std::string& key, int64_t fallback = 0)
    -> int64_t;

/**
 * @brief Read a boolean member, falling back to @p fallback
 */
[[nodiscard]] auto get_bool(const members& m, const std::string& key, bool fallback = false)
    -> bool;

/**
 * @brief Read a string member, empty if missing
 */
[[nodiscard]] auto get_string(const members& m, const std::string& key) -> std::string;

}  // namespace kcenon::storage_migration::json

#endif  // KCENON_STORAGE_MIGRATION_CORE_JSON_UTILS_H
