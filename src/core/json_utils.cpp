/**
 * @file json_utils.cpp
 * @brief Minimal JSON helpers for state files
 */

#include <kcenon/storage_migration/core/json_utils.h>

#include <cctype>
#include <cstdio>
#include <exception>

namespace kcenon::storage_migration::json {

namespace {

void append_utf8(std::string& out, unsigned int code) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

void skip_whitespace(std::string_view text, std::size_t& pos) {
    while (pos < text.size() &&
           std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
}

// Advances past a quoted string starting at text[pos] == '"'.
auto scan_string(std::string_view text, std::size_t& pos) -> bool {
    ++pos;
    while (pos < text.size()) {
        if (text[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (text[pos] == '"') {
            ++pos;
            return true;
        }
        ++pos;
    }
    return false;
}

// Advances past any value; nested containers are skipped as a balanced unit.
auto scan_value(std::string_view text, std::size_t& pos) -> bool {
    if (pos >= text.size()) {
        return false;
    }
    if (text[pos] == '"') {
        return scan_string(text, pos);
    }
    if (text[pos] == '{' || text[pos] == '[') {
        int depth = 0;
        while (pos < text.size()) {
            char c = text[pos];
            if (c == '"') {
                if (!scan_string(text, pos)) return false;
                continue;
            }
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
                if (depth == 0) {
                    ++pos;
                    return true;
                }
            }
            ++pos;
        }
        return false;
    }
    auto start = pos;
    while (pos < text.size() && text[pos] != ',' && text[pos] != '}' &&
           !std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos > start;
}

}  // namespace

auto escape(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto unescape(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '\\' || i + 1 >= input.size()) {
            result += input[i];
            continue;
        }
        switch (input[i + 1]) {
            case '"': result += '"'; ++i; break;
            case '\\': result += '\\'; ++i; break;
            case '/': result += '/'; ++i; break;
            case 'b': result += '\b'; ++i; break;
            case 'f': result += '\f'; ++i; break;
            case 'n': result += '\n'; ++i; break;
            case 'r': result += '\r'; ++i; break;
            case 't': result += '\t'; ++i; break;
            case 'u':
                if (i + 5 < input.size()) {
                    auto hex = std::string(input.substr(i + 2, 4));
                    try {
                        append_utf8(result, static_cast<unsigned int>(std::stoul(hex, nullptr, 16)));
                    } catch (const std::exception&) {
                        result += '?';
                    }
                    i += 5;
                }
                break;
            default: result += input[i]; break;
        }
    }
    return result;
}

auto parse_object(std::string_view text) -> std::optional<members> {
    std::size_t pos = 0;
    skip_whitespace(text, pos);
    if (pos >= text.size() || text[pos] != '{') {
        return std::nullopt;
    }
    ++pos;

    members result;
    skip_whitespace(text, pos);
    if (pos < text.size() && text[pos] == '}') {
        return result;
    }

    while (pos < text.size()) {
        skip_whitespace(text, pos);
        if (pos >= text.size() || text[pos] != '"') {
            return std::nullopt;
        }
        auto key_start = pos;
        if (!scan_string(text, pos)) {
            return std::nullopt;
        }
        auto key = unescape(text.substr(key_start + 1, pos - key_start - 2));

        skip_whitespace(text, pos);
        if (pos >= text.size() || text[pos] != ':') {
            return std::nullopt;
        }
        ++pos;
        skip_whitespace(text, pos);

        auto value_start = pos;
        if (!scan_value(text, pos)) {
            return std::nullopt;
        }
        auto raw = text.substr(value_start, pos - value_start);
        if (!raw.empty() && raw.front() == '"') {
            result[key] = unescape(raw.substr(1, raw.size() - 2));
        } else {
            result[key] = std::string(raw);
        }

        skip_whitespace(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == '}') {
            return result;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

auto serialize_string_map(const std::map<std::string, std::string>& values)
    -> std::string {
    if (values.empty()) {
        return "{}";
    }
    object_writer writer;
    for (const auto& [key, value] : values) {
        writer.add(key, value);
    }
    return writer.str();
}

auto parse_string_map(std::string_view text)
    -> std::optional<std::map<std::string, std::string>> {
    return parse_object(text);
}

auto get_uint(const members& m, const std::string& key, uint64_t fallback) -> uint64_t {
    auto it = m.find(key);
    if (it == m.end() || it->second.empty()) {
        return fallback;
    }
    try {
        return std::stoull(it->second);
    } catch (const std::exception&) {
        return fallback;
    }
}

auto get_int(const members& m, const std::string& key, int64_t fallback) -> int64_t {
    auto it = m.find(key);
    if (it == m.end() || it->second.empty()) {
        return fallback;
    }
    try {
        return std::stoll(it->second);
    } catch (const std::exception&) {
        return fallback;
    }
}

auto get_bool(const members& m, const std::string& key, bool fallback) -> bool {
    auto it = m.find(key);
    if (it == m.end()) {
        return fallback;
    }
    if (it->second == "true") return true;
    if (it->second == "false") return false;
    return fallback;
}

auto get_string(const members& m, const std::string& key) -> std::string {
    auto it = m.find(key);
    return it == m.end() ? std::string{} : it->second;
}

}  // namespace kcenon::storage_migration::json
