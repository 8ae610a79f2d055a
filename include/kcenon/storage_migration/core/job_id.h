/**
 * @file job_id.h
 * @brief Unique identifier for migration jobs and coordinator instances
 */

#ifndef KCENON_STORAGE_MIGRATION_CORE_JOB_ID_H
#define KCENON_STORAGE_MIGRATION_CORE_JOB_ID_H

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::storage_migration {

/**
 * @brief 128-bit random identifier (RFC 4122 version 4 UUID)
 */
struct job_id {
    std::array<uint8_t, 16> bytes{};

    job_id() = default;

    /**
     * @brief Generate a new random identifier
     */
    [[nodiscard]] static auto generate() -> job_id;

    /**
     * @brief Parse the canonical 8-4-4-4-12 form (dashes optional)
     */
    [[nodiscard]] static auto from_string(std::string_view str) -> std::optional<job_id>;

    /**
     * @brief Format as xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto is_null() const noexcept -> bool {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] auto operator==(const job_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const job_id& other) const -> bool {
        return bytes < other.bytes;
    }
};

}  // namespace kcenon::storage_migration

template <>
struct std::hash<kcenon::storage_migration::job_id> {
    auto operator()(const kcenon::storage_migration::job_id& id) const noexcept -> std::size_t {
        std::size_t h = 0;
        for (auto b : id.bytes) {
            h = h * 31 + b;
        }
        return h;
    }
};

#endif  // KCENON_STORAGE_MIGRATION_CORE_JOB_ID_H
