/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_STORAGE_MIGRATION_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_STORAGE_MIGRATION_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::storage_migration::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Temporary directory holding a tree of benchmark objects
 *
 * Removed with its contents on destruction.
 */
class temp_object_tree {
public:
    /**
     * @param name Directory name below the system temporary directory
     */
    explicit temp_object_tree(const std::string& name);
    ~temp_object_tree();

    temp_object_tree(const temp_object_tree&) = delete;
    auto operator=(const temp_object_tree&) -> temp_object_tree& = delete;

    /**
     * @brief Write @p count objects of @p size bytes under @p subdir
     */
    void populate(const std::string& subdir, std::size_t count, std::size_t size,
                  uint32_t seed = 42);

    [[nodiscard]] auto path() const -> const std::filesystem::path&;

    [[nodiscard]] auto sub(const std::string& name) const -> std::filesystem::path;

    /**
     * @brief Remove a subdirectory, keeping the tree
     */
    void clear(const std::string& subdir);

private:
    std::filesystem::path root_;
};

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_object = 4 * KB;
constexpr std::size_t medium_object = 256 * KB;
constexpr std::size_t large_object = 8 * MB;
}  // namespace sizes

}  // namespace kcenon::storage_migration::benchmark

#endif  // KCENON_STORAGE_MIGRATION_BENCHMARKS_BENCHMARK_HELPERS_H
