/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>
#include <stdexcept>

namespace kcenon::storage_migration::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

// ============================================================================
// temp_object_tree
// ============================================================================

temp_object_tree::temp_object_tree(const std::string& name)
    : root_(std::filesystem::temp_directory_path() / ("storage_migration_bench_" + name)) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
}

temp_object_tree::~temp_object_tree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

void temp_object_tree::populate(const std::string& subdir, std::size_t count,
                                std::size_t size, uint32_t seed) {
    auto dir = sub(subdir);
    std::filesystem::create_directories(dir);

    auto data = generate_random_data(size, seed);
    for (std::size_t i = 0; i < count; ++i) {
        // Vary the first bytes so objects differ
        if (!data.empty()) {
            data[0] = static_cast<std::byte>(i & 0xff);
        }
        std::ofstream file(dir / ("object-" + std::to_string(i)), std::ios::binary);
        if (!file) {
            throw std::runtime_error("cannot create benchmark object in " + dir.string());
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    }
}

auto temp_object_tree::path() const -> const std::filesystem::path& {
    return root_;
}

auto temp_object_tree::sub(const std::string& name) const -> std::filesystem::path {
    return root_ / name;
}

void temp_object_tree::clear(const std::string& subdir) {
    std::error_code ec;
    std::filesystem::remove_all(sub(subdir), ec);
}

}  // namespace kcenon::storage_migration::benchmark
