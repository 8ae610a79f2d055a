/**
 * @file scope_report.cpp
 * @brief Estimate the size and duration of a migration without starting one
 *
 * Usage: scope_report <dir> [prefix] [assumed MB/s]
 */

#include <kcenon/storage_migration/migration/scope_calculator.h>
#include <kcenon/storage_migration/storage/local_storage_backend.h>

#include <cstdlib>
#include <iostream>

using namespace kcenon::storage_migration;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <dir> [prefix] [assumed MB/s]" << std::endl;
        return 1;
    }

    local_storage_config config;
    config.root = argv[1];
    config.create_root = false;

    const std::string prefix = argc > 2 ? argv[2] : "";

    scope_calculator::settings settings;
    if (argc > 3) {
        auto mb_per_second = std::strtoull(argv[3], nullptr, 10);
        if (mb_per_second == 0) {
            std::cerr << "Throughput must be a positive number" << std::endl;
            return 1;
        }
        settings.assumed_throughput_bytes_per_second = mb_per_second * 1024 * 1024;
    }

    auto backend = local_storage_backend::create(config);
    if (auto connected = backend->connect(); !connected) {
        std::cerr << "Cannot open " << config.root << ": "
                  << connected.error().message << std::endl;
        return 1;
    }

    scope_calculator calculator(settings);
    auto scope = calculator.calculate(*backend, prefix);
    if (!scope) {
        std::cerr << "Listing failed: " << scope.error().message << std::endl;
        return 1;
    }

    std::cout << "Objects:  " << scope.value().file_count << std::endl;
    std::cout << "Size:     " << scope.value().formatted_size
              << " (" << scope.value().total_bytes << " bytes)" << std::endl;
    std::cout << "Duration: " << scope.value().formatted_duration << std::endl;
    return 0;
}
