/**
 * @file resume_migration.cpp
 * @brief Pause, resume and crash recovery of a migration job
 *
 * This example demonstrates:
 * - Pausing a running job and resuming it later
 * - Stopping the engine with a job still running
 * - Taking the job over from a second engine with recover_jobs()
 */

#include <kcenon/storage_migration/storage_migration.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

using namespace kcenon::storage_migration;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Create a directory of test objects
 */
void create_objects(const std::filesystem::path& dir, std::size_t count, std::size_t size) {
    std::filesystem::create_directories(dir);
    std::vector<char> buffer(size);
    for (std::size_t i = 0; i < count; ++i) {
        for (std::size_t j = 0; j < size; ++j) {
            buffer[j] = static_cast<char>('a' + ((i + j) % 26));
        }
        std::ofstream file(dir / ("object-" + std::to_string(i) + ".bin"), std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to create object in " + dir.string());
        }
        file.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    }
}

auto open_engine(const std::filesystem::path& state_dir, const std::string& owner)
    -> std::optional<migration_coordinator> {
    auto config = engine_config_builder()
        .with_state_directory(state_dir)
        .with_concurrency(2)
        .build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return std::nullopt;
    }

    auto coordinator = migration_coordinator::builder()
        .with_config(config.value())
        .with_owner_id(owner)
        .build();
    if (!coordinator) {
        std::cerr << "Failed to open engine: " << coordinator.error().message << std::endl;
        return std::nullopt;
    }
    return std::move(coordinator.value());
}

void report(const char* label, const migration_job& job) {
    std::cout << label << ": " << to_string(job.status) << ", "
              << job.migrated_files << "/" << job.total_files << " files" << std::endl;
}

}  // namespace

int main() {
    const auto base = std::filesystem::temp_directory_path() / "storage-migration-resume";
    std::filesystem::remove_all(base);
    create_objects(base / "source", 200, 256 * 1024);

    std::optional<job_id> id;
    {
        auto engine = open_engine(base / "state", "engine-a");
        if (!engine) {
            return 1;
        }

        if (auto set = engine->set_workspace_storage("demo", "local",
                                                     {{"root", (base / "source").string()}});
            !set) {
            std::cerr << set.error().message << std::endl;
            return 1;
        }

        auto started = engine->start_migration(
            {"demo", "local", {{"root", (base / "target").string()}}, std::nullopt});
        if (!started) {
            std::cerr << "Failed to start: " << started.error().message << std::endl;
            return 1;
        }
        id = started.value();

        std::this_thread::sleep_for(50ms);
        if (auto paused = engine->pause_migration(*id); !paused) {
            std::cout << "Pause not applied: " << paused.error().message << std::endl;
        }

        auto after_pause = engine->wait_for_terminal(*id, 30s);
        if (after_pause) {
            report("After pause", after_pause.value());
        }

        if (after_pause && after_pause.value().status == job_status::paused) {
            if (auto resumed = engine->resume_migration(*id); !resumed) {
                std::cerr << "Resume failed: " << resumed.error().message << std::endl;
                return 1;
            }
            std::this_thread::sleep_for(50ms);
        }

        // Leaves the job in_progress without an owner
        engine->shutdown();
        report("After shutdown", engine->get_progress(*id).value());
    }

    auto successor = open_engine(base / "state", "engine-b");
    if (!successor) {
        return 1;
    }

    auto recovered = successor->recover_jobs();
    if (!recovered) {
        std::cerr << "Recovery failed: " << recovered.error().message << std::endl;
        return 1;
    }
    std::cout << "Recovered " << recovered.value() << " job(s)" << std::endl;

    auto job = successor->wait_for_terminal(*id, 5min);
    if (!job) {
        std::cerr << job.error().message << std::endl;
        return 1;
    }
    report("Final", job.value());
    return job.value().status == job_status::completed ? 0 : 1;
}
