/**
 * @file local_migration.cpp
 * @brief Migrate a workspace between two local directories and switch it over
 *
 * This example demonstrates:
 * - Registering the workspace's current storage
 * - Calculating the scope before starting
 * - Following progress through the listener
 * - Completing the migration with a cutover
 *
 * Usage: local_migration <source_dir> <target_dir> [state_dir]
 */

#include <kcenon/storage_migration/storage_migration.h>
#include <kcenon/storage_migration/migration/scope_calculator.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>

using namespace kcenon::storage_migration;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <source_dir> <target_dir> [state_dir]\n"
              << "\n"
              << "Copies every object under <source_dir> to <target_dir>, verifies\n"
              << "the checksums and switches the workspace to the new directory.\n";
}

void print_job(const migration_job& job) {
    std::cout << "  status:    " << to_string(job.status) << "\n"
              << "  files:     " << job.migrated_files << " migrated, "
              << job.failed_files << " failed, " << job.total_files << " total\n"
              << "  bytes:     " << scope_calculator::format_size(job.migrated_bytes)
              << " of " << scope_calculator::format_size(job.total_bytes) << "\n";
    for (const auto& entry : job.errors) {
        std::cout << "  error:     " << entry.path << ": " << entry.message
                  << " (attempt " << entry.attempt << ")\n";
    }
    if (job.fatal_error) {
        std::cout << "  fatal:     " << job.fatal_error->message << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string source_dir = argv[1];
    const std::string target_dir = argv[2];
    const std::filesystem::path state_dir =
        argc > 3 ? std::filesystem::path(argv[3])
                 : std::filesystem::temp_directory_path() / "storage-migration-example";

    std::cout << "=== Local Storage Migration ===" << std::endl;
    std::cout << "Source: " << source_dir << std::endl;
    std::cout << "Target: " << target_dir << std::endl;
    std::cout << "State:  " << state_dir << std::endl << std::endl;

    auto config = engine_config_builder()
        .with_state_directory(state_dir)
        .with_concurrency(4)
        .build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    auto built = migration_coordinator::builder()
        .with_config(config.value())
        .build();
    if (!built) {
        std::cerr << "Failed to open engine: " << built.error().message << std::endl;
        return 1;
    }
    auto& coordinator = built.value();

    const std::string workspace = "example";
    auto registered = coordinator.set_workspace_storage(workspace, "local", {{"root", source_dir}});
    if (!registered) {
        std::cerr << "Failed to register source: " << registered.error().message << std::endl;
        return 1;
    }

    auto scope = coordinator.calculate_scope(workspace);
    if (!scope) {
        std::cerr << "Scope calculation failed: " << scope.error().message << std::endl;
        return 1;
    }
    std::cout << "Scope: " << scope.value().file_count << " files, "
              << scope.value().formatted_size << ", about "
              << scope.value().formatted_duration << std::endl << std::endl;

    std::mutex output_mutex;
    coordinator.on_progress([&output_mutex](const migration_job& job) {
        std::lock_guard lock(output_mutex);
        std::cout << "\r  " << std::fixed << std::setprecision(1)
                  << job.progress_percent() << "% "
                  << job.migrated_files << "/" << job.total_files << " files"
                  << std::flush;
    });

    auto id = coordinator.start_migration(
        {workspace, "local", {{"root", target_dir}, {"create_root", "true"}}, std::nullopt});
    if (!id) {
        std::cerr << "Failed to start: " << id.error().message << std::endl;
        return 1;
    }
    std::cout << "Started job " << id.value().to_string() << std::endl;

    auto job = coordinator.wait_for_terminal(id.value(), std::chrono::hours(24));
    coordinator.on_progress(nullptr);
    std::cout << std::endl << std::endl;
    if (!job) {
        std::cerr << "Wait failed: " << job.error().message << std::endl;
        return 1;
    }

    std::cout << "Job finished:" << std::endl;
    print_job(job.value());

    if (job.value().status != job_status::completed) {
        return 1;
    }

    auto cutover = coordinator.complete_migration(
        {workspace, "local", job.value().target_config, false});
    if (!cutover) {
        std::cerr << "Cutover failed: " << cutover.error().message << std::endl;
        return 1;
    }

    std::cout << std::endl << "Workspace now uses " << cutover.value().active.provider
              << " storage at " << cutover.value().active.config.at("root") << std::endl;
    return 0;
}
