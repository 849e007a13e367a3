#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace compass::config {

struct StorageConfig {
    std::filesystem::path data_dir = "data";
    std::string problems_file = "problems.json";
    std::string contests_file = "contests.json";
    std::string solutions_dir = "solutions";

    [[nodiscard]] std::filesystem::path problemsPath() const { return data_dir / problems_file; }
    [[nodiscard]] std::filesystem::path contestsPath() const { return data_dir / contests_file; }
    [[nodiscard]] std::filesystem::path solutionsPath() const { return data_dir / solutions_dir; }
};

struct SyncConfig {
    std::string git_binary = "git";
    std::string remote_name = "origin";
    std::string default_branch = "main";
    std::filesystem::path config_cache = ".git_config.json";
    unsigned int command_timeout_seconds = 120;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum compass = spdlog::level::info;
    spdlog::level::level_enum storage = spdlog::level::info;
    spdlog::level::level_enum sync = spdlog::level::info;
    spdlog::level::level_enum config = spdlog::level::info;
    spdlog::level::level_enum shell = spdlog::level::warn;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "logs";
    spdlog::level::level_enum console_level = spdlog::level::warn;
    spdlog::level::level_enum file_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    StorageConfig storage;
    SyncConfig sync;
    LoggingConfig logging;
};

// Missing sections and keys fall back to the defaults above.
Config loadConfig(const std::filesystem::path& path);

// Relative paths in the loaded config are resolved against base.
void resolvePaths(Config& cfg, const std::filesystem::path& base);

}
