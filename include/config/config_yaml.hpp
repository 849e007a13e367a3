#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace compass::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["data_dir"] = rhs.data_dir.string();
        node["problems_file"] = rhs.problems_file;
        node["contests_file"] = rhs.contests_file;
        node["solutions_dir"] = rhs.solutions_dir;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.data_dir = node["data_dir"].as<std::string>("data");
        rhs.problems_file = node["problems_file"].as<std::string>("problems.json");
        rhs.contests_file = node["contests_file"].as<std::string>("contests.json");
        rhs.solutions_dir = node["solutions_dir"].as<std::string>("solutions");
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["git_binary"] = rhs.git_binary;
        node["remote_name"] = rhs.remote_name;
        node["default_branch"] = rhs.default_branch;
        node["config_cache"] = rhs.config_cache.string();
        node["command_timeout_seconds"] = rhs.command_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.git_binary = node["git_binary"].as<std::string>("git");
        rhs.remote_name = node["remote_name"].as<std::string>("origin");
        rhs.default_branch = node["default_branch"].as<std::string>("main");
        rhs.config_cache = node["config_cache"].as<std::string>(".git_config.json");
        rhs.command_timeout_seconds = node["command_timeout_seconds"].as<unsigned int>(120);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["compass"] = to_std_string(spdlog::level::to_string_view(rhs.compass));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["sync"]    = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["config"]  = to_std_string(spdlog::level::to_string_view(rhs.config));
        node["shell"]   = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.compass = spdlog::level::from_str(node["compass"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_level));
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_level));
        node["subsystem_levels"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("logs");
        rhs.console_level = spdlog::level::from_str(node["console_level"].as<std::string>("warn"));
        rhs.file_level = spdlog::level::from_str(node["file_level"].as<std::string>("debug"));
        if (const auto levels = node["subsystem_levels"])
            YAML::convert<SubsystemLogLevelsConfig>::decode(levels, rhs.subsystem_levels);
        return true;
    }
};

}
