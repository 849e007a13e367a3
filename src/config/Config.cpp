#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace compass::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    resolvePaths(cfg, path.parent_path());
    return cfg;
}

void resolvePaths(Config& cfg, const std::filesystem::path& base) {
    const auto anchor = [&base](std::filesystem::path& p) {
        if (p.is_relative() && !base.empty()) p = base / p;
    };
    anchor(cfg.storage.data_dir);
    anchor(cfg.sync.config_cache);
    anchor(cfg.logging.log_dir);
}

}
