#include "sync/ConfigCache.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"
#include "util/strings.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace compass::logging;
namespace fs = std::filesystem;

namespace compass::sync {

ConfigCache::ConfigCache(fs::path path, std::string defaultBranch)
    : path_(std::move(path)), default_branch_(std::move(defaultBranch)) {}

types::SyncConfig ConfigCache::defaults() const {
    types::SyncConfig cfg;
    cfg.branch = default_branch_;
    return cfg;
}

types::SyncConfig ConfigCache::load() const {
    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) return defaults();

    try {
        const auto content = util::readFileToString(path_);
        const auto j = nlohmann::json::parse(content, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object()) {
            LogRegistry::sync()->warn("[ConfigCache] Ignoring unreadable sync config at {}", path_.string());
            return defaults();
        }

        auto cfg = j.get<types::SyncConfig>();
        cfg.remote = util::trim(cfg.remote);
        cfg.branch = j.contains("branch") ? util::trim(cfg.branch) : "";
        if (cfg.branch.empty()) cfg.branch = default_branch_;
        return cfg;
    } catch (const std::exception& e) {
        LogRegistry::sync()->warn("[ConfigCache] Failed to load sync config from {}: {}", path_.string(), e.what());
        return defaults();
    }
}

types::SyncConfig ConfigCache::save(const std::string& remote, const std::string& branch) const {
    types::SyncConfig cfg;
    cfg.remote = util::trim(remote);
    cfg.branch = util::trim(branch);
    if (cfg.branch.empty()) cfg.branch = default_branch_;
    cfg.last_updated = util::nowIso8601();

    const nlohmann::json j = cfg;
    util::writeFileAtomic(path_, j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n");
    LogRegistry::sync()->info("[ConfigCache] Saved remote '{}' on branch '{}'", cfg.remote, cfg.branch);
    return cfg;
}

}
