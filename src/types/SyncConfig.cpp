#include "types/SyncConfig.hpp"

#include <nlohmann/json.hpp>

namespace compass::types {

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"remote", c.remote},
        {"branch", c.branch},
        {"lastUpdated", c.last_updated}
    };
}

// Older caches were written with repo_url / last_updated.
void from_json(const nlohmann::json& j, SyncConfig& c) {
    if (j.contains("remote")) c.remote = j.at("remote").get<std::string>();
    else c.remote = j.value("repo_url", "");

    c.branch = j.value("branch", "main");

    if (j.contains("lastUpdated")) c.last_updated = j.at("lastUpdated").get<std::string>();
    else c.last_updated = j.value("last_updated", "");
}

}
