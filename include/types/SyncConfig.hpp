#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace compass::types {

struct SyncConfig {
    std::string remote{};
    std::string branch{"main"};
    std::string last_updated{};
};

void to_json(nlohmann::json& j, const SyncConfig& c);
void from_json(const nlohmann::json& j, SyncConfig& c);

}
