#pragma once

#include "storage/RecordStore.hpp"
#include "types/Contest.hpp"

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace compass::config { struct StorageConfig; }

namespace compass::storage {

class ContestStore final : public RecordStore<types::Contest> {
public:
    explicit ContestStore(std::filesystem::path containerPath);
    explicit ContestStore(const config::StorageConfig& cfg);

    types::Contest create(const nlohmann::json& input);
    types::Contest update(const std::string& id, const nlohmann::json& input);
    void remove(const std::string& id);

protected:
    Normalized normalize(const nlohmann::json& raw) override;
};

}
