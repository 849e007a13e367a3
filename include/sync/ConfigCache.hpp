#pragma once

#include "types/SyncConfig.hpp"

#include <filesystem>
#include <string>

namespace compass::sync {

// Last-used remote and branch, one small JSON file overwritten on every save.
class ConfigCache {
public:
    explicit ConfigCache(std::filesystem::path path, std::string defaultBranch = "main");

    // Defaults when the file is missing or unreadable; never throws.
    [[nodiscard]] types::SyncConfig load() const;

    types::SyncConfig save(const std::string& remote, const std::string& branch) const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::string default_branch_;

    [[nodiscard]] types::SyncConfig defaults() const;
};

}
