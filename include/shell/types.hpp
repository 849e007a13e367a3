#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace compass::shell {

// compassctl process exit statuses
namespace exit_code {
inline constexpr int OK = 0;
inline constexpr int FAILURE = 1;
inline constexpr int USAGE = 2;
inline constexpr int NOT_FOUND = 3;
inline constexpr int NO_CHANGES = 4;
}

// One parsed compassctl invocation: "problem show <id> --json".
struct CommandCall {
    std::string name;
    std::vector<std::string> positionals;
    std::map<std::string, std::string, std::less<>> options;   // --remote <url>, last one wins
    std::set<std::string, std::less<>> switches;               // --json, --help

    [[nodiscard]] bool hasSwitch(const std::string_view key) const { return switches.contains(key); }

    [[nodiscard]] std::optional<std::string> option(const std::string_view key) const {
        if (const auto it = options.find(key); it != options.end()) return it->second;
        return std::nullopt;
    }
};

struct CommandResult {
    int exit_code = exit_code::OK;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<nlohmann::json> data{std::nullopt};   // set by commands with a JSON answer
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string usage;   // e.g. "problem list|show|add|update|delete"
    std::string description;
    CommandHandler handler;
};

}
