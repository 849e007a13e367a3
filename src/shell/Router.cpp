#include "shell/Router.hpp"
#include "shell/Args.hpp"
#include "shell/helpers.hpp"
#include "storage/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <cctype>
#include <filesystem>
#include <stdexcept>

using namespace compass::shell;
using namespace compass::logging;

void Router::registerCommand(const std::string& name, std::string usage, std::string description,
                             CommandHandler handler, const std::vector<std::string>& aliases) {
    const std::string key = normalize(name);

    for (const auto& alias : aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
    }

    commands_[key] = CommandInfo{std::move(usage), std::move(description), std::move(handler)};
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    CommandCall call;
    try {
        call = parseArgs(args);
    } catch (const std::invalid_argument& e) {
        return invalid(e.what());
    }

    if (call.name.empty()) return call.hasSwitch("help") || call.hasSwitch("h") ? ok(help()) : usage(help());
    const auto canonical = canonicalFor(call.name);

    if (!commands_.contains(canonical))
        return {exit_code::USAGE, "", fmt::format("Unknown command: {}\n\n{}", call.name, help())};

    LogRegistry::shell()->debug("[Router] Executing command: '{}'", canonical);

    try {
        return commands_.at(canonical).handler(call);
    } catch (const storage::NotFound& e) {
        return {exit_code::NOT_FOUND, "", std::string(e.what()) + "\n"};
    } catch (const std::invalid_argument& e) {
        return invalid(e.what());
    } catch (const nlohmann::json::exception& e) {
        return invalid(fmt::format("Malformed input: {}", e.what()));
    } catch (const std::filesystem::filesystem_error& e) {
        LogRegistry::shell()->error("[Router] '{}' failed: {}", canonical, e.what());
        return {exit_code::FAILURE, "", std::string(e.what()) + "\n"};
    } catch (const std::runtime_error& e) {
        LogRegistry::shell()->error("[Router] '{}' failed: {}", canonical, e.what());
        return {exit_code::FAILURE, "", std::string(e.what()) + "\n"};
    }
}

std::string Router::help() const {
    std::string out = "Usage: compassctl [--config <path>] <command> ...\n\nCommands:\n";
    for (const auto& [name, info] : commands_)
        out += fmt::format("  {:<58} {}\n", info.usage, info.description);
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
