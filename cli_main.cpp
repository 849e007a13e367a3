#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "shell/Router.hpp"
#include "shell/commands.hpp"
#include "storage/ContestStore.hpp"
#include "storage/ProblemStore.hpp"
#include "sync/ConfigCache.hpp"
#include "sync/Orchestrator.hpp"
#include "sync/SubprocessRunner.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>
#include <fmt/core.h>

using namespace compass;
using namespace compass::config;
using namespace compass::logging;

namespace {

constexpr auto* DEFAULT_CONFIG_PATH = "config.yaml";

// Pulls "--config <path>" (or --config=<path>) out of argv; the rest goes to the router.
std::filesystem::path extractConfigPath(std::vector<std::string>& args) {
    std::filesystem::path path;
    for (auto it = args.begin(); it != args.end();) {
        if (*it == "--config" && std::next(it) != args.end()) {
            path = *std::next(it);
            it = args.erase(it, std::next(it, 2));
        } else if (it->starts_with("--config=")) {
            path = it->substr(std::string("--config=").size());
            it = args.erase(it);
        } else if (*it == "--") {
            break;
        } else {
            ++it;
        }
    }

    if (path.empty()) {
        if (const char* env = std::getenv("COMPASS_CONFIG"); env && *env) path = env;
        else if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) path = DEFAULT_CONFIG_PATH;
    }
    return path;
}

}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        const auto configPath = extractConfigPath(args);
        if (configPath.empty()) ConfigRegistry::init(Config{});
        else ConfigRegistry::init(configPath);

        const auto& cfg = ConfigRegistry::get();
        LogRegistry::init(cfg.logging.log_dir);
        LogRegistry::config()->debug("[compassctl] Using {}",
                                     configPath.empty() ? std::string("built-in defaults") : configPath.string());

        storage::ProblemStore problems(cfg.storage);
        storage::ContestStore contests(cfg.storage);

        sync::SubprocessRunner runner(std::chrono::seconds{cfg.sync.command_timeout_seconds});
        sync::ConfigCache cache(cfg.sync.config_cache, cfg.sync.default_branch);
        sync::Orchestrator orchestrator(runner, cfg.storage.data_dir, cache,
                                        sync::OrchestratorOptions::fromConfig(cfg.sync));

        shell::Context ctx{problems, contests, orchestrator};
        shell::Router router;
        shell::registerAllCommands(router, ctx);

        const auto result = router.execute(args);
        if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
        if (!result.stderr_text.empty()) fmt::print(stderr, "{}", result.stderr_text);
        return result.exit_code;
    } catch (const std::exception& e) {
        fmt::print(stderr, "compassctl: {}\n", e.what());
        if (LogRegistry::isInitialized()) LogRegistry::compass()->error("[compassctl] Fatal: {}", e.what());
        return shell::exit_code::FAILURE;
    }
}
