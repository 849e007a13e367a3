#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "sync/Orchestrator.hpp"

#include <fmt/core.h>

using namespace compass::sync;

namespace compass::shell {

static constexpr auto* SYNC_USAGE =
    "sync init|push|pull|status [--remote <url>] [--branch <name>] [--message <msg>]";

static CommandResult toCommandResult(const SyncResult& r) {
    CommandResult out;
    out.data = nlohmann::json{
        {"outcome", to_string(r.outcome)},
        {"failed_step", r.failed_step},
        {"transcript", r.transcript}
    };

    switch (r.outcome) {
    case SyncResult::Outcome::Success:
        out.exit_code = exit_code::OK;
        out.stdout_text = r.transcript;
        break;
    case SyncResult::Outcome::NoChanges:
        out.exit_code = exit_code::NO_CHANGES;
        out.stdout_text = r.transcript;
        break;
    case SyncResult::Outcome::RemoteNotConfigured:
    case SyncResult::Outcome::ToolFailure:
        out.exit_code = exit_code::FAILURE;
        out.stderr_text = r.transcript;
        break;
    }
    return out;
}

static CommandResult handle_sync(const CommandCall& call, Orchestrator& orchestrator) {
    const auto [sub, subcall] = descend(call);
    if (!subcall.positionals.empty()) return usage(fmt::format("Usage: {}\n", SYNC_USAGE));

    const auto remote = subcall.option("remote").value_or("");
    const auto branch = subcall.option("branch").value_or("");

    if (sub == "init") return toCommandResult(orchestrator.init(remote, branch));
    if (sub == "push") return toCommandResult(orchestrator.push(remote, branch, subcall.option("message").value_or("")));
    if (sub == "pull") return toCommandResult(orchestrator.pull(remote, branch));
    if (sub == "status") return toCommandResult(orchestrator.status());

    return usage(fmt::format("Usage: {}\n", SYNC_USAGE));
}

void registerSyncCommands(Router& r, Context& ctx) {
    r.registerCommand("sync", SYNC_USAGE, "Synchronize the data directory through git",
                      [&ctx](const CommandCall& call) { return handle_sync(call, ctx.orchestrator); },
                      {"git"});
}

}
