#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "storage/ContestStore.hpp"

#include <fmt/core.h>
#include <algorithm>

using namespace compass::storage;
using namespace compass::types;

namespace compass::shell {

static constexpr auto* CONTEST_USAGE = "contest list|show <id>|add <json>|update <id> <json>|delete <id>";

static std::string summaryLine(const Contest& c) {
    const auto solved = std::ranges::count_if(c.problems, [](const ContestProblem& p) {
        return p.my_status == ContestProblem::Status::Accepted;
    });

    std::string line = fmt::format("{}  {}  {}/{} solved", c.id, c.name, solved, c.total_problems);
    if (c.rank_str) line += fmt::format("  rank {}", *c.rank_str);
    return line + "\n";
}

static CommandResult handle_contest(const CommandCall& call, ContestStore& store) {
    const auto [sub, subcall] = descend(call);
    const auto& pos = subcall.positionals;

    if (sub == "list") {
        const auto contests = store.loadAll();
        if (subcall.hasSwitch("json")) return okJson(nlohmann::json(contests));
        if (contests.empty()) return ok("No contests recorded.\n");
        std::string out;
        for (const auto& c : contests) out += summaryLine(c);
        return ok(out);
    }

    if (sub == "show" && pos.size() == 1) return okJson(store.findById(pos[0]));
    if (sub == "add" && pos.size() == 1) return okJson(store.create(parseJsonArgument(pos[0])));
    if (sub == "update" && pos.size() == 2) return okJson(store.update(pos[0], parseJsonArgument(pos[1])));
    if (sub == "delete" && pos.size() == 1) {
        store.remove(pos[0]);
        return ok(fmt::format("Deleted contest {}\n", pos[0]));
    }

    return usage(fmt::format("Usage: {}\n", CONTEST_USAGE));
}

void registerContestCommands(Router& r, Context& ctx) {
    r.registerCommand("contest", CONTEST_USAGE, "Manage contest results",
                      [&ctx](const CommandCall& call) { return handle_contest(call, ctx.contests); },
                      {"contests", "c"});
}

}
