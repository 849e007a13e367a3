#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "storage/ProblemStore.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace compass::storage;
using namespace compass::types;

namespace compass::shell {

static constexpr auto* PROBLEM_USAGE = "problem list|show <id>|add <json>|update <id> <json>|delete <id>";
static constexpr auto* SOLUTION_USAGE = "solution get <id>|put <id> <text|@file>|delete <id>";

static std::string summaryLine(const Problem& p) {
    std::string state = p.solved ? "solved" : "open";
    if (!p.solved && p.unsolved_stage) state += "/" + to_string(*p.unsolved_stage);
    std::string line = fmt::format("{}  [{}] {}", p.id, state, p.title);
    if (p.source) line += fmt::format(" ({})", *p.source);
    if (!p.tags.empty()) line += fmt::format(" [{}]", fmt::join(p.tags, ", "));
    if (p.assignee) line += fmt::format(" @{}", *p.assignee);
    if (p.has_solution) line += " +solution";
    return line + "\n";
}

static CommandResult handle_list(const CommandCall& call, ProblemStore& store) {
    const auto problems = store.loadAll();
    if (call.hasSwitch("json")) {
        auto out = nlohmann::json::array();
        for (const auto& p : problems) out.push_back(toView(p));
        return okJson(out);
    }
    if (problems.empty()) return ok("No problems recorded.\n");
    std::string out;
    for (const auto& p : problems) out += summaryLine(p);
    return ok(out);
}

static CommandResult handle_problem(const CommandCall& call, ProblemStore& store) {
    const auto [sub, subcall] = descend(call);
    const auto& pos = subcall.positionals;

    if (sub == "list") return handle_list(subcall, store);
    if (sub == "show" && pos.size() == 1) return okJson(toView(store.findById(pos[0])));
    if (sub == "add" && pos.size() == 1) return okJson(toView(store.create(parseJsonArgument(pos[0]))));
    if (sub == "update" && pos.size() == 2) return okJson(toView(store.update(pos[0], parseJsonArgument(pos[1]))));
    if (sub == "delete" && pos.size() == 1) {
        store.remove(pos[0]);
        return ok(fmt::format("Deleted problem {}\n", pos[0]));
    }

    return usage(fmt::format("Usage: {}\n", PROBLEM_USAGE));
}

static CommandResult handle_solution(const CommandCall& call, ProblemStore& store) {
    const auto [sub, subcall] = descend(call);
    const auto& pos = subcall.positionals;

    if (sub == "get" && pos.size() == 1) {
        const auto text = store.getSolution(pos[0]);
        if (!text) return {exit_code::NOT_FOUND, "", fmt::format("Problem {} has no solution yet\n", pos[0])};
        return ok(*text);
    }

    if (sub == "put" && pos.size() == 2) {
        const auto p = store.putSolution(pos[0], readArgument(pos[1]));
        return ok(p.has_solution ? fmt::format("Saved solution of {} at {}\n", p.id, p.updated_at)
                                 : fmt::format("Blank solution, removed side-file of {}\n", p.id));
    }

    if (sub == "delete" && pos.size() == 1) {
        store.deleteSolution(pos[0]);
        return ok(fmt::format("Deleted solution of {}\n", pos[0]));
    }

    return usage(fmt::format("Usage: {}\n", SOLUTION_USAGE));
}

void registerProblemCommands(Router& r, Context& ctx) {
    r.registerCommand("problem", PROBLEM_USAGE, "Manage tracked problems",
                      [&ctx](const CommandCall& call) { return handle_problem(call, ctx.problems); },
                      {"problems", "p"});
}

void registerSolutionCommands(Router& r, Context& ctx) {
    r.registerCommand("solution", SOLUTION_USAGE, "Read or write a problem's solution write-up",
                      [&ctx](const CommandCall& call) { return handle_solution(call, ctx.problems); },
                      {"sol"});
}

}
