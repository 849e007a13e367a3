#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "storage/ProblemStore.hpp"
#include "util/files.hpp"

#include <fmt/core.h>

using namespace compass::storage;

namespace compass::shell {

static CommandResult handle_export(const CommandCall& call, ProblemStore& store) {
    const auto data = store.exportAll();
    if (call.positionals.empty()) return okJson(data);
    if (call.positionals.size() != 1) return usage("Usage: export [<file>]\n");

    const auto& target = call.positionals.front();
    util::writeFileAtomic(target, data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n");
    return ok(fmt::format("Exported {} problems to {}\n", data.size(), target));
}

static CommandResult handle_import(const CommandCall& call, ProblemStore& store) {
    if (call.positionals.size() != 1) return usage("Usage: import <file>\n");

    const auto payload = parseJsonArgument("@" + call.positionals.front());
    const auto count = store.importAll(payload);
    return ok(fmt::format("Imported {} problems; previous data kept at {}\n",
                          count, store.importBackupPath().string()));
}

void registerDataCommands(Router& r, Context& ctx) {
    r.registerCommand("export", "export [<file>]", "Dump all problems with inline solutions",
                      [&ctx](const CommandCall& call) { return handle_export(call, ctx.problems); });
    r.registerCommand("import", "import <file>", "Replace all problems from an export",
                      [&ctx](const CommandCall& call) { return handle_import(call, ctx.problems); });
}

}
