#pragma once

namespace compass::storage {
class ProblemStore;
class ContestStore;
}

namespace compass::sync { class Orchestrator; }

namespace compass::shell {

class Router;

// Long-lived services shared by every handler, owned by main().
struct Context {
    storage::ProblemStore& problems;
    storage::ContestStore& contests;
    sync::Orchestrator& orchestrator;
};

void registerProblemCommands(Router& r, Context& ctx);
void registerSolutionCommands(Router& r, Context& ctx);
void registerContestCommands(Router& r, Context& ctx);
void registerDataCommands(Router& r, Context& ctx);
void registerSyncCommands(Router& r, Context& ctx);
void registerSystemCommands(Router& r);

inline void registerAllCommands(Router& r, Context& ctx) {
    registerProblemCommands(r, ctx);
    registerSolutionCommands(r, ctx);
    registerContestCommands(r, ctx);
    registerDataCommands(r, ctx);
    registerSyncCommands(r, ctx);
    registerSystemCommands(r);
}

}
