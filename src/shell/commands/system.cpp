#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"

#include <string>

#ifndef COMPASS_VERSION
#define COMPASS_VERSION "0.0.0"
#endif

namespace compass::shell {

void registerSystemCommands(Router& r) {
    r.registerCommand("help", "help", "Show this help",
                      [&r](const CommandCall&) { return ok(r.help()); }, {"-h", "?"});
    r.registerCommand("version", "version", "Print the compassctl version",
                      [](const CommandCall&) { return ok("compassctl v" + std::string(COMPASS_VERSION) + "\n"); });
}

}
