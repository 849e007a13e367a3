#pragma once

#include "shell/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace compass::shell {

// Flags that never carry a value. Any other --name expects one.
inline const std::set<std::string, std::less<>> SWITCHES = {"json", "help", "h", "version"};

/*
 * Splits compassctl argv (program name already stripped) into a CommandCall.
 * The first positional names the command. "--name=value" and "--name value"
 * both set an option; the value is taken verbatim even when it starts with a
 * dash. "--" ends option parsing. "-" and negative numbers are positionals.
 * Throws std::invalid_argument for an option missing its value or a switch
 * given one.
 */
CommandCall parseArgs(const std::vector<std::string>& args);

}
