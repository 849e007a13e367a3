#pragma once

#include "shell/types.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace compass::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);
CommandResult okJson(const nlohmann::json& data);
CommandResult usage(const std::string& text);

// Splits "problem show <id>" into ("show", call with positionals {<id>}).
std::pair<std::string_view, CommandCall> descend(const CommandCall& call);

// Literal argument, or the contents of a file when written as @path.
std::string readArgument(const std::string& arg);

// Parses a JSON argument (literal or @path); throws std::invalid_argument on bad JSON.
nlohmann::json parseJsonArgument(const std::string& arg);

}
