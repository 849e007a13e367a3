#include "shell/helpers.hpp"
#include "util/files.hpp"

#include <stdexcept>

using namespace compass::shell;

CommandResult compass::shell::invalid(std::string msg) { return {exit_code::USAGE, "", std::move(msg) + "\n"}; }
CommandResult compass::shell::ok(std::string out) { return {exit_code::OK, std::move(out), ""}; }
CommandResult compass::shell::usage(const std::string& text) { return {exit_code::USAGE, "", text}; }

CommandResult compass::shell::okJson(const nlohmann::json& data) {
    CommandResult r{exit_code::OK, data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n", ""};
    r.data = data;
    return r;
}

std::pair<std::string_view, CommandCall> compass::shell::descend(const CommandCall& call) {
    if (call.positionals.empty()) return {std::string_view{}, call};

    CommandCall sub = call;
    sub.name = call.positionals.front();
    sub.positionals.erase(sub.positionals.begin());
    return {std::string_view{call.positionals.front()}, std::move(sub)};
}

std::string compass::shell::readArgument(const std::string& arg) {
    if (arg.size() > 1 && arg.front() == '@') return util::readFileToString(arg.substr(1));
    return arg;
}

nlohmann::json compass::shell::parseJsonArgument(const std::string& arg) {
    const auto text = readArgument(arg);
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) throw std::invalid_argument("Argument is not valid JSON");
    return j;
}
