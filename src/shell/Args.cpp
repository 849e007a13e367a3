#include "shell/Args.hpp"

#include <fmt/core.h>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace compass::shell {

namespace {

bool isNegativeNumber(const std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (const char c : s.substr(1)) {
        if (c >= '0' && c <= '9') digit = true;
        else if (c == '.' && !dot) dot = true;
        else return false;
    }
    return digit;
}

bool isOption(const std::string_view s) {
    return s.size() > 1 && s[0] == '-' && !isNegativeNumber(s);
}

}

CommandCall parseArgs(const std::vector<std::string>& args) {
    CommandCall call;
    std::vector<std::string> words;
    bool optionsEnded = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];

        if (optionsEnded || !isOption(arg)) {
            words.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsEnded = true;
            continue;
        }

        const auto body = arg.substr(arg[1] == '-' ? 2 : 1);
        const auto eq = body.find('=');
        const std::string key{body.substr(0, eq)};
        if (key.empty()) throw std::invalid_argument(fmt::format("Malformed option '{}'", arg));

        if (SWITCHES.contains(key)) {
            if (eq != std::string_view::npos)
                throw std::invalid_argument(fmt::format("Option --{} does not take a value", key));
            call.switches.insert(key);
        } else if (eq != std::string_view::npos) {
            call.options[key] = std::string(body.substr(eq + 1));
        } else {
            if (i + 1 >= args.size() || args[i + 1] == "--")
                throw std::invalid_argument(fmt::format("Option --{} requires a value", key));
            call.options[key] = args[++i];
        }
    }

    if (!words.empty()) {
        call.name = std::move(words.front());
        call.positionals.assign(std::make_move_iterator(words.begin() + 1), std::make_move_iterator(words.end()));
    }
    return call;
}

}
