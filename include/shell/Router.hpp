#pragma once

#include "shell/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace compass::shell {

class Router {
public:
    void registerCommand(const std::string& name, std::string usage, std::string description,
                         CommandHandler handler, const std::vector<std::string>& aliases = {});

    // Dispatches argv (without the program name). Exceptions thrown by
    // handlers are mapped to exit codes here.
    CommandResult execute(const std::vector<std::string>& args) const;

    [[nodiscard]] std::string help() const;

private:
    std::map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
