#pragma once

#include "sync/CommandRunner.hpp"

#include <string>
#include <vector>

namespace compass::sync {

// Human-readable, append-only log of one sync operation.
class Transcript {
public:
    void section(const std::string& title);
    void note(const std::string& line);
    void record(const std::vector<std::string>& args, const ExecResult& result);

    [[nodiscard]] const std::string& str() const { return text_; }
    [[nodiscard]] bool empty() const { return text_.empty(); }

    // Shell-like rendering for display only; arguments with spaces or quotes are single-quoted.
    static std::string commandLine(const std::vector<std::string>& args);

private:
    std::string text_;
};

}
