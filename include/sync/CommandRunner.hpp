#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace compass::sync {

struct ExecResult {
    int exit_code{-1};
    std::string stdout_text{}, stderr_text{};
    bool timed_out{false};

    [[nodiscard]] bool ok() const { return exit_code == 0 && !timed_out; }
};

// Runs one external command from an argument vector, never through a shell.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual ExecResult run(const std::vector<std::string>& args, const std::filesystem::path& cwd) = 0;
};

}
