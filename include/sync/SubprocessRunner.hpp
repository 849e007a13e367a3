#pragma once

#include "sync/CommandRunner.hpp"

#include <chrono>

namespace compass::sync {

// fork/execvp runner capturing stdout and stderr through pipes.
// A child still running after the timeout is killed; zero disables it.
class SubprocessRunner final : public CommandRunner {
public:
    explicit SubprocessRunner(std::chrono::seconds timeout = std::chrono::seconds{120});

    ExecResult run(const std::vector<std::string>& args, const std::filesystem::path& cwd) override;

private:
    std::chrono::seconds timeout_;
};

}
