#include "sync/SubprocessRunner.hpp"
#include "logging/LogRegistry.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace compass::logging;

namespace compass::sync {

namespace {

struct Pipe {
    int fds[2]{-1, -1};

    Pipe() {
        if (pipe2(fds, O_CLOEXEC) != 0)
            throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

int remainingMillis(const std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

}

SubprocessRunner::SubprocessRunner(const std::chrono::seconds timeout) : timeout_(timeout) {}

ExecResult SubprocessRunner::run(const std::vector<std::string>& args, const std::filesystem::path& cwd) {
    if (args.empty()) throw std::invalid_argument("SubprocessRunner: empty argument vector");

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    // Built before fork; the child only calls async-signal-safe functions.
    const std::string execError = fmt::format("failed to execute '{}'\n", args.front());
    const std::string workDir = cwd.string();

    Pipe out, err;

    const pid_t pid = fork();
    if (pid < 0) throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));

    if (pid == 0) {
        if (!workDir.empty() && chdir(workDir.c_str()) != 0) _exit(126);

        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out.fds[1], STDOUT_FILENO);
        dup2(err.fds[1], STDERR_FILENO);

        execvp(argv[0], argv.data());
        [[maybe_unused]] const auto n = write(STDERR_FILENO, execError.data(), execError.size());
        _exit(127); // exec failed
    }

    out.closeWrite();
    err.closeWrite();

    ExecResult result;
    const bool bounded = timeout_.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout_;

    std::array<pollfd, 2> pfds{{{out.fds[0], POLLIN, 0}, {err.fds[0], POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&result.stdout_text, &result.stderr_text};
    int openFds = 2;
    std::array<char, 4096> buf{};

    while (openFds > 0) {
        const int rc = ::poll(pfds.data(), pfds.size(), bounded ? remainingMillis(deadline) : -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }
        if (rc == 0) {
            ::kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        for (size_t i = 0; i < pfds.size(); ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            const ssize_t n = ::read(pfds[i].fd, buf.data(), buf.size());
            if (n > 0) {
                sinks[i]->append(buf.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                pfds[i].fd = -1;
                --openFds;
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);

    if (result.timed_out)
        LogRegistry::sync()->warn("[SubprocessRunner] '{}' killed after {}s", args.front(), timeout_.count());
    LogRegistry::sync()->debug("[SubprocessRunner] '{}' exited with {} in {}",
                               fmt::join(args, " "), result.exit_code, workDir.empty() ? "." : workDir);
    return result;
}

}
