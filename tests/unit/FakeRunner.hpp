#pragma once

#include "sync/CommandRunner.hpp"

#include <deque>
#include <map>
#include <string>
#include <vector>

// Scripted CommandRunner. Responses are keyed by the command line without
// the program name ("diff --cached --name-only"); the last scripted response
// for a key repeats once the queue is drained. Unscripted commands succeed
// with no output. Every argument vector is recorded verbatim.
class FakeRunner final : public compass::sync::CommandRunner {
public:
    std::vector<std::vector<std::string>> calls;

    void script(const std::string& command, compass::sync::ExecResult result) {
        scripted_[command].push_back(std::move(result));
    }

    compass::sync::ExecResult run(const std::vector<std::string>& args, const std::filesystem::path&) override {
        calls.push_back(args);

        std::string key;
        for (size_t i = 1; i < args.size(); ++i) {
            if (i > 1) key += ' ';
            key += args[i];
        }

        const auto it = scripted_.find(key);
        if (it == scripted_.end() || it->second.empty()) return succeeded();

        auto result = it->second.front();
        if (it->second.size() > 1) it->second.pop_front();
        return result;
    }

    [[nodiscard]] size_t count(const std::string& subcommand) const {
        size_t n = 0;
        for (const auto& c : calls) if (c.size() > 1 && c[1] == subcommand) ++n;
        return n;
    }

    [[nodiscard]] bool ran(const std::vector<std::string>& args) const {
        for (const auto& c : calls) if (c == args) return true;
        return false;
    }

    static compass::sync::ExecResult succeeded(std::string out = "") {
        compass::sync::ExecResult r;
        r.exit_code = 0;
        r.stdout_text = std::move(out);
        return r;
    }

    static compass::sync::ExecResult failed(std::string err, const int code = 1) {
        compass::sync::ExecResult r;
        r.exit_code = code;
        r.stderr_text = std::move(err);
        return r;
    }

private:
    std::map<std::string, std::deque<compass::sync::ExecResult>> scripted_;
};
