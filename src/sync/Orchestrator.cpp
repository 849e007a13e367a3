#include "sync/Orchestrator.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/strings.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>
#include <stdexcept>

using namespace compass::logging;

namespace compass::sync {

OrchestratorOptions OrchestratorOptions::fromConfig(const config::SyncConfig& cfg) {
    return {cfg.git_binary, cfg.remote_name, cfg.default_branch};
}

Orchestrator::Orchestrator(CommandRunner& runner, std::filesystem::path workTree, ConfigCache& cache,
                           OrchestratorOptions options)
    : runner_(runner), work_tree_(std::move(workTree)), cache_(cache), options_(std::move(options)) {}

std::string Orchestrator::defaultCommitMessage() {
    return fmt::format("update data ({})", util::localDateTime());
}

Orchestrator::Target Orchestrator::resolve(const std::string& remote, const std::string& branch) const {
    const auto cached = cache_.load();
    Target t;
    t.explicit_remote = util::trim(remote);
    t.remote = t.explicit_remote.empty() ? cached.remote : t.explicit_remote;
    t.branch = util::trim(branch);
    if (t.branch.empty()) t.branch = cached.branch.empty() ? options_.default_branch : cached.branch;
    return t;
}

ExecResult Orchestrator::gitQuiet(const std::vector<std::string>& args) {
    std::vector<std::string> argv{options_.git_binary};
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_.run(argv, work_tree_);
}

ExecResult Orchestrator::git(Transcript& transcript, const std::vector<std::string>& args) {
    std::vector<std::string> argv{options_.git_binary};
    argv.insert(argv.end(), args.begin(), args.end());
    auto result = runner_.run(argv, work_tree_);
    transcript.record(argv, result);
    return result;
}

SyncResult Orchestrator::fail(Transcript& transcript, const std::string& step) {
    transcript.note(fmt::format("\nFAILED at step '{}'", step));
    LogRegistry::sync()->warn("[Orchestrator] Sync step '{}' failed", step);
    return {SyncResult::Outcome::ToolFailure, step, transcript.str()};
}

SyncResult Orchestrator::finish(Transcript& transcript, const SyncResult::Outcome outcome) {
    return {outcome, "", transcript.str()};
}

bool Orchestrator::isRepositoryUnlocked(Transcript* transcript) {
    const std::vector<std::string> args{"rev-parse", "--is-inside-work-tree"};
    const auto r = transcript ? git(*transcript, args) : gitQuiet(args);
    return r.ok() && util::trim(r.stdout_text) == "true";
}

std::optional<SyncResult> Orchestrator::initUnlocked(Transcript& transcript, const Target& target,
                                                     const bool isRepository) {
    transcript.section("Initialize repository");
    if (isRepository) {
        transcript.note(fmt::format("{} is already a git repository", work_tree_.string()));
    } else {
        if (!git(transcript, {"init"}).ok()) return fail(transcript, "init");
        transcript.note("repository initialized");
    }

    if (target.remote.empty()) {
        transcript.note("no remote given, skipping remote configuration");
        return std::nullopt;
    }
    return configureRemoteUnlocked(transcript, target);
}

std::optional<SyncResult> Orchestrator::configureRemoteUnlocked(Transcript& transcript, const Target& target) {
    transcript.section("Configure remote");
    const auto& name = options_.remote_name;

    if (git(transcript, {"remote", "get-url", name}).ok()) {
        if (!git(transcript, {"remote", "set-url", name, target.remote}).ok()) return fail(transcript, "remote set-url");
        transcript.note(fmt::format("updated remote {}: {}", name, target.remote));
    } else {
        if (!git(transcript, {"remote", "add", name, target.remote}).ok()) return fail(transcript, "remote add");
        transcript.note(fmt::format("added remote {}: {}", name, target.remote));
    }

    cache_.save(target.remote, target.branch);
    transcript.note(fmt::format("saved sync config to {}", cache_.path().string()));
    return std::nullopt;
}

std::optional<SyncResult> Orchestrator::prepareUnlocked(Transcript& transcript, const Target& target) {
    transcript.section("Check repository");
    if (!isRepositoryUnlocked(&transcript)) {
        if (auto stop = initUnlocked(transcript, target, false)) return stop;
    } else if (!target.explicit_remote.empty()) {
        if (auto stop = configureRemoteUnlocked(transcript, target)) return stop;
    }

    transcript.section("Check remote");
    if (!git(transcript, {"remote", "get-url", options_.remote_name}).ok()) {
        transcript.note(fmt::format(
            "Remote '{}' is not configured. Pass a remote location (--remote <url>) or run 'sync init --remote <url>' first.",
            options_.remote_name));
        LogRegistry::sync()->warn("[Orchestrator] No remote configured for {}", work_tree_.string());
        return finish(transcript, SyncResult::Outcome::RemoteNotConfigured);
    }
    return std::nullopt;
}

SyncResult Orchestrator::init(const std::string& remote, const std::string& branch) {
    std::scoped_lock lock(mutex_);
    Transcript transcript;
    const auto target = resolve(remote, branch);

    transcript.section("Check repository");
    const bool isRepository = isRepositoryUnlocked(&transcript);
    if (auto stop = initUnlocked(transcript, target, isRepository)) return *stop;
    LogRegistry::sync()->info("[Orchestrator] Initialized {}", work_tree_.string());
    return finish(transcript, SyncResult::Outcome::Success);
}

SyncResult Orchestrator::push(const std::string& remote, const std::string& branch, const std::string& message) {
    std::scoped_lock lock(mutex_);
    Transcript transcript;
    const auto target = resolve(remote, branch);

    if (auto stop = prepareUnlocked(transcript, target)) return *stop;

    transcript.section("Stage changes");
    if (!git(transcript, {"add", "-A"}).ok()) return fail(transcript, "add");

    const auto diff = git(transcript, {"diff", "--cached", "--name-only"});
    if (!diff.ok()) return fail(transcript, "diff");
    if (util::isBlank(diff.stdout_text)) {
        transcript.note("nothing to commit");
        LogRegistry::sync()->info("[Orchestrator] Push skipped, no changes in {}", work_tree_.string());
        return finish(transcript, SyncResult::Outcome::NoChanges);
    }

    transcript.section("Commit");
    const auto msg = util::isBlank(message) ? defaultCommitMessage() : message;
    if (!git(transcript, {"commit", "-m", msg}).ok()) return fail(transcript, "commit");

    transcript.section(fmt::format("Push to {}/{}", options_.remote_name, target.branch));
    if (!git(transcript, {"push", options_.remote_name, target.branch}).ok()) {
        transcript.note("push failed, retrying with upstream tracking");
        if (!git(transcript, {"push", "-u", options_.remote_name, target.branch}).ok())
            return fail(transcript, "push");
    }

    transcript.note("pushed successfully");
    LogRegistry::sync()->info("[Orchestrator] Pushed {} to {}", target.branch, target.remote);
    return finish(transcript, SyncResult::Outcome::Success);
}

SyncResult Orchestrator::pull(const std::string& remote, const std::string& branch) {
    std::scoped_lock lock(mutex_);
    Transcript transcript;
    const auto target = resolve(remote, branch);

    if (auto stop = prepareUnlocked(transcript, target)) return *stop;

    transcript.section(fmt::format("Pull from {}/{}", options_.remote_name, target.branch));
    if (!git(transcript, {"pull", options_.remote_name, target.branch}).ok()) {
        transcript.note("pull failed, first pull? retrying with --allow-unrelated-histories");
        if (!git(transcript, {"pull", options_.remote_name, target.branch, "--allow-unrelated-histories"}).ok())
            return fail(transcript, "pull");
    }

    transcript.note("pulled successfully");
    LogRegistry::sync()->info("[Orchestrator] Pulled {} from {}", target.branch, target.remote);
    return finish(transcript, SyncResult::Outcome::Success);
}

SyncResult Orchestrator::status() {
    std::scoped_lock lock(mutex_);
    Transcript transcript;

    if (!isRepositoryUnlocked()) {
        transcript.note(fmt::format("{} is not a git repository", work_tree_.string()));
        return finish(transcript, SyncResult::Outcome::Success);
    }

    const auto branch = gitQuiet({"rev-parse", "--abbrev-ref", "HEAD"});
    transcript.note(fmt::format("branch: {}", branch.ok() ? util::trim(branch.stdout_text) : "unknown"));

    const auto url = gitQuiet({"remote", "get-url", options_.remote_name});
    transcript.note(fmt::format("remote: {}", url.ok() ? util::trim(url.stdout_text) : "not configured"));

    const auto st = gitQuiet({"status", "--short"});
    if (!st.ok()) {
        transcript.record({options_.git_binary, "status", "--short"}, st);
        return fail(transcript, "status");
    }
    if (util::isBlank(st.stdout_text)) {
        transcript.note("working tree clean");
    } else {
        transcript.note("changes:");
        transcript.note(st.stdout_text.back() == '\n' ? st.stdout_text.substr(0, st.stdout_text.size() - 1) : st.stdout_text);
    }
    return finish(transcript, SyncResult::Outcome::Success);
}

}
