#pragma once

#include "sync/CommandRunner.hpp"
#include "sync/ConfigCache.hpp"
#include "sync/SyncResult.hpp"
#include "sync/Transcript.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace compass::config { struct SyncConfig; }

namespace compass::sync {

struct OrchestratorOptions {
    std::string git_binary{"git"};
    std::string remote_name{"origin"};
    std::string default_branch{"main"};

    static OrchestratorOptions fromConfig(const config::SyncConfig& cfg);
};

/*
 * Drives the git client over the data directory.
 *
 * Each operation runs a fixed sequence of subcommands, stops at the first
 * failing step and returns everything it ran as a transcript. Only push and
 * pull have fallbacks (push -u, pull --allow-unrelated-histories). Empty
 * remote or branch arguments fall back to the config cache. Operations on
 * one instance are serialized.
 */
class Orchestrator {
public:
    Orchestrator(CommandRunner& runner, std::filesystem::path workTree, ConfigCache& cache,
                 OrchestratorOptions options = {});

    SyncResult init(const std::string& remote = "", const std::string& branch = "");
    SyncResult push(const std::string& remote = "", const std::string& branch = "", const std::string& message = "");
    SyncResult pull(const std::string& remote = "", const std::string& branch = "");

    // Read-only report: current branch, remote and pending changes.
    SyncResult status();

    static std::string defaultCommitMessage();

private:
    struct Target {
        std::string explicit_remote, remote, branch;
    };

    CommandRunner& runner_;
    std::filesystem::path work_tree_;
    ConfigCache& cache_;
    OrchestratorOptions options_;
    std::mutex mutex_;

    [[nodiscard]] Target resolve(const std::string& remote, const std::string& branch) const;

    ExecResult git(Transcript& transcript, const std::vector<std::string>& args);
    ExecResult gitQuiet(const std::vector<std::string>& args);

    bool isRepositoryUnlocked(Transcript* transcript = nullptr);

    // Each returns a result only when the sequence has to stop.
    std::optional<SyncResult> initUnlocked(Transcript& transcript, const Target& target, bool isRepository);
    std::optional<SyncResult> configureRemoteUnlocked(Transcript& transcript, const Target& target);
    std::optional<SyncResult> prepareUnlocked(Transcript& transcript, const Target& target);

    static SyncResult fail(Transcript& transcript, const std::string& step);
    static SyncResult finish(Transcript& transcript, SyncResult::Outcome outcome);
};

}
