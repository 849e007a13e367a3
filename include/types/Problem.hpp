#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace compass::types {

enum class UnsolvedStage { Unseen, SeenNoIdea, KnowsApproach };

struct Problem {
    std::string id{}, title{};
    std::optional<std::string> link{std::nullopt}, source{std::nullopt};
    std::vector<std::string> tags{};
    std::optional<std::string> assignee{std::nullopt};
    bool solved{false};
    std::optional<UnsolvedStage> unsolved_stage{std::nullopt};
    std::optional<std::string> unsolved_custom_label{std::nullopt};
    std::optional<long long> pass_count{std::nullopt};
    std::optional<std::string> notes{std::nullopt};
    std::string created_at{}, updated_at{};

    // Derived from side-file presence on every load; never persisted.
    bool has_solution{false};

    // Keys this schema does not know, carried through untouched.
    nlohmann::json extra = nlohmann::json::object();

    void clearUnsolvedIfSolved();

    bool operator==(const Problem& other) const = default;
};

// Container form: every schema key, no has_solution.
void to_json(nlohmann::json& j, const Problem& p);

// Caller-facing form: container form plus has_solution.
nlohmann::json toView(const Problem& p);

std::string to_string(UnsolvedStage stage);

// Accepts the current tokens and the labels written by earlier versions.
std::optional<UnsolvedStage> unsolvedStageFromString(const std::string& str);

}
