#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace compass::types {

struct ContestProblem {
    enum class Status { Accepted, Attempted, Unsubmitted };

    std::string letter{};
    long long pass_count{0}, attempt_count{0};
    Status my_status{Status::Unsubmitted};

    bool operator==(const ContestProblem& other) const = default;
};

struct Contest {
    static constexpr int MIN_PROBLEMS = 1;
    static constexpr int MAX_PROBLEMS = 15;

    std::string id{}, name{};
    int total_problems{MIN_PROBLEMS};
    std::vector<ContestProblem> problems{};
    std::optional<std::string> rank_str{std::nullopt}, summary{std::nullopt};
    std::string created_at{}, updated_at{};

    nlohmann::json extra = nlohmann::json::object();

    bool operator==(const Contest& other) const = default;
};

// Letter for the zero-based position in a contest: A, B, C, ...
std::string letterFor(size_t index);

void to_json(nlohmann::json& j, const ContestProblem& p);
void to_json(nlohmann::json& j, const Contest& c);

std::string to_string(ContestProblem::Status status);
std::optional<ContestProblem::Status> contestStatusFromString(const std::string& str);

}
