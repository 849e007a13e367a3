#include "types/Contest.hpp"

#include "util/json.hpp"

#include <stdexcept>

namespace compass::types {

std::string letterFor(const size_t index) {
    static constexpr char kLetters[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    if (index >= sizeof(kLetters) - 1) throw std::out_of_range("Contest problem index out of range: " + std::to_string(index));
    return std::string(1, kLetters[index]);
}

void to_json(nlohmann::json& j, const ContestProblem& p) {
    j = {
        {"letter", p.letter},
        {"pass_count", p.pass_count},
        {"attempt_count", p.attempt_count},
        {"my_status", to_string(p.my_status)}
    };
}

void to_json(nlohmann::json& j, const Contest& c) {
    j = c.extra.is_object() ? c.extra : nlohmann::json::object();

    j["id"] = c.id;
    j["name"] = c.name;
    j["total_problems"] = c.total_problems;
    j["problems"] = c.problems;
    j["rank_str"] = util::nullable(c.rank_str);
    j["summary"] = util::nullable(c.summary);
    j["created_at"] = c.created_at;
    j["updated_at"] = c.updated_at;
}

std::string to_string(const ContestProblem::Status status) {
    switch (status) {
    case ContestProblem::Status::Accepted: return "ac";
    case ContestProblem::Status::Attempted: return "attempted";
    case ContestProblem::Status::Unsubmitted: return "unsubmitted";
    default: throw std::invalid_argument("Unknown contest problem status");
    }
}

std::optional<ContestProblem::Status> contestStatusFromString(const std::string& str) {
    if (str == "ac" || str == "accepted") return ContestProblem::Status::Accepted;
    if (str == "attempted") return ContestProblem::Status::Attempted;
    if (str == "unsubmitted") return ContestProblem::Status::Unsubmitted;
    return std::nullopt;
}

}
