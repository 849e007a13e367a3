#include "types/Problem.hpp"

#include "util/json.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace compass::types {

void Problem::clearUnsolvedIfSolved() {
    if (!solved) return;
    unsolved_stage = std::nullopt;
    unsolved_custom_label = std::nullopt;
}

void to_json(nlohmann::json& j, const Problem& p) {
    j = p.extra.is_object() ? p.extra : nlohmann::json::object();

    j["id"] = p.id;
    j["title"] = p.title;
    j["link"] = util::nullable(p.link);
    j["source"] = util::nullable(p.source);
    j["tags"] = p.tags;
    j["assignee"] = util::nullable(p.assignee);
    j["solved"] = p.solved;
    j["unsolved_stage"] = p.unsolved_stage ? nlohmann::json(to_string(*p.unsolved_stage)) : nlohmann::json(nullptr);
    j["unsolved_custom_label"] = util::nullable(p.unsolved_custom_label);
    j["pass_count"] = util::nullable(p.pass_count);
    j["notes"] = util::nullable(p.notes);
    j["created_at"] = p.created_at;
    j["updated_at"] = p.updated_at;
}

nlohmann::json toView(const Problem& p) {
    nlohmann::json j = p;
    j["has_solution"] = p.has_solution;
    return j;
}

std::string to_string(const UnsolvedStage stage) {
    switch (stage) {
    case UnsolvedStage::Unseen: return "unseen";
    case UnsolvedStage::SeenNoIdea: return "seen_no_idea";
    case UnsolvedStage::KnowsApproach: return "knows_approach";
    default: throw std::invalid_argument("Unknown unsolved stage");
    }
}

std::optional<UnsolvedStage> unsolvedStageFromString(const std::string& str) {
    if (str == "unseen" || str == "未看题") return UnsolvedStage::Unseen;
    if (str == "seen_no_idea" || str == "已看题无思路") return UnsolvedStage::SeenNoIdea;
    if (str == "knows_approach" || str == "知道做法未实现") return UnsolvedStage::KnowsApproach;
    return std::nullopt;
}

}
