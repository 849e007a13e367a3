#include "storage/Migrator.hpp"
#include "util/strings.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <unordered_set>

using namespace compass::types;

namespace compass::storage {

namespace {

const std::unordered_set<std::string> PROBLEM_KEYS = {
    "id", "title", "link", "source", "tags", "assignee", "solved", "unsolved_stage",
    "unsolved_custom_label", "pass_count", "notes", "created_at", "updated_at"
};

const std::unordered_set<std::string> CONTEST_KEYS = {
    "id", "name", "total_problems", "problems", "rank_str", "summary", "created_at", "updated_at"
};

// Strings pass through; scalars are rendered as text; null and absent are nullopt.
std::optional<std::string> textOf(const nlohmann::json& obj, const std::string& key) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::string textOr(const nlohmann::json& obj, const std::string& key, std::string fallback = "") {
    return textOf(obj, key).value_or(std::move(fallback));
}

bool truthy(const nlohmann::json& v) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number_integer() || v.is_number_unsigned()) return v.get<long long>() != 0;
    if (v.is_number_float()) return v.get<double>() != 0.0;
    if (v.is_string()) {
        const auto s = util::toLower(util::trim(v.get<std::string>()));
        return s == "true" || s == "1" || s == "yes" || s == "done";
    }
    return false;
}

// Null, false, zero and empty strings or containers count as no solution.
bool nonEmpty(const nlohmann::json& v) {
    switch (v.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
        return false;
    case nlohmann::json::value_t::boolean:
        return v.get<bool>();
    case nlohmann::json::value_t::number_float:
        return v.get<double>() != 0.0;
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
        return v != 0;
    case nlohmann::json::value_t::string:
        return !v.get_ref<const std::string&>().empty();
    default:
        return !v.empty();
    }
}

std::string solutionText(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

nlohmann::json extraKeys(const nlohmann::json& raw, const std::unordered_set<std::string>& known) {
    auto extra = nlohmann::json::object();
    for (const auto& [key, value] : raw.items())
        if (!known.contains(key)) extra[key] = value;
    return extra;
}

std::vector<std::string> tagsOf(const nlohmann::json& raw) {
    std::vector<std::string> tags;
    const auto it = raw.find("tags");
    if (it == raw.end() || it->is_null()) return tags;
    if (!it->is_array()) {
        tags.push_back(it->is_string() ? it->get<std::string>() : it->dump());
        return tags;
    }
    for (const auto& t : *it) tags.push_back(t.is_string() ? t.get<std::string>() : t.dump());
    return tags;
}

}

std::optional<long long> coerceInteger(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>() ? 1 : 0;
    if (value.is_number_integer()) return value.get<long long>();
    if (value.is_number_unsigned()) {
        const auto u = value.get<unsigned long long>();
        if (u > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) return std::nullopt;
        return static_cast<long long>(u);
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        if (d >= static_cast<double>(std::numeric_limits<long long>::max()) ||
            d <= static_cast<double>(std::numeric_limits<long long>::min())) return std::nullopt;
        return static_cast<long long>(std::trunc(d));
    }
    if (value.is_string()) {
        auto s = util::trim(value.get<std::string>());
        if (!s.empty() && s.front() == '+') s.erase(s.begin());
        if (s.empty()) return std::nullopt;
        long long out = 0;
        const auto* end = s.data() + s.size();
        const auto [ptr, ec] = std::from_chars(s.data(), end, out);
        if (ec != std::errc{} || ptr != end) return std::nullopt;
        return out;
    }
    return std::nullopt;
}

ProblemMigration migrateProblem(nlohmann::json raw) {
    ProblemMigration result;
    if (!raw.is_object()) raw = nlohmann::json::object();
    const nlohmann::json original = raw;

    // 1. legacy inline solutions move out to side-files; the first non-empty
    //    key wins and the lower-priority ones are dropped with it
    for (const auto* key : LEGACY_SOLUTION_KEYS) {
        const auto it = raw.find(key);
        if (it == raw.end() || !nonEmpty(*it)) continue;
        result.extracted_solution = solutionText(*it);
        result.changed = true;
        break;
    }
    if (result.extracted_solution)
        for (const auto* key : LEGACY_SOLUTION_KEYS) raw.erase(key);

    // 2. derived, never persisted
    raw.erase("has_solution");

    auto& p = result.record;
    p.id = textOr(raw, "id");
    p.title = textOr(raw, "title");
    p.link = textOf(raw, "link");
    if (const auto source = textOf(raw, "source")) p.source = util::trimToNull(*source);
    if (const auto notes = textOf(raw, "notes")) p.notes = util::trimToNull(*notes);
    p.created_at = textOr(raw, "created_at");
    p.updated_at = textOr(raw, "updated_at");

    // 3. solved, falling back to the legacy status text
    if (raw.contains("solved")) p.solved = truthy(raw.at("solved"));
    else p.solved = util::toLower(textOr(raw, "status")) == "done";

    // 4. unknown stages become null
    if (const auto stage = textOf(raw, "unsolved_stage")) p.unsolved_stage = unsolvedStageFromString(*stage);

    // 5.
    if (const auto label = textOf(raw, "unsolved_custom_label")) p.unsolved_custom_label = util::trimToNull(*label);

    // 6.
    p.tags = tagsOf(raw);

    // 7. null on coercion failure
    if (const auto it = raw.find("pass_count"); it != raw.end() && !it->is_null())
        p.pass_count = coerceInteger(*it);

    // 8. owner is deprecated in favour of assignee
    auto assignee = textOf(raw, "assignee");
    if (!assignee) {
        if (const auto owner = textOf(raw, "owner"); owner && !owner->empty()) assignee = owner;
    }
    if (assignee) p.assignee = util::trimToNull(*assignee);
    raw.erase("owner");

    // 9.
    p.clearUnsolvedIfSolved();

    p.extra = extraKeys(raw, PROBLEM_KEYS);

    if (!result.changed) result.changed = nlohmann::json(p) != original;
    return result;
}

ContestNormalization normalizeContest(const nlohmann::json& raw) {
    ContestNormalization result;
    const nlohmann::json obj = raw.is_object() ? raw : nlohmann::json::object();

    auto& c = result.record;
    c.id = textOr(obj, "id");
    c.name = textOr(obj, "name");
    c.rank_str = textOf(obj, "rank_str");
    c.summary = textOf(obj, "summary");
    c.created_at = textOr(obj, "created_at");
    c.updated_at = textOr(obj, "updated_at");

    long long total = Contest::MIN_PROBLEMS;
    if (const auto it = obj.find("total_problems"); it != obj.end()) {
        // zero and unparsable counts fall back to the minimum
        if (const auto n = coerceInteger(*it); n && *n != 0) total = *n;
    }
    c.total_problems = static_cast<int>(std::clamp<long long>(total, Contest::MIN_PROBLEMS, Contest::MAX_PROBLEMS));

    nlohmann::json entries = nlohmann::json::array();
    if (const auto it = obj.find("problems"); it != obj.end() && it->is_array()) entries = *it;

    c.problems.reserve(static_cast<size_t>(c.total_problems));
    for (size_t i = 0; i < static_cast<size_t>(c.total_problems); ++i) {
        ContestProblem entry;
        entry.letter = letterFor(i);
        if (i < entries.size() && entries[i].is_object()) {
            const auto& e = entries[i];
            const auto count = [&e](const char* key) -> long long {
                const auto it = e.find(key);
                if (it == e.end() || it->is_null()) return 0;
                return std::max<long long>(0, coerceInteger(*it).value_or(0));
            };
            entry.pass_count = count("pass_count");
            entry.attempt_count = count("attempt_count");
            if (const auto status = textOf(e, "my_status"))
                entry.my_status = contestStatusFromString(*status).value_or(ContestProblem::Status::Unsubmitted);
        }
        c.problems.push_back(std::move(entry));
    }

    c.extra = extraKeys(obj, CONTEST_KEYS);

    result.changed = nlohmann::json(c) != raw;
    return result;
}

}
