#include "storage/ContestStore.hpp"
#include "storage/Migrator.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/strings.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <stdexcept>

using namespace compass::types;
using namespace compass::logging;

namespace compass::storage {

namespace {

bool isManagedKey(const std::string& key) {
    return key == "id" || key == "created_at" || key == "updated_at";
}

void requireCount(const nlohmann::json& entry, const char* key, const size_t index) {
    const auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) return;
    if (!it->is_number_integer() || it->get<long long>() < 0)
        throw std::invalid_argument(fmt::format("problems[{}].{} must be a non-negative integer", index, key));
}

void validateContestInput(const nlohmann::json& input, const bool creating) {
    if (!input.is_object()) throw std::invalid_argument("Contest input must be a JSON object");

    if (const auto it = input.find("name"); it != input.end()) {
        if (!it->is_string() || util::isBlank(it->get<std::string>()))
            throw std::invalid_argument("name must be a non-empty string");
    } else if (creating) {
        throw std::invalid_argument("name is required");
    }

    if (const auto it = input.find("total_problems"); it != input.end()) {
        if (!it->is_number_integer() || it->get<long long>() < Contest::MIN_PROBLEMS ||
            it->get<long long>() > Contest::MAX_PROBLEMS)
            throw std::invalid_argument(fmt::format("total_problems must be an integer between {} and {}",
                                                    Contest::MIN_PROBLEMS, Contest::MAX_PROBLEMS));
    } else if (creating) {
        throw std::invalid_argument("total_problems is required");
    }

    for (const auto* key : {"rank_str", "summary"}) {
        const auto it = input.find(key);
        if (it != input.end() && !it->is_null() && !it->is_string())
            throw std::invalid_argument(std::string(key) + " must be a string or null");
    }

    const auto problems = input.find("problems");
    if (problems == input.end() || problems->is_null()) return;
    if (!problems->is_array()) throw std::invalid_argument("problems must be an array");

    for (size_t i = 0; i < problems->size(); ++i) {
        const auto& entry = (*problems)[i];
        if (!entry.is_object()) throw std::invalid_argument(fmt::format("problems[{}] must be an object", i));
        requireCount(entry, "pass_count", i);
        requireCount(entry, "attempt_count", i);
        if (const auto st = entry.find("my_status"); st != entry.end() && !st->is_null()) {
            if (!st->is_string() || !contestStatusFromString(st->get<std::string>()))
                throw std::invalid_argument(fmt::format("problems[{}].my_status must be ac, attempted or unsubmitted", i));
        }
    }
}

}

ContestStore::ContestStore(std::filesystem::path containerPath)
    : RecordStore(std::move(containerPath), "contest") {}

ContestStore::ContestStore(const config::StorageConfig& cfg) : ContestStore(cfg.contestsPath()) {}

ContestStore::Normalized ContestStore::normalize(const nlohmann::json& raw) {
    auto n = normalizeContest(raw);
    if (n.record.id.empty()) {
        n.record.id = util::generateUUID();
        n.changed = true;
    }
    return {std::move(n.record), n.changed};
}

Contest ContestStore::create(const nlohmann::json& input) {
    validateContestInput(input, true);

    auto raw = nlohmann::json::object();
    for (const auto& [key, value] : input.items())
        if (!isManagedKey(key)) raw[key] = value;

    const auto now = util::nowIso8601();
    raw["id"] = util::generateUUID();
    raw["name"] = util::trim(input.at("name").get<std::string>());
    raw["created_at"] = now;
    raw["updated_at"] = now;

    auto contest = normalizeContest(raw).record;

    withLock([&] {
        auto records = loadUnlocked();
        records.push_back(contest);
        saveUnlocked(records);
    });

    LogRegistry::storage()->info("[ContestStore] Created contest {} ({}, {} problems)",
                                 contest.id, contest.name, contest.total_problems);
    return contest;
}

Contest ContestStore::update(const std::string& id, const nlohmann::json& input) {
    validateContestInput(input, false);

    auto updated = withLock([&] {
        auto records = loadUnlocked();
        const auto it = std::ranges::find(records, id, &Contest::id);
        if (it == records.end()) throw NotFound(name(), id);

        nlohmann::json merged = *it;
        for (const auto& [key, value] : input.items())
            if (!isManagedKey(key)) merged[key] = value;
        if (input.contains("name")) merged["name"] = util::trim(input.at("name").get<std::string>());
        merged["updated_at"] = util::nowIso8601();

        auto contest = normalizeContest(merged).record;
        contest.id = it->id;
        contest.created_at = it->created_at;
        *it = contest;

        saveUnlocked(records);
        return contest;
    });

    LogRegistry::storage()->info("[ContestStore] Updated contest {}", id);
    return updated;
}

void ContestStore::remove(const std::string& id) {
    withLock([&] {
        auto records = loadUnlocked();
        if (std::erase_if(records, [&](const Contest& c) { return c.id == id; }) == 0)
            throw NotFound(name(), id);
        saveUnlocked(records);
    });
    LogRegistry::storage()->info("[ContestStore] Deleted contest {}", id);
}

}
