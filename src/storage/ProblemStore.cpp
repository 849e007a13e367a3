#include "storage/ProblemStore.hpp"
#include "storage/Migrator.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/strings.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

#include <algorithm>
#include <stdexcept>

using namespace compass::types;
using namespace compass::logging;
namespace fs = std::filesystem;

namespace compass::storage {

namespace {

// Keys the caller may never set directly.
bool isManagedKey(const std::string& key) {
    return key == "id" || key == "created_at" || key == "updated_at" || key == "has_solution";
}

void requireOptionalString(const nlohmann::json& input, const char* key) {
    const auto it = input.find(key);
    if (it != input.end() && !it->is_null() && !it->is_string())
        throw std::invalid_argument(std::string(key) + " must be a string or null");
}

void validateProblemInput(const nlohmann::json& input, const bool requireTitle) {
    if (!input.is_object()) throw std::invalid_argument("Problem input must be a JSON object");

    if (const auto it = input.find("title"); it != input.end()) {
        if (!it->is_string() || util::isBlank(it->get<std::string>()))
            throw std::invalid_argument("title must be a non-empty string");
    } else if (requireTitle) {
        throw std::invalid_argument("title is required");
    }

    for (const auto* key : {"link", "source", "assignee", "unsolved_custom_label", "notes"})
        requireOptionalString(input, key);

    if (const auto it = input.find("solved"); it != input.end() && !it->is_boolean())
        throw std::invalid_argument("solved must be a boolean");

    if (const auto it = input.find("tags"); it != input.end() && !it->is_null()) {
        if (!it->is_array() || !std::ranges::all_of(*it, [](const nlohmann::json& t) { return t.is_string(); }))
            throw std::invalid_argument("tags must be an array of strings");
    }

    if (const auto it = input.find("unsolved_stage"); it != input.end() && !it->is_null()) {
        if (!it->is_string() || !unsolvedStageFromString(it->get<std::string>()))
            throw std::invalid_argument("unsolved_stage must be one of unseen, seen_no_idea, knows_approach");
    }

    if (const auto it = input.find("pass_count"); it != input.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<long long>() < 0)
            throw std::invalid_argument("pass_count must be a non-negative integer");
    }
}

std::string normalizeLineEndings(std::string text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') continue;
        out += text[i];
    }
    return out;
}

}

ProblemStore::ProblemStore(fs::path containerPath, fs::path solutionsDir)
    : RecordStore(std::move(containerPath), "problem"), solutions_(std::move(solutionsDir)) {}

ProblemStore::ProblemStore(const config::StorageConfig& cfg)
    : ProblemStore(cfg.problemsPath(), cfg.solutionsPath()) {}

ProblemStore::Normalized ProblemStore::normalize(const nlohmann::json& raw) {
    auto migration = migrateProblem(raw);
    auto& record = migration.record;

    if (record.id.empty()) {
        record.id = util::generateUUID();
        migration.changed = true;
    }

    if (migration.extracted_solution) {
        LogRegistry::storage()->info("[ProblemStore] Moving inline solution of {} to a side-file", record.id);
        writeSolutionUnlocked(record.id, *migration.extracted_solution);
    }

    return {std::move(record), migration.changed};
}

void ProblemStore::afterLoad(std::vector<Problem>& records) {
    for (auto& p : records) p.has_solution = solutions_.exists(p.id);
}

Problem& ProblemStore::findUnlocked(std::vector<Problem>& records, const std::string& id) const {
    const auto it = std::ranges::find(records, id, &Problem::id);
    if (it == records.end()) throw NotFound(name(), id);
    return *it;
}

void ProblemStore::writeSolutionUnlocked(const std::string& id, const std::string& text) const {
    solutions_.write(id, normalizeLineEndings(text));
}

Problem ProblemStore::create(const nlohmann::json& input) {
    validateProblemInput(input, true);

    auto raw = nlohmann::json::object();
    for (const auto& [key, value] : input.items())
        if (!isManagedKey(key)) raw[key] = value;

    const auto now = util::nowIso8601();
    raw["id"] = util::generateUUID();
    raw["title"] = util::trim(input.at("title").get<std::string>());
    raw["created_at"] = now;
    raw["updated_at"] = now;

    auto migration = migrateProblem(raw);
    auto& problem = migration.record;

    withLock([&] {
        auto records = loadUnlocked();
        records.push_back(problem);
        saveUnlocked(records);
        if (migration.extracted_solution) writeSolutionUnlocked(problem.id, *migration.extracted_solution);
    });

    problem.has_solution = solutions_.exists(problem.id);

    LogRegistry::storage()->info("[ProblemStore] Created problem {} ({})", problem.id, problem.title);
    return problem;
}

Problem ProblemStore::update(const std::string& id, const nlohmann::json& input) {
    validateProblemInput(input, false);

    auto updated = withLock([&] {
        auto records = loadUnlocked();
        auto& existing = findUnlocked(records, id);

        nlohmann::json merged = existing;
        for (const auto& [key, value] : input.items())
            if (!isManagedKey(key)) merged[key] = value;
        if (input.contains("title")) merged["title"] = util::trim(input.at("title").get<std::string>());
        merged["updated_at"] = util::nowIso8601();

        auto migration = migrateProblem(merged);
        auto problem = std::move(migration.record);
        problem.id = existing.id;
        problem.created_at = existing.created_at;
        existing = problem;

        saveUnlocked(records);
        if (migration.extracted_solution) writeSolutionUnlocked(problem.id, *migration.extracted_solution);
        return problem;
    });

    updated.has_solution = solutions_.exists(updated.id);
    LogRegistry::storage()->info("[ProblemStore] Updated problem {}", id);
    return updated;
}

void ProblemStore::remove(const std::string& id) {
    withLock([&] {
        auto records = loadUnlocked();
        const auto removed = std::erase_if(records, [&](const Problem& p) { return p.id == id; });
        if (removed == 0) throw NotFound(name(), id);
        saveUnlocked(records);
        solutions_.remove(id);
    });
    LogRegistry::storage()->info("[ProblemStore] Deleted problem {}", id);
}

std::optional<std::string> ProblemStore::getSolution(const std::string& id) {
    findById(id);
    return solutions_.read(id);
}

Problem ProblemStore::putSolution(const std::string& id, const std::string& text) {
    auto updated = withLock([&] {
        auto records = loadUnlocked();
        auto& problem = findUnlocked(records, id);
        writeSolutionUnlocked(id, text);
        problem.updated_at = util::nowIso8601();
        saveUnlocked(records);
        return problem;
    });

    updated.has_solution = solutions_.exists(id);
    LogRegistry::storage()->info("[ProblemStore] {} solution of {}", updated.has_solution ? "Saved" : "Cleared", id);
    return updated;
}

Problem ProblemStore::deleteSolution(const std::string& id) {
    auto updated = withLock([&] {
        auto records = loadUnlocked();
        auto& problem = findUnlocked(records, id);
        solutions_.remove(id);
        problem.updated_at = util::nowIso8601();
        saveUnlocked(records);
        return problem;
    });

    updated.has_solution = false;
    LogRegistry::storage()->info("[ProblemStore] Deleted solution of {}", id);
    return updated;
}

nlohmann::json ProblemStore::exportAll() {
    auto out = nlohmann::json::array();
    for (const auto& p : loadAll()) {
        nlohmann::json j = p;
        if (const auto sol = solutions_.read(p.id)) j["solution_markdown"] = *sol;
        out.push_back(std::move(j));
    }
    return out;
}

size_t ProblemStore::importAll(const nlohmann::json& records) {
    if (!records.is_array()) throw std::invalid_argument("Import payload must be a JSON array of problems");
    for (const auto& rec : records) {
        if (!rec.is_object()) throw std::invalid_argument("Every imported problem must be a JSON object");
        const auto title = rec.find("title");
        if (title == rec.end() || !title->is_string() || util::isBlank(title->get<std::string>()))
            throw std::invalid_argument("Every imported problem needs a non-empty title");
    }

    const auto count = withLock([&] {
        const auto backup = importBackupPath();
        if (fs::exists(containerPath())) util::writeFile(backup, util::readFileToString(containerPath()));
        else util::writeFile(backup, encodeContainer({}));

        const auto now = util::nowIso8601();
        std::vector<Problem> items;
        items.reserve(records.size());

        for (const auto& rec : records) {
            auto migration = migrateProblem(rec);
            auto& p = migration.record;
            if (p.id.empty()) p.id = util::generateUUID();
            if (p.created_at.empty()) p.created_at = now;
            if (p.updated_at.empty()) p.updated_at = p.created_at;
            if (migration.extracted_solution) writeSolutionUnlocked(p.id, *migration.extracted_solution);
            items.push_back(std::move(p));
        }

        saveUnlocked(items);
        return items.size();
    });

    LogRegistry::storage()->info("[ProblemStore] Imported {} problems, previous container kept at {}",
                                 count, importBackupPath().string());
    return count;
}

}
