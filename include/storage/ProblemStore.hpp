#pragma once

#include "storage/RecordStore.hpp"
#include "storage/SolutionStore.hpp"
#include "types/Problem.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace compass::config { struct StorageConfig; }

namespace compass::storage {

class ProblemStore final : public RecordStore<types::Problem> {
public:
    ProblemStore(std::filesystem::path containerPath, std::filesystem::path solutionsDir);
    explicit ProblemStore(const config::StorageConfig& cfg);

    types::Problem create(const nlohmann::json& input);

    // Merges the given keys over the stored record; id and created_at are kept.
    types::Problem update(const std::string& id, const nlohmann::json& input);

    // Removes the record and its solution side-file.
    void remove(const std::string& id);

    std::optional<std::string> getSolution(const std::string& id);
    types::Problem putSolution(const std::string& id, const std::string& text);
    types::Problem deleteSolution(const std::string& id);

    // Records with their solution inlined as solution_markdown.
    nlohmann::json exportAll();

    // Replaces the whole collection after backing up the current container.
    size_t importAll(const nlohmann::json& records);

    [[nodiscard]] std::filesystem::path importBackupPath() const { return siblingWithSuffix(".bak.json"); }
    [[nodiscard]] const SolutionStore& solutions() const { return solutions_; }

protected:
    Normalized normalize(const nlohmann::json& raw) override;
    void afterLoad(std::vector<types::Problem>& records) override;

private:
    SolutionStore solutions_;

    types::Problem& findUnlocked(std::vector<types::Problem>& records, const std::string& id) const;
    void writeSolutionUnlocked(const std::string& id, const std::string& text) const;
};

}
