#pragma once

#include "types/Problem.hpp"
#include "types/Contest.hpp"

#include <array>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace compass::storage {

// Inline solution keys written by earlier versions, in priority order.
inline constexpr std::array<const char*, 3> LEGACY_SOLUTION_KEYS = {"solution_markdown", "solution_md", "solution"};

struct ProblemMigration {
    types::Problem record;
    std::optional<std::string> extracted_solution{std::nullopt};
    bool changed{false};
};

struct ContestNormalization {
    types::Contest record;
    bool changed{false};
};

/*
 * Upgrades one raw problem record of unknown vintage to the current schema.
 * Pure: no I/O, never throws on malformed field values. An absent id is left
 * empty for the caller to assign. Running it on the encoding of its own
 * output yields the same record with changed == false.
 */
ProblemMigration migrateProblem(nlohmann::json raw);

// Re-syncs the per-letter entries with total_problems and coerces counts and statuses.
ContestNormalization normalizeContest(const nlohmann::json& raw);

// Lenient integer coercion: numbers truncate, bools map to 0/1, numeric
// strings parse with surrounding whitespace. Anything else is nullopt.
std::optional<long long> coerceInteger(const nlohmann::json& value);

}
