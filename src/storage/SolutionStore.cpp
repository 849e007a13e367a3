#include "storage/SolutionStore.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"
#include "util/strings.hpp"

#include <fmt/core.h>
#include <cctype>
#include <stdexcept>

using namespace compass::logging;
namespace fs = std::filesystem;

namespace compass::storage {

SolutionStore::SolutionStore(fs::path dir) : dir_(std::move(dir)) {}

std::string SolutionStore::fileStem(const std::string& problemId) {
    if (problemId.empty()) throw std::invalid_argument("Problem id must not be empty");

    std::string stem;
    stem.reserve(problemId.size());
    for (const unsigned char c : problemId) {
        if (std::isalnum(c) || c == '-' || c == '_' || (c == '.' && !stem.empty())) stem += static_cast<char>(c);
        else stem += fmt::format("%{:02X}", c);
    }
    return stem;
}

fs::path SolutionStore::pathFor(const std::string& problemId) const {
    return dir_ / (fileStem(problemId) + ".md");
}

std::optional<std::string> SolutionStore::read(const std::string& problemId) const {
    const auto path = pathFor(problemId);
    if (!fs::is_regular_file(path)) return std::nullopt;
    return util::readFileToString(path);
}

bool SolutionStore::write(const std::string& problemId, const std::string& text) const {
    if (util::isBlank(text)) {
        remove(problemId);
        return false;
    }

    const auto path = pathFor(problemId);
    util::writeFileAtomic(path, text);
    LogRegistry::storage()->debug("[SolutionStore] Wrote {} bytes to {}", text.size(), path.string());
    return true;
}

bool SolutionStore::remove(const std::string& problemId) const {
    const auto path = pathFor(problemId);
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) throw fs::filesystem_error("Failed to remove solution file", path, ec);
    if (removed) LogRegistry::storage()->debug("[SolutionStore] Removed {}", path.string());
    return removed;
}

bool SolutionStore::exists(const std::string& problemId) const {
    return fs::is_regular_file(pathFor(problemId));
}

}
