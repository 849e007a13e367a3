#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace compass::storage {

// One markdown side-file per problem, named after the problem id.
class SolutionStore {
public:
    explicit SolutionStore(std::filesystem::path dir);

    /*
     * File name for an id, without extension. Letters, digits, '-', '_' and
     * non-leading '.' are kept; every other byte becomes %XX, so distinct ids
     * never share a file and no id leaves the directory. Only an empty id
     * throws (std::invalid_argument).
     */
    [[nodiscard]] static std::string fileStem(const std::string& problemId);

    [[nodiscard]] std::filesystem::path pathFor(const std::string& problemId) const;

    [[nodiscard]] std::optional<std::string> read(const std::string& problemId) const;

    // Blank text removes the side-file instead. Returns whether a file now exists.
    bool write(const std::string& problemId, const std::string& text) const;

    // Returns whether a file was removed.
    bool remove(const std::string& problemId) const;

    [[nodiscard]] bool exists(const std::string& problemId) const;

    [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
};

}
