#pragma once

#include <filesystem>
#include <string>

namespace compass::util {

std::string readFileToString(const std::filesystem::path& path);

// Truncating write, used for side-files and backups.
void writeFile(const std::filesystem::path& path, const std::string& content);

// Writes to a sibling temp file and renames it over path, so readers see
// either the old or the new content, never a partial write.
void writeFileAtomic(const std::filesystem::path& path, const std::string& content);

std::string generate_random_suffix(size_t length = 8);

}
