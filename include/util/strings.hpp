#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace compass::util {

inline bool isSpace(const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline std::string trim(std::string_view s) {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return std::string{s};
}

inline bool isBlank(const std::string_view s) {
    return std::ranges::all_of(s, isSpace);
}

// Trimmed value, or nullopt when nothing but whitespace is left.
inline std::optional<std::string> trimToNull(const std::string_view s) {
    auto t = trim(s);
    if (t.empty()) return std::nullopt;
    return t;
}

inline std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}
