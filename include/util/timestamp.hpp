#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace compass::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string nowIso8601() {
    return timestampToString(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

// Local wall clock, used for human-facing labels such as default commit messages.
inline std::string localDateTime() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buffer[20];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return {buffer};
}

}
