#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace compass::storage {

// Throws CorruptContainer unless bytes hold a JSON array.
std::vector<nlohmann::json> decodeContainer(std::string_view bytes);

// Pretty-printed array with sorted keys and a trailing newline.
std::string encodeContainer(const std::vector<nlohmann::json>& records);

}
