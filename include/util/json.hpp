#pragma once

#include <optional>
#include <nlohmann/json.hpp>

namespace compass::util {

template <typename T>
nlohmann::json nullable(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

}
