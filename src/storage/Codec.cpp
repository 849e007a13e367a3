#include "storage/Codec.hpp"
#include "storage/errors.hpp"

#include <fmt/core.h>

namespace compass::storage {

std::vector<nlohmann::json> decodeContainer(const std::string_view bytes) {
    auto root = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded())
        throw CorruptContainer(fmt::format("container is not valid JSON ({} bytes)", bytes.size()));
    if (!root.is_array())
        throw CorruptContainer(fmt::format("container root is a JSON {}, expected an array", root.type_name()));

    std::vector<nlohmann::json> records;
    records.reserve(root.size());
    for (auto& rec : root) records.push_back(std::move(rec));
    return records;
}

std::string encodeContainer(const std::vector<nlohmann::json>& records) {
    const nlohmann::json root(records);
    return root.dump(2, ' ', /*ensure_ascii=*/false, nlohmann::json::error_handler_t::replace) + "\n";
}

}
