#pragma once

#include <stdexcept>
#include <string>

namespace compass::storage {

// Container bytes are not a well-formed record collection.
class CorruptContainer : public std::runtime_error {
public:
    explicit CorruptContainer(const std::string& msg) : std::runtime_error(msg) {}
};

class NotFound : public std::runtime_error {
public:
    NotFound(const std::string& kind, const std::string& id)
        : std::runtime_error(kind + " not found: " + id), kind_(kind), id_(id) {}

    [[nodiscard]] const std::string& kind() const { return kind_; }
    [[nodiscard]] const std::string& id() const { return id_; }

private:
    std::string kind_, id_;
};

}
