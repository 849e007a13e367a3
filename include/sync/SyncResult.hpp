#pragma once

#include <string>

namespace compass::sync {

struct SyncResult {
    enum class Outcome { Success, NoChanges, RemoteNotConfigured, ToolFailure };

    Outcome outcome{Outcome::Success};
    std::string failed_step{};
    std::string transcript{};

    [[nodiscard]] bool ok() const { return outcome == Outcome::Success; }
};

std::string to_string(SyncResult::Outcome outcome);

}
