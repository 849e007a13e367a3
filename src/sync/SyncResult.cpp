#include "sync/SyncResult.hpp"

#include <stdexcept>

namespace compass::sync {

std::string to_string(const SyncResult::Outcome outcome) {
    switch (outcome) {
    case SyncResult::Outcome::Success: return "success";
    case SyncResult::Outcome::NoChanges: return "no_changes";
    case SyncResult::Outcome::RemoteNotConfigured: return "remote_not_configured";
    case SyncResult::Outcome::ToolFailure: return "tool_failure";
    default: throw std::invalid_argument("Unknown sync outcome");
    }
}

}
