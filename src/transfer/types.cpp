#include "dtx/transfer/types.hpp"

namespace dtx::transfer {

const char* to_string(Direction direction) noexcept {
    switch (direction) {
        case Direction::Pull: return "pull";
        case Direction::Push: return "push";
    }
    return "unknown";
}

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Probing: return "Probing";
        case SessionState::Running: return "Running";
        case SessionState::Completed: return "Completed";
        case SessionState::Failed: return "Failed";
        case SessionState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

} // namespace dtx::transfer
