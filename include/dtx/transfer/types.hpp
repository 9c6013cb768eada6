#pragma once

#include "dtx/core/error.hpp"
#include "dtx/progress/progress_parser.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dtx::transfer {

enum class Direction {
    Pull,   // device -> host
    Push    // host -> device
};

enum class SessionState {
    Idle,
    Probing,
    Running,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(Direction direction) noexcept;
const char* to_string(SessionState state) noexcept;

inline bool is_terminal(SessionState state) noexcept {
    return state == SessionState::Completed ||
           state == SessionState::Failed ||
           state == SessionState::Cancelled;
}

/**
 * @brief What the caller asked for
 */
struct TransferRequest {
    Direction direction = Direction::Pull;
    std::string local_path;
    std::string remote_path;   ///< Empty means the transfer root itself
};

/**
 * @brief Snapshot of one transfer session
 */
struct TransferSessionInfo {
    std::uint64_t session_id = 0;
    Direction direction = Direction::Pull;
    std::string local_path;
    std::string remote_path;
    std::optional<std::uint64_t> total_bytes;   ///< Empty until probed, or when probing failed
    std::uint64_t transferred_bytes = 0;        ///< Never decreases
    SessionState state = SessionState::Idle;
    std::chrono::steady_clock::time_point started_at{};   ///< Set on entering Running
    std::vector<progress::SpeedSample> speed_samples;     ///< Bounded window
    std::optional<progress::ProgressEvent> last_progress;
    std::optional<Error> last_error;            ///< Set in Failed and Cancelled
};

} // namespace dtx::transfer
