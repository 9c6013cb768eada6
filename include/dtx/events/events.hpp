/**
 * @file events.hpp
 * @brief Events published by the transfer orchestrator
 *
 * NAMING CONVENTION:
 * Events are past-tense: TransferStartedEvent, SizeProbedEvent
 *
 * ORDER PER SESSION:
 * TransferStartedEvent
 * SessionStateChangedEvent (Idle -> Probing)
 * SizeProbedEvent
 * SessionStateChangedEvent (Probing -> Running)
 * TransferProgressEvent ...         (non-decreasing bytes)
 * SessionStateChangedEvent (-> terminal)
 * TransferFinishedEvent             (exactly one)
 *
 * A session that fails or is cancelled before Running skips the middle part.
 */

#pragma once

#include "dtx/core/error.hpp"
#include "dtx/progress/progress_parser.hpp"
#include "dtx/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace dtx::events {

/**
 * @brief Emitted by start() before the session leaves Idle
 *
 * WHO SUBSCRIBES:
 * - Logger (log the request)
 * - Metrics (count started transfers)
 */
struct TransferStartedEvent {
    std::uint64_t session_id = 0;
    transfer::Direction direction = transfer::Direction::Pull;
    std::string local_path;
    std::string remote_path;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct SessionStateChangedEvent {
    std::uint64_t session_id = 0;
    transfer::SessionState from = transfer::SessionState::Idle;
    transfer::SessionState to = transfer::SessionState::Idle;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Result of the size probe
 *
 * known == false means degraded mode: progress events carry bytes and speed
 * but no percentage. error holds the probe failure, if that was the reason.
 */
struct SizeProbedEvent {
    std::uint64_t session_id = 0;
    bool known = false;
    std::uint64_t total_bytes = 0;
    std::optional<Error> error;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief One accepted meter sample
 *
 * WHO SUBSCRIBES:
 * - Presentation layer (progress bar, speed label)
 * - Logger (debug level)
 */
struct TransferProgressEvent {
    std::uint64_t session_id = 0;
    progress::ProgressEvent progress;
    std::optional<std::uint64_t> total_bytes;
};

/**
 * @brief Terminal event, exactly one per session
 *
 * error is set for Failed (kind, stage, exit code, diagnostics) and for
 * Cancelled (kind UserCancelled).
 */
struct TransferFinishedEvent {
    std::uint64_t session_id = 0;
    transfer::Direction direction = transfer::Direction::Pull;
    transfer::SessionState state = transfer::SessionState::Completed;
    std::uint64_t transferred_bytes = 0;
    std::optional<std::uint64_t> total_bytes;
    std::optional<Error> error;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

} // namespace dtx::events
