#pragma once

#include "dtx/core/result.hpp"
#include "dtx/progress/progress_parser.hpp"
#include "dtx/transfer/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace dtx::transfer {

/**
 * @brief One transfer's state machine plus its progress accounting
 *
 * Idle -> Probing -> Running -> {Completed | Failed | Cancelled}
 * Probing may also go straight to Failed or Cancelled. Terminal states are
 * final; re-applying the current state is a no-op.
 *
 * Not thread-safe: the orchestrator serializes access.
 */
class TransferSession {
public:
    TransferSession(std::uint64_t session_id, TransferRequest request,
                    progress::ParserOptions parser_options = {});

    [[nodiscard]] std::uint64_t session_id() const noexcept { return info_.session_id; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const TransferSessionInfo& info() const noexcept { return info_; }

    Result<void> begin_probing();

    /**
     * @brief Record the probe result; 0 or nullopt leaves the total unknown
     */
    void set_total(std::optional<std::uint64_t> total_bytes);

    /**
     * @brief Probing -> Running; restarts the progress parser at `now`
     */
    Result<void> mark_running(progress::Clock::time_point now);

    /**
     * @brief Feed a raw chunk of the meter's channel, returns the new events
     */
    std::vector<progress::ProgressEvent> ingest_progress(std::string_view chunk, progress::Clock::time_point now);

    /**
     * @brief Flush a trailing unterminated meter line
     */
    std::vector<progress::ProgressEvent> flush_progress(progress::Clock::time_point now);

    Result<void> complete();
    Result<void> mark_failed(Error error);
    Result<void> mark_cancelled(Error error);

    Result<void> transition_to(SessionState next_state);

    /**
     * @brief Non-numeric text the meter printed (pv's own error messages)
     */
    const std::string& meter_diagnostics() const noexcept { return parser_.diagnostics(); }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;
    void record(const std::vector<progress::ProgressEvent>& events);

    TransferSessionInfo info_;
    progress::ProgressParser parser_;
};

} // namespace dtx::transfer
