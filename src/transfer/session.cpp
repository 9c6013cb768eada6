#include "dtx/transfer/session.hpp"
#include "dtx/core/format.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>

namespace dtx::transfer {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Idle, {SessionState::Probing}},
        {SessionState::Probing, {SessionState::Running, SessionState::Failed, SessionState::Cancelled}},
        {SessionState::Running, {SessionState::Completed, SessionState::Failed, SessionState::Cancelled}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

TransferSession::TransferSession(std::uint64_t session_id, TransferRequest request,
                                 progress::ParserOptions parser_options)
    : parser_(parser_options) {
    info_.session_id = session_id;
    info_.direction = request.direction;
    info_.local_path = std::move(request.local_path);
    info_.remote_path = std::move(request.remote_path);
    info_.state = SessionState::Idle;
}

Result<void> TransferSession::begin_probing() {
    if (info_.state != SessionState::Idle) {
        return Fail<void>(ErrorKind::Internal, "session already started");
    }
    return transition_to(SessionState::Probing);
}

void TransferSession::set_total(std::optional<std::uint64_t> total_bytes) {
    info_.total_bytes = (total_bytes && *total_bytes > 0) ? total_bytes : std::nullopt;
}

Result<void> TransferSession::mark_running(progress::Clock::time_point now) {
    auto moved = transition_to(SessionState::Running);
    if (moved.is_error()) {
        return moved;
    }
    info_.started_at = now;
    parser_.reset(info_.total_bytes, now);
    return moved;
}

std::vector<progress::ProgressEvent> TransferSession::ingest_progress(std::string_view chunk,
                                                                      progress::Clock::time_point now) {
    if (info_.state != SessionState::Running) {
        return {};
    }
    auto events = parser_.feed(chunk, now);
    record(events);
    return events;
}

std::vector<progress::ProgressEvent> TransferSession::flush_progress(progress::Clock::time_point now) {
    auto events = parser_.finish(now);
    record(events);
    return events;
}

void TransferSession::record(const std::vector<progress::ProgressEvent>& events) {
    if (events.empty()) {
        return;
    }
    const auto& latest = events.back();
    info_.transferred_bytes = std::max(info_.transferred_bytes, latest.bytes_transferred);
    info_.last_progress = latest;
    const auto& window = parser_.speed_samples();
    info_.speed_samples.assign(window.begin(), window.end());
}

Result<void> TransferSession::complete() {
    auto moved = transition_to(SessionState::Completed);
    if (moved.is_ok() && info_.total_bytes && info_.transferred_bytes < *info_.total_bytes) {
        // Completion is decided by stage exit codes, not by reaching the probed total
        spdlog::warn("Session {} completed at {} of {} probed", info_.session_id,
                     core::format_bytes(info_.transferred_bytes), core::format_bytes(*info_.total_bytes));
    }
    return moved;
}

Result<void> TransferSession::mark_failed(Error error) {
    if (is_terminal(info_.state)) {
        return Fail<void>(ErrorKind::Internal,
                          std::string("session already ") + to_string(info_.state));
    }
    info_.last_error = std::move(error);
    return transition_to(SessionState::Failed);
}

Result<void> TransferSession::mark_cancelled(Error error) {
    if (is_terminal(info_.state)) {
        return Fail<void>(ErrorKind::Internal,
                          std::string("session already ") + to_string(info_.state));
    }
    info_.last_error = std::move(error);
    return transition_to(SessionState::Cancelled);
}

Result<void> TransferSession::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Fail<void>(ErrorKind::Internal,
                          std::string("illegal session transition ") + to_string(info_.state) +
                          " -> " + to_string(next_state));
    }

    spdlog::debug("Session {}: {} -> {}", info_.session_id, to_string(info_.state), to_string(next_state));
    info_.state = next_state;
    return Ok();
}

bool TransferSession::can_transition(SessionState target) const noexcept {
    return is_progressive(info_.state, target);
}

} // namespace dtx::transfer
