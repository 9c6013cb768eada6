#include "dtx/events/components.hpp"
#include "dtx/core/format.hpp"

#include <spdlog/spdlog.h>

namespace dtx::events {

using transfer::SessionState;

LoggerComponent::LoggerComponent(EventBus& bus) : bus_(bus) {
    started_id_ = bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
        on_started(e);
    });

    state_id_ = bus_.subscribe<SessionStateChangedEvent>([this](const SessionStateChangedEvent& e) {
        on_state_changed(e);
    });

    probed_id_ = bus_.subscribe<SizeProbedEvent>([this](const SizeProbedEvent& e) {
        on_size_probed(e);
    });

    progress_id_ = bus_.subscribe<TransferProgressEvent>([this](const TransferProgressEvent& e) {
        on_progress(e);
    });

    finished_id_ = bus_.subscribe<TransferFinishedEvent>([this](const TransferFinishedEvent& e) {
        on_finished(e);
    });
}

LoggerComponent::~LoggerComponent() {
    bus_.unsubscribe<TransferStartedEvent>(started_id_);
    bus_.unsubscribe<SessionStateChangedEvent>(state_id_);
    bus_.unsubscribe<SizeProbedEvent>(probed_id_);
    bus_.unsubscribe<TransferProgressEvent>(progress_id_);
    bus_.unsubscribe<TransferFinishedEvent>(finished_id_);
}

void LoggerComponent::on_started(const TransferStartedEvent& e) {
    spdlog::info("[TransferStarted] session={} direction={} local={} remote={}",
                 e.session_id, transfer::to_string(e.direction), e.local_path, e.remote_path);
}

void LoggerComponent::on_state_changed(const SessionStateChangedEvent& e) {
    spdlog::debug("[StateChanged] session={} {} -> {}",
                  e.session_id, transfer::to_string(e.from), transfer::to_string(e.to));
}

void LoggerComponent::on_size_probed(const SizeProbedEvent& e) {
    if (e.known) {
        spdlog::info("[SizeProbed] session={} total={}", e.session_id, core::format_bytes(e.total_bytes));
    } else {
        spdlog::warn("[SizeProbed] session={} total unknown{}", e.session_id,
                     e.error ? ": " + e.error->describe() : std::string());
    }
}

void LoggerComponent::on_progress(const TransferProgressEvent& e) {
    const auto& p = e.progress;
    if (p.percent) {
        spdlog::debug("[Progress] session={} {:.1f}% {} at {}", e.session_id, *p.percent,
                      core::format_bytes(p.bytes_transferred), core::format_speed(p.smoothed_speed));
    } else {
        spdlog::debug("[Progress] session={} {} at {}", e.session_id,
                      core::format_bytes(p.bytes_transferred), core::format_speed(p.smoothed_speed));
    }
}

void LoggerComponent::on_finished(const TransferFinishedEvent& e) {
    switch (e.state) {
        case SessionState::Completed:
            spdlog::info("[TransferFinished] session={} completed: {} in {}ms",
                         e.session_id, core::format_bytes(e.transferred_bytes), e.duration.count());
            break;
        case SessionState::Cancelled:
            spdlog::warn("[TransferFinished] session={} cancelled after {}",
                         e.session_id, core::format_bytes(e.transferred_bytes));
            break;
        default:
            spdlog::error("[TransferFinished] session={} {}: {}", e.session_id,
                          transfer::to_string(e.state), e.error ? e.error->describe() : std::string("no error recorded"));
            if (e.error && !e.error->diagnostics.empty()) {
                spdlog::error("[TransferFinished] diagnostics:\n{}", e.error->diagnostics);
            }
            break;
    }
}

MetricsComponent::MetricsComponent(EventBus& bus) : bus_(bus) {
    started_id_ = bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
        stats_.transfers_started++;
    });

    probed_id_ = bus_.subscribe<SizeProbedEvent>([this](const SizeProbedEvent& e) {
        if (e.error) {
            stats_.size_probe_failures++;
        }
    });

    progress_id_ = bus_.subscribe<TransferProgressEvent>([this](const TransferProgressEvent&) {
        stats_.progress_updates++;
    });

    finished_id_ = bus_.subscribe<TransferFinishedEvent>([this](const TransferFinishedEvent& e) {
        on_finished(e);
    });
}

MetricsComponent::~MetricsComponent() {
    bus_.unsubscribe<TransferStartedEvent>(started_id_);
    bus_.unsubscribe<SizeProbedEvent>(probed_id_);
    bus_.unsubscribe<TransferProgressEvent>(progress_id_);
    bus_.unsubscribe<TransferFinishedEvent>(finished_id_);
}

void MetricsComponent::on_finished(const TransferFinishedEvent& e) {
    switch (e.state) {
        case SessionState::Completed: stats_.transfers_completed++; break;
        case SessionState::Cancelled: stats_.transfers_cancelled++; break;
        default: stats_.transfers_failed++; break;
    }
    if (e.direction == transfer::Direction::Push) {
        stats_.bytes_pushed += e.transferred_bytes;
    } else {
        stats_.bytes_pulled += e.transferred_bytes;
    }
}

void MetricsComponent::print_stats() const {
    spdlog::info("Transfer statistics:");
    spdlog::info("  Started:          {}", stats_.transfers_started.load());
    spdlog::info("  Completed:        {}", stats_.transfers_completed.load());
    spdlog::info("  Failed:           {}", stats_.transfers_failed.load());
    spdlog::info("  Cancelled:        {}", stats_.transfers_cancelled.load());
    spdlog::info("  Pulled:           {}", core::format_bytes(stats_.bytes_pulled.load()));
    spdlog::info("  Pushed:           {}", core::format_bytes(stats_.bytes_pushed.load()));
    spdlog::info("  Progress updates: {}", stats_.progress_updates.load());
    spdlog::info("  Probe failures:   {}", stats_.size_probe_failures.load());
}

UpdateQueueComponent::UpdateQueueComponent(EventBus& bus) : bus_(bus) {
    probed_id_ = bus_.subscribe<SizeProbedEvent>([this](const SizeProbedEvent& e) {
        queue_.push(e);
    });

    progress_id_ = bus_.subscribe<TransferProgressEvent>([this](const TransferProgressEvent& e) {
        queue_.push(e);
    });

    finished_id_ = bus_.subscribe<TransferFinishedEvent>([this](const TransferFinishedEvent& e) {
        queue_.push(e);
    });
}

UpdateQueueComponent::~UpdateQueueComponent() {
    bus_.unsubscribe<SizeProbedEvent>(probed_id_);
    bus_.unsubscribe<TransferProgressEvent>(progress_id_);
    bus_.unsubscribe<TransferFinishedEvent>(finished_id_);
    queue_.shutdown();
}

} // namespace dtx::events
