/**
 * @file components.hpp
 * @brief Ready-made observers of the transfer events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * UpdateQueueComponent updates(bus);
 * // every orchestrator event now reaches all three
 *
 * Components unsubscribe in their destructor, so they may die before the bus.
 */

#pragma once

#include "dtx/events/event_bus.hpp"
#include "dtx/events/event_queue.hpp"
#include "dtx/events/events.hpp"

#include <atomic>
#include <cstdint>
#include <variant>

namespace dtx::events {

/**
 * @brief Logs every transfer event with spdlog
 *
 * Progress goes to debug so a normal run logs only lifecycle lines.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus);
    ~LoggerComponent();

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_started(const TransferStartedEvent& e);
    void on_state_changed(const SessionStateChangedEvent& e);
    void on_size_probed(const SizeProbedEvent& e);
    void on_progress(const TransferProgressEvent& e);
    void on_finished(const TransferFinishedEvent& e);

    EventBus& bus_;
    size_t started_id_;
    size_t state_id_;
    size_t probed_id_;
    size_t progress_id_;
    size_t finished_id_;
};

/**
 * @brief Counts transfers and bytes moved
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> transfers_started{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> transfers_cancelled{0};
        std::atomic<uint64_t> bytes_pulled{0};
        std::atomic<uint64_t> bytes_pushed{0};
        std::atomic<uint64_t> progress_updates{0};
        std::atomic<uint64_t> size_probe_failures{0};
    };

    explicit MetricsComponent(EventBus& bus);
    ~MetricsComponent();

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const;

private:
    void on_finished(const TransferFinishedEvent& e);

    EventBus& bus_;
    Stats stats_;
    size_t started_id_;
    size_t probed_id_;
    size_t progress_id_;
    size_t finished_id_;
};

using TransferUpdate = std::variant<SizeProbedEvent, TransferProgressEvent, TransferFinishedEvent>;

/**
 * @brief Forwards the events a front end renders into a ThreadSafeQueue
 *
 * USAGE:
 * UpdateQueueComponent updates(bus);
 * while (auto update = updates.queue().pop()) {
 *     std::visit(renderer, *update);
 * }
 */
class UpdateQueueComponent {
public:
    explicit UpdateQueueComponent(EventBus& bus);
    ~UpdateQueueComponent();

    UpdateQueueComponent(const UpdateQueueComponent&) = delete;
    UpdateQueueComponent& operator=(const UpdateQueueComponent&) = delete;

    ThreadSafeQueue<TransferUpdate>& queue() noexcept { return queue_; }

private:
    EventBus& bus_;
    ThreadSafeQueue<TransferUpdate> queue_;
    size_t probed_id_;
    size_t progress_id_;
    size_t finished_id_;
};

} // namespace dtx::events
