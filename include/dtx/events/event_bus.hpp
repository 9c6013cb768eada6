/**
 * @file event_bus.hpp
 * @brief Type-safe event bus between the orchestrator and its observers
 *
 * WHY THIS FILE EXISTS:
 * The orchestrator publishes session lifecycle and progress without knowing
 * who listens: the CLI, a logger, a metrics counter, a GUI adapter. Observers
 * subscribe without knowing which worker thread emits.
 *
 * WHAT IT DOES:
 * - Type-safe event subscription and emission
 * - Thread-safe concurrent access
 * - Handler registration and unregistration
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<TransferProgressEvent>([](const TransferProgressEvent& e) { ... });
 * bus.emit(TransferProgressEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace dtx::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Multiple threads can emit events concurrently
 * - Multiple threads can subscribe concurrently
 * - Handlers are called synchronously in the emitting thread, without the
 *   lock held, so a handler may subscribe or unsubscribe
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for one event type
     *
     * RETURNS:
     * Subscription id for unsubscribe<EventType>()
     *
     * EXAMPLE:
     * auto id = bus.subscribe<TransferFinishedEvent>([](const TransferFinishedEvent& e) {
     *     spdlog::info("Session {} finished", e.session_id);
     * });
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<const ErasedHandler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const size_t id = next_id_++;
        subscriptions_[std::type_index(typeid(EventType))].push_back(Subscription{id, std::move(erased)});
        return id;
    }

    template<typename EventType>
    void unsubscribe(size_t id) {
        std::unique_lock lock(mutex_);
        auto it = subscriptions_.find(std::type_index(typeid(EventType)));
        if (it == subscriptions_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every handler of its type, in subscription order
     *
     * A handler that throws is logged; the remaining handlers still run and
     * the emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        for (const auto& handler : snapshot(std::type_index(typeid(EventType)))) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = subscriptions_.find(std::type_index(typeid(EventType)));
        return it != subscriptions_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        subscriptions_.clear();
    }

private:
    // Handlers stored under typeid(E) only ever receive an E
    using ErasedHandler = std::function<void(const void*)>;

    struct Subscription {
        size_t id;
        std::shared_ptr<const ErasedHandler> handler;
    };

    // Copied out so handlers run without the lock and may (un)subscribe
    std::vector<std::shared_ptr<const ErasedHandler>> snapshot(std::type_index type) const {
        std::vector<std::shared_ptr<const ErasedHandler>> handlers;
        std::shared_lock lock(mutex_);
        auto it = subscriptions_.find(type);
        if (it != subscriptions_.end()) {
            handlers.reserve(it->second.size());
            for (const auto& subscription : it->second) {
                handlers.push_back(subscription.handler);
            }
        }
        return handlers;
    }

    std::unordered_map<std::type_index, std::vector<Subscription>> subscriptions_;
    mutable std::shared_mutex mutex_;
    size_t next_id_ = 0;
};

} // namespace dtx::events
