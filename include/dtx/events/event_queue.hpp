/**
 * @file event_queue.hpp
 * @brief Thread-safe queue handing events from the transfer worker to a consumer
 *
 * The orchestrator emits on its worker thread. A front end that wants to
 * render on its own thread pushes events here and pops them there.
 *
 * EXAMPLE:
 * ThreadSafeQueue<TransferUpdate> queue;
 * queue.push(update);                  // worker thread
 * auto next = queue.pop_for(100ms);    // UI thread
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace dtx::events {

/**
 * @brief Thread-safe FIFO queue
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - shutdown() wakes every blocked consumer; items already queued are still
 *   handed out before pops start returning nullopt
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    /**
     * @brief Block until an item arrives; nullopt once shut down and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return wakeable(); });
        return take_front();
    }

    /**
     * @brief Like pop(), but gives up after timeout
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this]() { return wakeable(); });
        return take_front();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return items_.empty();
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            shutdown_ = true;
        }
        ready_.notify_all();
    }

    /**
     * @brief Accept blocking pops again after shutdown()
     */
    void reset() {
        std::lock_guard lock(mutex_);
        shutdown_ = false;
    }

private:
    bool wakeable() const { return !items_.empty() || shutdown_; }

    // Caller holds mutex_
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool shutdown_ = false;
};

} // namespace dtx::events
