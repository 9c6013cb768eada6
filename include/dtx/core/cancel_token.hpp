#pragma once

#include <atomic>

namespace dtx {

/**
 * @brief Cooperative cancellation flag
 *
 * Set from any thread, observed by the supervising loop at its next wait
 * point. Nothing is interrupted forcefully; the observer decides how to
 * wind down (signal stages, reap, report Cancelled).
 */
class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void request() noexcept { requested_.store(true, std::memory_order_release); }
    void reset() noexcept { requested_.store(false, std::memory_order_release); }

    bool is_requested() const noexcept { return requested_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> requested_{false};
};

} // namespace dtx
