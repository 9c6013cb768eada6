#pragma once

/**
 * @file orchestrator.hpp
 * @brief Caller-facing transfer operation: start, observe, cancel
 *
 * HOW IT WORKS:
 * start() hands the session to a worker thread which runs
 *   preflight -> size probe -> build pipeline -> run pipeline
 * and publishes everything on the EventBus. Exactly one session is active per
 * orchestrator; starting another cancels and joins the current one first.
 *
 * THREAD SAFETY:
 * All public methods may be called from any thread. Events are emitted on the
 * worker thread with no orchestrator lock held, so handlers may call
 * current_info() or cancel().
 *
 * EXAMPLE:
 * TransferOrchestrator orchestrator(config, bus, transport, prober, builder, runner);
 * auto id = orchestrator.start(Direction::Pull, "/home/me/Photos", "DCIM");
 * auto info = orchestrator.wait();
 */

#include "dtx/core/cancel_token.hpp"
#include "dtx/core/config.hpp"
#include "dtx/core/result.hpp"
#include "dtx/device/transport.hpp"
#include "dtx/events/event_bus.hpp"
#include "dtx/pipeline/pipeline_builder.hpp"
#include "dtx/pipeline/pipeline_runner.hpp"
#include "dtx/transfer/session.hpp"
#include "dtx/transfer/size_prober.hpp"
#include "dtx/transfer/types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace dtx::transfer {

class TransferOrchestrator {
public:
    TransferOrchestrator(core::TransferConfig config,
                         events::EventBus& bus,
                         const device::DeviceTransport& transport,
                         const SizeProber& prober,
                         const pipeline::PipelineBuilder& builder,
                         const pipeline::PipelineRunner& runner);

    /**
     * @brief Cancels and joins the active session
     */
    ~TransferOrchestrator();

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    /**
     * @brief Begin a transfer; returns the new session id
     *
     * A session still running is cancelled and reaches Cancelled before the
     * new one leaves Idle. Preflight problems do not fail start(): they end
     * the new session in Failed and are reported by TransferFinishedEvent.
     */
    Result<std::uint64_t> start(Direction direction, const std::string& local_path, const std::string& remote_path);
    Result<std::uint64_t> start(const TransferRequest& request);

    /**
     * @brief Request cancellation and block until the session is terminal and
     *        every stage process was reaped
     *
     * Called from an event handler (the worker thread) it only requests.
     */
    void cancel();

    /**
     * @brief Block until the current session is terminal; nullopt if none was started
     */
    std::optional<TransferSessionInfo> wait();

    /**
     * @brief True while a session exists and is not terminal
     */
    bool active() const;

    /**
     * @brief Snapshot of the current (or last finished) session
     */
    std::optional<TransferSessionInfo> current_info() const;

    /**
     * @brief Local side preflight
     *
     * Push: path must be a readable, searchable directory (PathInvalid /
     * PermissionDenied). Pull: the nearest existing ancestor of path must be a
     * writable directory (PermissionDenied).
     */
    static Result<void> check_local_path(Direction direction, const std::string& local_path);

private:
    using SessionChange = std::function<Result<void>(TransferSession&)>;

    void join_worker();
    void finish_interrupted(Error error);
    void run_session();
    void execute(const TransferRequest& request);
    void update_session(const SessionChange& change);
    void finish_failed(Error error);
    void finish_cancelled(std::string reason);
    void publish_finished();

    core::TransferConfig config_;
    events::EventBus& bus_;
    const device::DeviceTransport& transport_;
    const SizeProber& prober_;
    const pipeline::PipelineBuilder& builder_;
    const pipeline::PipelineRunner& runner_;

    std::mutex control_mutex_;     ///< Serializes start/cancel
    std::mutex join_mutex_;        ///< Guards worker_; taken after control_mutex_
    mutable std::mutex mutex_;     ///< Guards session_
    std::unique_ptr<TransferSession> session_;
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_{};
    CancelToken cancel_;
    std::atomic<std::uint64_t> next_session_id_{1};
    std::chrono::steady_clock::time_point session_begin_{};
};

} // namespace dtx::transfer
