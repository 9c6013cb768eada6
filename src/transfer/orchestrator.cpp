#include "dtx/transfer/orchestrator.hpp"
#include "dtx/events/events.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <filesystem>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace dtx::transfer {
namespace fs = std::filesystem;

namespace {

progress::ParserOptions parser_options(const core::TransferConfig& config) {
    progress::ParserOptions options;
    options.speed_window = config.speed_window;
    return options;
}

} // namespace

TransferOrchestrator::TransferOrchestrator(core::TransferConfig config,
                                           events::EventBus& bus,
                                           const device::DeviceTransport& transport,
                                           const SizeProber& prober,
                                           const pipeline::PipelineBuilder& builder,
                                           const pipeline::PipelineRunner& runner)
    : config_(std::move(config)),
      bus_(bus),
      transport_(transport),
      prober_(prober),
      builder_(builder),
      runner_(runner) {
}

TransferOrchestrator::~TransferOrchestrator() {
    cancel();
}

Result<std::uint64_t> TransferOrchestrator::start(Direction direction,
                                                  const std::string& local_path,
                                                  const std::string& remote_path) {
    return start(TransferRequest{direction, local_path, remote_path});
}

Result<std::uint64_t> TransferOrchestrator::start(const TransferRequest& request) {
    std::lock_guard control(control_mutex_);

    if (active()) {
        spdlog::info("New transfer requested, cancelling the active one");
        cancel_.request();
    }
    join_worker();
    cancel_.reset();

    const std::uint64_t session_id = next_session_id_++;
    {
        std::lock_guard lock(mutex_);
        session_ = std::make_unique<TransferSession>(session_id, request, parser_options(config_));
    }

    std::lock_guard join(join_mutex_);
    try {
        worker_ = std::thread([this]() { run_session(); });
    } catch (const std::system_error& e) {
        std::lock_guard lock(mutex_);
        session_.reset();
        return Fail<std::uint64_t>(ErrorKind::Internal, std::string("cannot start transfer thread: ") + e.what());
    }
    return Ok(session_id);
}

void TransferOrchestrator::cancel() {
    // Requested before control_mutex_ and join_mutex_
    if (active()) {
        cancel_.request();
    }
    if (std::this_thread::get_id() == worker_id_.load()) {
        return;
    }

    std::lock_guard control(control_mutex_);
    join_worker();
}

std::optional<TransferSessionInfo> TransferOrchestrator::wait() {
    if (std::this_thread::get_id() != worker_id_.load()) {
        join_worker();
    }
    return current_info();
}

bool TransferOrchestrator::active() const {
    std::lock_guard lock(mutex_);
    return session_ && !is_terminal(session_->state());
}

std::optional<TransferSessionInfo> TransferOrchestrator::current_info() const {
    std::lock_guard lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->info();
}

void TransferOrchestrator::join_worker() {
    std::lock_guard join(join_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

Result<void> TransferOrchestrator::check_local_path(Direction direction, const std::string& local_path) {
    if (local_path.empty()) {
        return Fail<void>(ErrorKind::PathInvalid, "local path is empty");
    }

    std::error_code ec;
    if (direction == Direction::Push) {
        if (!fs::exists(local_path, ec)) {
            return Fail<void>(ErrorKind::PathInvalid, "local source '" + local_path + "' does not exist");
        }
        if (!fs::is_directory(local_path, ec)) {
            return Fail<void>(ErrorKind::PathInvalid, "local source '" + local_path + "' is not a directory");
        }
        if (::access(local_path.c_str(), R_OK | X_OK) != 0) {
            const int error_number = errno;
            return Err<void>(system_error(ErrorKind::PermissionDenied,
                                          "cannot read local source '" + local_path + "'", error_number));
        }
        return Ok();
    }

    // Pull creates the destination, so the nearest existing ancestor decides
    fs::path candidate = fs::absolute(local_path, ec).lexically_normal();
    if (ec) {
        return Fail<void>(ErrorKind::PathInvalid, "cannot resolve '" + local_path + "': " + ec.message());
    }
    while (!fs::exists(candidate, ec) && candidate.has_parent_path() && candidate != candidate.parent_path()) {
        candidate = candidate.parent_path();
    }
    if (!fs::is_directory(candidate, ec)) {
        return Fail<void>(ErrorKind::PathInvalid,
                          "local destination '" + local_path + "' is below non-directory " + candidate.string());
    }
    if (::access(candidate.c_str(), W_OK | X_OK) != 0) {
        const int error_number = errno;
        return Err<void>(system_error(ErrorKind::PermissionDenied,
                                      "cannot write to " + candidate.string(), error_number));
    }
    return Ok();
}

void TransferOrchestrator::update_session(const SessionChange& change) {
    std::uint64_t session_id = 0;
    SessionState before = SessionState::Idle;
    SessionState after = SessionState::Idle;
    {
        std::lock_guard lock(mutex_);
        session_id = session_->session_id();
        before = session_->state();
        auto result = change(*session_);
        if (result.is_error()) {
            spdlog::error("Session {}: {}", session_id, result.error().describe());
        }
        after = session_->state();
    }
    if (before != after) {
        bus_.emit(events::SessionStateChangedEvent{session_id, before, after});
    }
}

void TransferOrchestrator::run_session() {
    worker_id_ = std::this_thread::get_id();
    session_begin_ = std::chrono::steady_clock::now();

    TransferRequest request;
    std::uint64_t session_id = 0;
    {
        std::lock_guard lock(mutex_);
        const auto& info = session_->info();
        request = TransferRequest{info.direction, info.local_path, info.remote_path};
        session_id = info.session_id;
    }

    bus_.emit(events::TransferStartedEvent{session_id, request.direction, request.local_path, request.remote_path});
    update_session([](TransferSession& session) { return session.begin_probing(); });

    execute(request);
    publish_finished();
    worker_id_ = std::thread::id();
}

void TransferOrchestrator::execute(const TransferRequest& request) {
    const std::uint64_t session_id = current_info()->session_id;

    if (auto device = transport_.check_device(&cancel_); device.is_error()) {
        finish_interrupted(device.error());
        return;
    }
    if (auto local = check_local_path(request.direction, request.local_path); local.is_error()) {
        finish_failed(local.error());
        return;
    }
    auto remote = builder_.resolve_remote_path(request.remote_path);
    if (remote.is_error()) {
        finish_failed(remote.error());
        return;
    }
    if (cancel_.is_requested()) {
        finish_cancelled("transfer cancelled during preflight");
        return;
    }

    const std::string& source = (request.direction == Direction::Pull) ? remote.value() : request.local_path;
    auto probed = prober_.probe(request.direction, source, &cancel_);
    if (probed.is_error() && probed.error().kind == ErrorKind::UserCancelled) {
        finish_cancelled("transfer cancelled during size probe");
        return;
    }

    events::SizeProbedEvent probe_event;
    probe_event.session_id = session_id;
    if (probed.is_ok() && probed.value() > 0) {
        probe_event.known = true;
        probe_event.total_bytes = probed.value();
    } else if (probed.is_error()) {
        spdlog::warn("Size probe failed, continuing without percentage: {}", probed.error().describe());
        probe_event.error = probed.error();
    } else {
        spdlog::warn("Size probe reported 0 bytes, continuing without percentage");
    }
    const std::optional<std::uint64_t> total =
        probe_event.known ? std::optional<std::uint64_t>(probe_event.total_bytes) : std::nullopt;
    {
        std::lock_guard lock(mutex_);
        session_->set_total(total);
    }
    bus_.emit(probe_event);

    if (cancel_.is_requested()) {
        finish_cancelled("transfer cancelled after size probe");
        return;
    }

    auto spec = builder_.build(request.direction, request.local_path, request.remote_path, total);
    if (spec.is_error()) {
        finish_failed(spec.error());
        return;
    }

    auto on_started = [this]() {
        update_session([](TransferSession& session) {
            return session.mark_running(progress::Clock::now());
        });
    };

    auto publish_progress = [this, session_id, total](const std::vector<progress::ProgressEvent>& batch) {
        for (const auto& event : batch) {
            bus_.emit(events::TransferProgressEvent{session_id, event, total});
        }
    };

    auto on_progress = [this, &publish_progress](std::string_view chunk) {
        std::vector<progress::ProgressEvent> batch;
        {
            std::lock_guard lock(mutex_);
            batch = session_->ingest_progress(chunk, progress::Clock::now());
        }
        publish_progress(batch);
    };

    auto outcome = runner_.run(spec.value(), cancel_, on_progress, on_started);

    std::vector<progress::ProgressEvent> tail;
    {
        std::lock_guard lock(mutex_);
        if (session_->state() == SessionState::Running) {
            tail = session_->flush_progress(progress::Clock::now());
        }
    }
    publish_progress(tail);

    switch (outcome.result) {
        case pipeline::PipelineResult::Completed:
            update_session([](TransferSession& session) { return session.complete(); });
            break;
        case pipeline::PipelineResult::Cancelled: {
            Error error = outcome.error.value_or(Error(ErrorKind::UserCancelled, "transfer cancelled"));
            update_session([&error](TransferSession& session) { return session.mark_cancelled(std::move(error)); });
            break;
        }
        case pipeline::PipelineResult::Failed: {
            Error error = outcome.error.value_or(Error(ErrorKind::PipelineStageFailed, "pipeline failed"));
            if (error.kind == ErrorKind::PipelineStageFailed) {
                if (auto refined = transport_.classify_diagnostics(error.diagnostics)) {
                    error.kind = *refined;
                }
            }
            finish_failed(std::move(error));
            break;
        }
    }
}

void TransferOrchestrator::finish_failed(Error error) {
    spdlog::error("Transfer failed: {}", error.describe());
    update_session([&error](TransferSession& session) { return session.mark_failed(std::move(error)); });
}

void TransferOrchestrator::finish_interrupted(Error error) {
    if (error.kind == ErrorKind::UserCancelled) {
        finish_cancelled(std::move(error.message));
        return;
    }
    finish_failed(std::move(error));
}

void TransferOrchestrator::finish_cancelled(std::string reason) {
    update_session([&reason](TransferSession& session) {
        return session.mark_cancelled(Error(ErrorKind::UserCancelled, std::move(reason)));
    });
}

void TransferOrchestrator::publish_finished() {
    events::TransferFinishedEvent finished;
    {
        std::lock_guard lock(mutex_);
        const auto& info = session_->info();
        finished.session_id = info.session_id;
        finished.direction = info.direction;
        finished.state = info.state;
        finished.transferred_bytes = info.transferred_bytes;
        finished.total_bytes = info.total_bytes;
        finished.error = info.last_error;
    }
    finished.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session_begin_);
    bus_.emit(finished);
}

} // namespace dtx::transfer
