#include "dtx/pipeline/pipeline_runner.hpp"
#include "dtx/process/async_reader.hpp"
#include "dtx/process/command.hpp"
#include "dtx/process/file_descriptor.hpp"
#include "dtx/progress/progress_parser.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <csignal>
#include <memory>
#include <thread>

namespace dtx::pipeline {
namespace {

using Clock = std::chrono::steady_clock;
namespace asio = boost::asio;

constexpr int kCommandNotFound = 127;
constexpr std::chrono::milliseconds kMinDrainTime{500};

void append_bounded(std::string& target, std::string_view data, std::size_t limit) {
    if (target.size() >= limit) {
        return;
    }
    target.append(data.substr(0, limit - target.size()));
}

std::string trim_copy(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// pv shares one channel between byte counts and its own error messages
std::string non_numeric_lines(const std::string& text) {
    std::string kept;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find_first_of("\r\n", start);
        if (end == std::string::npos) {
            end = text.size();
        }
        const std::string line = trim_copy(text.substr(start, end - start));
        if (!line.empty() && !progress::parse_byte_count(line)) {
            kept += line;
            kept += '\n';
        }
        start = end + 1;
    }
    return trim_copy(kept);
}

ErrorKind kind_for_exit(const process::ExitStatus& status) {
    return (status.term_signal == 0 && status.exit_code == kCommandNotFound)
        ? ErrorKind::ToolMissing
        : ErrorKind::PipelineStageFailed;
}

/**
 * @brief State of one run(): children, their stderr readers, the timer loop
 */
class PipelineExecution {
public:
    PipelineExecution(const PipelineSpec& spec, const RunnerOptions& options)
        : spec_(spec),
          options_(options),
          meter_(spec.meter_index().value_or(spec.stages.size())),
          diagnostics_(spec.stages.size()),
          timer_(io_) {
    }

    Result<void> spawn_all(const PipelineRunner::ChunkHandler& on_progress) {
        const std::size_t count = spec_.stages.size();

        std::vector<process::Pipe> data_pipes;
        for (std::size_t i = 0; i + 1 < count; ++i) {
            auto pipe = process::make_pipe();
            if (pipe.is_error()) {
                return Err<void>(pipe.error());
            }
            data_pipes.push_back(std::move(pipe.value()));
        }

        for (std::size_t i = 0; i < count; ++i) {
            const auto& stage = spec_.stages[i];

            process::FileDescriptor stdin_fd;
            process::FileDescriptor stdout_fd;
            process::FileDescriptor stderr_fd;

            if (stage.stdin_mode == StreamMode::PipeIn) {
                stdin_fd = std::move(data_pipes[i - 1].read_end);
            } else if (stage.stdin_mode == StreamMode::Null) {
                auto null_fd = process::open_null(false);
                if (null_fd.is_error()) {
                    return Err<void>(null_fd.error());
                }
                stdin_fd = std::move(null_fd.value());
            }

            if (stage.stdout_mode == StreamMode::PipeOut) {
                stdout_fd = std::move(data_pipes[i].write_end);
            } else if (stage.stdout_mode == StreamMode::Null) {
                auto null_fd = process::open_null(true);
                if (null_fd.is_error()) {
                    return Err<void>(null_fd.error());
                }
                stdout_fd = std::move(null_fd.value());
            }

            auto err_pipe = process::make_pipe();
            if (err_pipe.is_error()) {
                return Err<void>(err_pipe.error());
            }
            stderr_fd = std::move(err_pipe.value().write_end);

            process::StdioRedirect stdio;
            stdio.stdin_fd = stdin_fd.native_handle();
            stdio.stdout_fd = stdout_fd.native_handle();
            stdio.stderr_fd = stderr_fd.native_handle();

            auto child = process::ChildProcess::spawn(stage.argv, stdio);
            if (child.is_error()) {
                Error error = child.error();
                error.stage = stage.name;
                return Err<void>(std::move(error));
            }
            spdlog::info("Stage '{}' started: pid={} cmd={}",
                         stage.name, child.value().pid(), process::join_command(stage.argv));
            children_.push_back(std::move(child.value()));

            // Our copies of the child's ends must go, or EOF never reaches the next stage
            stdin_fd.close();
            stdout_fd.close();
            stderr_fd.close();

            const bool is_meter = (i == meter_);
            auto reader = std::make_shared<process::AsyncReader>(
                io_, std::move(err_pipe.value().read_end),
                [this, i, is_meter, &on_progress](std::string_view data) {
                    append_bounded(diagnostics_[i], data, options_.max_diagnostic_bytes);
                    if (is_meter && on_progress) {
                        on_progress(data);
                    }
                });
            readers_.push_back(reader);
        }
        return Ok();
    }

    /**
     * @brief Used when spawning stopped halfway: stop what is running, reap it
     */
    void abort_spawned() {
        for (auto& child : children_) {
            child.signal(SIGTERM);
        }
        const auto deadline = Clock::now() + options_.termination_grace;
        while (any_running() && Clock::now() < deadline) {
            poll_children();
            std::this_thread::sleep_for(std::min(options_.poll_interval, std::chrono::milliseconds(20)));
        }
        for (auto& child : children_) {
            if (child.running()) {
                child.signal(SIGKILL);
                if (auto reaped = child.wait(); reaped.is_error()) {
                    spdlog::error("Cannot reap pid={}: {}", child.pid(), reaped.error().describe());
                }
            }
        }
    }

    void supervise(const CancelToken& cancel) {
        for (auto& reader : readers_) {
            reader->start();
        }
        tick(cancel);
        io_.run();

        // The loop only stops once all children are reaped; this is a backstop
        for (auto& child : children_) {
            if (child.running()) {
                if (auto reaped = child.wait(); reaped.is_error()) {
                    spdlog::error("Cannot reap pid={}: {}", child.pid(), reaped.error().describe());
                }
            }
        }
    }

    PipelineOutcome outcome() const {
        PipelineOutcome outcome;
        for (std::size_t i = 0; i < children_.size(); ++i) {
            StageExit exit;
            exit.name = spec_.stages[i].name;
            exit.role = spec_.stages[i].role;
            exit.status = children_[i].exit_status().value_or(process::ExitStatus::uncollected());
            exit.diagnostics = (i == meter_) ? non_numeric_lines(diagnostics_[i]) : trim_copy(diagnostics_[i]);
            outcome.stages.push_back(std::move(exit));
        }

        const std::string combined = combined_diagnostics(outcome.stages);

        if (cancelling_) {
            Error error(ErrorKind::UserCancelled, "transfer cancelled");
            error.diagnostics = combined;
            outcome.result = PipelineResult::Cancelled;
            outcome.error = std::move(error);
            return outcome;
        }

        const StageExit* primary = nullptr;
        std::string context;
        for (const auto& exit : outcome.stages) {
            if (exit.status.success()) {
                continue;
            }
            if (!primary) {
                primary = &exit;
            } else {
                context += "; stage '" + exit.name + "' " + exit.status.describe();
            }
        }

        if (primary) {
            Error error(kind_for_exit(primary->status),
                        "stage '" + primary->name + "' failed with " + primary->status.describe() + context);
            error.stage = primary->name;
            error.exit_code = primary->status.exit_code;
            error.diagnostics = combined;
            outcome.result = PipelineResult::Failed;
            outcome.error = std::move(error);
        }
        return outcome;
    }

private:
    static std::string combined_diagnostics(const std::vector<StageExit>& stages) {
        std::string text;
        for (const auto& exit : stages) {
            if (exit.diagnostics.empty()) {
                continue;
            }
            if (!text.empty()) {
                text += '\n';
            }
            text += "[" + exit.name + "] " + exit.diagnostics;
        }
        return text;
    }

    bool any_running() const {
        return std::any_of(children_.begin(), children_.end(),
                           [](const process::ChildProcess& child) { return child.running(); });
    }

    bool all_readers_closed() const {
        return std::all_of(readers_.begin(), readers_.end(),
                           [](const auto& reader) { return reader->closed(); });
    }

    void poll_children() {
        for (std::size_t i = 0; i < children_.size(); ++i) {
            auto& child = children_[i];
            if (!child.running()) {
                continue;
            }
            auto polled = child.poll();
            if (polled.is_error()) {
                spdlog::error("Stage '{}': {}", spec_.stages[i].name, polled.error().describe());
                child.signal(SIGKILL);
                if (auto reaped = child.wait(); reaped.is_error()) {
                    spdlog::error("Cannot reap stage '{}': {}", spec_.stages[i].name, reaped.error().describe());
                }
                continue;
            }
            if (!polled.value()) {
                continue;
            }
            const auto& status = *polled.value();
            if (status.success()) {
                spdlog::info("Stage '{}' exited: {}", spec_.stages[i].name, status.describe());
            } else if (cancelling_) {
                spdlog::info("Stage '{}' stopped: {}", spec_.stages[i].name, status.describe());
            } else {
                spdlog::error("Stage '{}' exited: {}", spec_.stages[i].name, status.describe());
                if (!failure_deadline_) {
                    failure_deadline_ = Clock::now() + options_.termination_grace;
                }
            }
        }
    }

    void terminate_running(Clock::time_point now) {
        // Producer first so downstream stages see EOF rather than a torn stream
        for (auto& child : children_) {
            child.signal(SIGTERM);
        }
        if (!kill_deadline_) {
            kill_deadline_ = now + options_.termination_grace;
        }
    }

    void tick(const CancelToken& cancel) {
        const auto now = Clock::now();
        poll_children();

        if (any_running()) {
            if (!cancelling_ && cancel.is_requested()) {
                spdlog::info("Cancel requested, terminating pipeline");
                cancelling_ = true;
                terminate_running(now);
            }
            if (!cancelling_ && failure_deadline_ && now >= *failure_deadline_ && !kill_deadline_) {
                spdlog::warn("Stages still running after a stage failed, terminating them");
                terminate_running(now);
            }
            if (kill_deadline_ && now >= *kill_deadline_) {
                for (auto& child : children_) {
                    if (child.running()) {
                        spdlog::warn("Stage pid={} ignored SIGTERM, sending SIGKILL", child.pid());
                        child.signal(SIGKILL);
                    }
                }
            }
        } else {
            // Helpers forked by a stage may hold a stderr pipe open after it exits
            if (!drain_deadline_) {
                drain_deadline_ = now + std::max(options_.termination_grace, kMinDrainTime);
            }
            if (now >= *drain_deadline_) {
                for (auto& reader : readers_) {
                    reader->close();
                }
            }
            if (all_readers_closed()) {
                return;
            }
        }

        timer_.expires_after(options_.poll_interval);
        timer_.async_wait([this, &cancel](const boost::system::error_code& ec) {
            if (!ec) {
                tick(cancel);
            }
        });
    }

    const PipelineSpec& spec_;
    const RunnerOptions& options_;
    const std::size_t meter_;

    asio::io_context io_;
    std::vector<process::ChildProcess> children_;
    std::vector<std::shared_ptr<process::AsyncReader>> readers_;
    std::vector<std::string> diagnostics_;
    asio::steady_timer timer_;

    bool cancelling_ = false;
    std::optional<Clock::time_point> kill_deadline_;
    std::optional<Clock::time_point> failure_deadline_;
    std::optional<Clock::time_point> drain_deadline_;
};

} // namespace

const char* to_string(PipelineResult result) noexcept {
    switch (result) {
        case PipelineResult::Completed: return "Completed";
        case PipelineResult::Failed: return "Failed";
        case PipelineResult::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

PipelineRunner::PipelineRunner(RunnerOptions options)
    : options_(options) {
}

std::optional<PipelineOutcome> PipelineRunner::run_setup(const PipelineSpec& spec, const CancelToken& cancel) const {
    process::CommandOptions command_options;
    command_options.poll_interval = options_.poll_interval;
    command_options.termination_grace = options_.termination_grace;
    command_options.cancel = &cancel;

    for (const auto& command : spec.setup) {
        PipelineOutcome outcome;
        if (cancel.is_requested()) {
            outcome.result = PipelineResult::Cancelled;
            outcome.error = Error(ErrorKind::UserCancelled, "transfer cancelled before '" + command.name + "'");
            return outcome;
        }

        spdlog::info("Setup '{}': {}", command.name, process::join_command(command.argv));
        auto result = process::run_command(command.argv, command_options);
        if (result.is_error()) {
            Error error = result.error();
            error.stage = command.name;
            outcome.result = (error.kind == ErrorKind::UserCancelled) ? PipelineResult::Cancelled
                                                                      : PipelineResult::Failed;
            outcome.error = std::move(error);
            return outcome;
        }

        const auto& output = result.value();
        if (!output.status.success()) {
            Error error(kind_for_exit(output.status),
                        "setup '" + command.name + "' failed with " + output.status.describe());
            error.stage = command.name;
            error.exit_code = output.status.exit_code;
            error.diagnostics = trim_copy(output.stderr_text);
            if (error.diagnostics.empty()) {
                // adb shell reports remote errors on stdout
                error.diagnostics = trim_copy(output.stdout_text);
            }
            spdlog::error("{}: {}", error.message, error.diagnostics);
            outcome.result = PipelineResult::Failed;
            outcome.error = std::move(error);
            return outcome;
        }
    }
    return std::nullopt;
}

PipelineOutcome PipelineRunner::run(const PipelineSpec& spec,
                                    const CancelToken& cancel,
                                    const ChunkHandler& on_progress,
                                    const StartedHandler& on_started) const {
    if (auto valid = spec.validate(); valid.is_error()) {
        PipelineOutcome outcome;
        outcome.result = PipelineResult::Failed;
        outcome.error = valid.error();
        return outcome;
    }

    if (auto setup_outcome = run_setup(spec, cancel)) {
        return *setup_outcome;
    }

    PipelineExecution execution(spec, options_);
    if (auto spawned = execution.spawn_all(on_progress); spawned.is_error()) {
        spdlog::error("Pipeline spawn failed: {}", spawned.error().describe());
        execution.abort_spawned();
        PipelineOutcome outcome;
        outcome.result = PipelineResult::Failed;
        outcome.error = spawned.error();
        return outcome;
    }

    if (on_started) {
        on_started();
    }
    execution.supervise(cancel);

    auto outcome = execution.outcome();
    spdlog::info("Pipeline finished: {}", to_string(outcome.result));
    return outcome;
}

} // namespace dtx::pipeline
