#include "dtx/process/command.hpp"
#include "dtx/process/async_reader.hpp"
#include "dtx/process/file_descriptor.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <csignal>
#include <functional>
#include <memory>
#include <optional>

namespace dtx::process {
namespace {

constexpr std::chrono::milliseconds kMinDrainTime{500};

} // namespace

std::string join_command(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) {
            text += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            text += '"' + arg + '"';
        } else {
            text += arg;
        }
    }
    return text;
}

Result<CommandOutput> run_command(const std::vector<std::string>& argv, const CommandOptions& options) {
    auto null_in = open_null(false);
    if (null_in.is_error()) {
        return Err<CommandOutput>(null_in.error());
    }
    auto out_pipe = make_pipe();
    if (out_pipe.is_error()) {
        return Err<CommandOutput>(out_pipe.error());
    }
    auto err_pipe = make_pipe();
    if (err_pipe.is_error()) {
        return Err<CommandOutput>(err_pipe.error());
    }

    StdioRedirect stdio;
    stdio.stdin_fd = null_in.value().native_handle();
    stdio.stdout_fd = out_pipe.value().write_end.native_handle();
    stdio.stderr_fd = err_pipe.value().write_end.native_handle();

    spdlog::debug("Running: {}", join_command(argv));
    auto spawned = ChildProcess::spawn(argv, stdio);
    null_in.value().close();
    out_pipe.value().write_end.close();
    err_pipe.value().write_end.close();
    if (spawned.is_error()) {
        return Err<CommandOutput>(spawned.error());
    }
    ChildProcess child = std::move(spawned.value());

    CommandOutput output;
    asio::io_context io;
    auto out_reader = std::make_shared<AsyncReader>(
        io, std::move(out_pipe.value().read_end),
        [&output](std::string_view data) { output.stdout_text.append(data); });
    auto err_reader = std::make_shared<AsyncReader>(
        io, std::move(err_pipe.value().read_end),
        [&output](std::string_view data) { output.stderr_text.append(data); });
    out_reader->start();
    err_reader->start();

    std::optional<Error> failure;
    bool cancelled = false;
    std::optional<std::chrono::steady_clock::time_point> kill_deadline;
    std::optional<std::chrono::steady_clock::time_point> drain_deadline;

    asio::steady_timer timer(io);
    std::function<void()> tick = [&]() {
        const auto now = std::chrono::steady_clock::now();

        if (auto polled = child.poll(); polled.is_error()) {
            failure = polled.error();
            child.signal(SIGKILL);
            if (auto reaped = child.wait(); reaped.is_error()) {
                spdlog::error("Cannot reap {}: {}", argv.front(), reaped.error().describe());
            }
        }

        if (child.running() && options.cancel && options.cancel->is_requested() && !cancelled) {
            cancelled = true;
            child.signal(SIGTERM);
            kill_deadline = now + options.termination_grace;
        }
        if (child.running() && kill_deadline && now >= *kill_deadline) {
            child.signal(SIGKILL);
        }

        if (!child.running()) {
            // Helpers forked by the child may keep the pipes open after it exits
            if (!drain_deadline) {
                drain_deadline = now + std::max(options.termination_grace, kMinDrainTime);
            }
            if (now >= *drain_deadline) {
                out_reader->close();
                err_reader->close();
            }
            if (out_reader->closed() && err_reader->closed()) {
                return;
            }
        }

        timer.expires_after(options.poll_interval);
        timer.async_wait([&tick](const boost::system::error_code& ec) {
            if (!ec) {
                tick();
            }
        });
    };
    tick();
    io.run();

    if (failure) {
        return Err<CommandOutput>(*failure);
    }
    if (cancelled) {
        return Fail<CommandOutput>(ErrorKind::UserCancelled, "cancelled: " + join_command(argv));
    }
    output.status = child.exit_status().value_or(ExitStatus{});
    spdlog::debug("Command '{}' finished: {}", argv.front(), output.status.describe());
    return Ok(std::move(output));
}

} // namespace dtx::process
