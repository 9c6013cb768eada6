#pragma once

/**
 * @file child_process.hpp
 * @brief Spawn, signal and reap one external process
 *
 * Each child runs in its own process group so a signal reaches helpers it
 * forks (adb, sh -c wrappers) as well. Exec failures are reported back to the
 * parent through a close-on-exec pipe, which makes "tool not installed" a
 * spawn error instead of a mysterious exit code.
 */

#include "dtx/core/result.hpp"

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace dtx::process {

/**
 * @brief How a reaped child ended
 */
struct ExitStatus {
    int exit_code = 0;    ///< Valid when term_signal == 0
    int term_signal = 0;  ///< Non-zero when the child died from a signal

    bool success() const noexcept { return term_signal == 0 && exit_code == 0; }
    std::string describe() const;

    /**
     * @brief Stand-in for a stage whose status could not be reaped; never a success
     */
    static ExitStatus uncollected() noexcept { return ExitStatus{kUncollectedExitCode, 0}; }

    static constexpr int kUncollectedExitCode = -1;
};

/**
 * @brief Descriptors to install as the child's fd 0/1/2 (kInvalidFd = inherit)
 *
 * The caller keeps ownership; the descriptors only need to stay open until
 * spawn() returns.
 */
struct StdioRedirect {
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

class ChildProcess {
public:
    /**
     * @brief fork + execvp argv[0]; fails with ToolMissing when the program
     *        cannot be found
     */
    static Result<ChildProcess> spawn(const std::vector<std::string>& argv,
                                      const StdioRedirect& stdio);

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    pid_t pid() const noexcept { return pid_; }
    bool running() const noexcept { return pid_ > 0 && !status_.has_value(); }
    const std::optional<ExitStatus>& exit_status() const noexcept { return status_; }

    /**
     * @brief Non-blocking reap; returns the status once the child exited
     */
    Result<std::optional<ExitStatus>> poll();

    /**
     * @brief Blocking reap
     */
    Result<ExitStatus> wait();

    /**
     * @brief Send a signal to the child's process group; no-op once reaped
     */
    void signal(int signal_number);

private:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    void kill_and_reap() noexcept;

    pid_t pid_ = -1;
    std::optional<ExitStatus> status_;
};

} // namespace dtx::process
