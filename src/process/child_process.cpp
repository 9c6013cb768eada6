#include "dtx/process/child_process.hpp"
#include "dtx/process/file_descriptor.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dtx::process {
namespace {

ExitStatus decode_status(int raw) {
    ExitStatus status;
    if (WIFEXITED(raw)) {
        status.exit_code = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
        status.term_signal = WTERMSIG(raw);
        status.exit_code = 128 + status.term_signal;
    }
    return status;
}

// Runs between fork and exec: async-signal-safe calls only.
void install_fd(int fd, int target) {
    if (fd < 0) {
        return;
    }
    if (fd == target) {
        const int flags = ::fcntl(fd, F_GETFD);
        if (flags >= 0) {
            ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC);
        }
        return;
    }
    ::dup2(fd, target);
}

[[noreturn]] void exec_child(char* const* argv, const StdioRedirect& stdio, int error_fd) {
    ::setpgid(0, 0);

    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    ::sigemptyset(&action.sa_mask);
    ::sigaction(SIGPIPE, &action, nullptr);
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);

    sigset_t all_unblocked;
    ::sigemptyset(&all_unblocked);
    ::sigprocmask(SIG_SETMASK, &all_unblocked, nullptr);

    install_fd(stdio.stdin_fd, STDIN_FILENO);
    install_fd(stdio.stdout_fd, STDOUT_FILENO);
    install_fd(stdio.stderr_fd, STDERR_FILENO);

    ::execvp(argv[0], argv);

    const int exec_errno = errno;
    [[maybe_unused]] auto written = ::write(error_fd, &exec_errno, sizeof(exec_errno));
    ::_exit(127);
}

} // namespace

std::string ExitStatus::describe() const {
    if (term_signal != 0) {
        return std::string("killed by signal ") + std::to_string(term_signal) +
               " (" + ::strsignal(term_signal) + ")";
    }
    if (exit_code == kUncollectedExitCode) {
        return "exit status not collected";
    }
    return "exit code " + std::to_string(exit_code);
}

Result<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv,
                                         const StdioRedirect& stdio) {
    if (argv.empty() || argv.front().empty()) {
        return Fail<ChildProcess>(ErrorKind::Internal, "cannot spawn an empty command");
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> raw_argv;
    raw_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        raw_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    raw_argv.push_back(nullptr);

    auto error_pipe = make_pipe();
    if (error_pipe.is_error()) {
        return Err<ChildProcess>(error_pipe.error());
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Err<ChildProcess>(system_error(ErrorKind::Internal, "fork failed for " + argv.front(), errno));
    }
    if (pid == 0) {
        exec_child(raw_argv.data(), stdio, error_pipe.value().write_end.native_handle());
    }

    ::setpgid(pid, pid);
    error_pipe.value().write_end.close();

    int exec_errno = 0;
    ssize_t count = 0;
    do {
        count = ::read(error_pipe.value().read_end.native_handle(), &exec_errno, sizeof(exec_errno));
    } while (count < 0 && errno == EINTR);

    ChildProcess child(pid);
    if (count > 0) {
        if (auto reaped = child.wait(); reaped.is_error()) {
            spdlog::error("Failed to reap pid={} after exec failure: {}", pid, reaped.error().describe());
        }
        const ErrorKind kind = (exec_errno == ENOENT) ? ErrorKind::ToolMissing : kind_from_errno(exec_errno);
        Error error = system_error(kind, "cannot execute '" + argv.front() + "'", exec_errno);
        error.stage = argv.front();
        return Err<ChildProcess>(std::move(error));
    }

    spdlog::debug("Spawned pid={} program={}", pid, argv.front());
    return Ok(std::move(child));
}

ChildProcess::~ChildProcess() {
    kill_and_reap();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      status_(std::move(other.status_)) {
    other.status_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        kill_and_reap();
        pid_ = std::exchange(other.pid_, -1);
        status_ = std::move(other.status_);
        other.status_.reset();
    }
    return *this;
}

Result<std::optional<ExitStatus>> ChildProcess::poll() {
    if (!running()) {
        return Ok(status_);
    }
    int raw = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(pid_, &raw, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        return Err<std::optional<ExitStatus>>(
            system_error(ErrorKind::Internal, "waitpid failed for pid " + std::to_string(pid_), errno));
    }
    if (result == 0) {
        return Ok(std::optional<ExitStatus>{});
    }
    status_ = decode_status(raw);
    return Ok(status_);
}

Result<ExitStatus> ChildProcess::wait() {
    if (!running()) {
        if (status_) {
            return Ok(*status_);
        }
        return Fail<ExitStatus>(ErrorKind::Internal, "wait on a process that was never spawned");
    }
    int raw = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(pid_, &raw, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        return Err<ExitStatus>(
            system_error(ErrorKind::Internal, "waitpid failed for pid " + std::to_string(pid_), errno));
    }
    status_ = decode_status(raw);
    return Ok(*status_);
}

void ChildProcess::signal(int signal_number) {
    if (!running()) {
        return;
    }
    if (::kill(-pid_, signal_number) != 0) {
        ::kill(pid_, signal_number);
    }
}

void ChildProcess::kill_and_reap() noexcept {
    if (!running()) {
        return;
    }
    spdlog::warn("Killing unreaped child pid={}", pid_);
    signal(SIGKILL);
    int raw = 0;
    while (::waitpid(pid_, &raw, 0) < 0 && errno == EINTR) {
    }
    status_ = decode_status(raw);
}

} // namespace dtx::process
