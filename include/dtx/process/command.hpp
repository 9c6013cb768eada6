#pragma once

#include "dtx/core/cancel_token.hpp"
#include "dtx/core/result.hpp"
#include "dtx/process/child_process.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace dtx::process {

struct CommandOutput {
    ExitStatus status;
    std::string stdout_text;
    std::string stderr_text;
};

struct CommandOptions {
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds termination_grace{2000};
    const CancelToken* cancel = nullptr;   ///< Optional; the command is terminated when requested
};

/**
 * @brief Run a short command to completion, capturing stdout and stderr
 *
 * stdin is /dev/null. Both output pipes are drained concurrently so a chatty
 * child never blocks on a full pipe. A non-zero exit is NOT an error here:
 * the caller inspects CommandOutput::status. Errors are spawn failures
 * (ToolMissing), I/O failures, and cancellation (UserCancelled).
 */
Result<CommandOutput> run_command(const std::vector<std::string>& argv,
                                  const CommandOptions& options = {});

/**
 * @brief Render argv for log lines, quoting arguments that contain spaces
 */
std::string join_command(const std::vector<std::string>& argv);

} // namespace dtx::process
