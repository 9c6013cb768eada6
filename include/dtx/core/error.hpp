#pragma once

/**
 * @file error.hpp
 * @brief Error taxonomy shared by every transfer component
 *
 * WHY THIS FILE EXISTS:
 * A transfer can fail for very different reasons: the phone is unplugged,
 * `pv` is not installed, the source folder does not exist, `tar` died halfway.
 * The presentation layer must be able to tell these apart without parsing raw
 * process output, so every failure carries an ErrorKind plus the captured text.
 *
 * HOW IT INTEGRATES:
 * - Result<T> (core/result.hpp) uses Error as its default error type
 * - PipelineRunner fills stage, exit_code and diagnostics
 * - TransferFinishedEvent forwards the Error to subscribers
 */

#include <optional>
#include <string>

namespace dtx {

enum class ErrorKind {
    DeviceUnavailable,   // transport cannot reach the device
    ToolMissing,         // adb, tar or pv is not installed
    PathInvalid,         // source/destination missing or outside the transfer root
    PermissionDenied,
    PipelineStageFailed, // a stage exited non-zero
    UserCancelled,
    SizeProbeFailed,     // non-fatal, transfer continues without a percentage
    ConfigInvalid,
    Internal
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Failure record carried by Result and by the terminal event
 */
struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::string stage;              ///< Stage or setup command name, if any
    std::optional<int> exit_code;   ///< Exit code of the failing stage
    std::string diagnostics;        ///< Concatenated stderr of all stages

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /**
     * @brief One-line summary: "<kind>: <message>"
     */
    std::string describe() const;
};

/**
 * @brief Build an Error from an errno value, message suffixed with strerror text
 */
Error system_error(ErrorKind kind, const std::string& what, int error_number);

/**
 * @brief Map errno of a failed open/exec/stat to the closest ErrorKind
 */
ErrorKind kind_from_errno(int error_number) noexcept;

} // namespace dtx
