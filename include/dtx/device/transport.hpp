#pragma once

/**
 * @file transport.hpp
 * @brief Remote execution on the device
 *
 * WHY THIS FILE EXISTS:
 * Every remote-side stage, the remote size probe and the remote mkdir go
 * through the same transport. Keeping it behind an interface lets the
 * builder and prober stay transport-agnostic and lets tests run without a
 * phone attached.
 */

#include "dtx/core/cancel_token.hpp"
#include "dtx/core/config.hpp"
#include "dtx/core/result.hpp"
#include "dtx/process/command.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dtx::device {

class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    /**
     * @brief argv that runs a shell command on the device with a binary-clean
     *        stdout (used for producer stages)
     */
    virtual std::vector<std::string> exec_out_argv(const std::string& remote_command) const = 0;

    /**
     * @brief argv that runs a shell command on the device with stdin forwarded
     */
    virtual std::vector<std::string> shell_argv(const std::string& remote_command) const = 0;

    /**
     * @brief Ok when the device is attached and authorized
     *
     * A requested cancel terminates the adb call and yields UserCancelled.
     */
    virtual Result<void> check_device(const CancelToken* cancel = nullptr) const = 0;

    /**
     * @brief Run a remote shell command to completion and capture its output
     *
     * A requested cancel terminates the command and yields UserCancelled.
     */
    virtual Result<process::CommandOutput> run_shell(const std::string& remote_command,
                                                     const CancelToken* cancel = nullptr) const = 0;

    /**
     * @brief Recognize transport-level failures in captured stderr text
     *
     * Returns DeviceUnavailable when the text says the link is down; nullopt
     * when the text is not about the transport.
     */
    virtual std::optional<ErrorKind> classify_diagnostics(const std::string& diagnostics) const = 0;
};

/**
 * @brief Android Debug Bridge transport
 */
class AdbTransport final : public DeviceTransport {
public:
    explicit AdbTransport(const core::TransferConfig& config);

    std::vector<std::string> exec_out_argv(const std::string& remote_command) const override;
    std::vector<std::string> shell_argv(const std::string& remote_command) const override;
    Result<void> check_device(const CancelToken* cancel = nullptr) const override;
    Result<process::CommandOutput> run_shell(const std::string& remote_command,
                                             const CancelToken* cancel = nullptr) const override;
    std::optional<ErrorKind> classify_diagnostics(const std::string& diagnostics) const override;

private:
    std::vector<std::string> base_argv() const;
    process::CommandOptions options_with(const CancelToken* cancel) const;

    std::string adb_path_;
    std::string serial_;
    process::CommandOptions command_options_;
};

/**
 * @brief Quote one word for a POSIX shell: 'it'\''s' style
 */
std::string shell_quote(const std::string& word);

} // namespace dtx::device
