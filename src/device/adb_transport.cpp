#include "dtx/device/transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace dtx::device {
namespace {

// adb client messages meaning the link itself is down
constexpr std::array<const char*, 6> kDeviceDownMarkers = {
    "no devices/emulators found",
    "device offline",
    "device unauthorized",
    "device not found",
    "more than one device/emulator",
    "cannot connect to daemon",
};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim_copy(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::string shell_quote(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

AdbTransport::AdbTransport(const core::TransferConfig& config)
    : adb_path_(config.adb_path),
      serial_(config.device_serial) {
    command_options_.poll_interval = config.poll_interval;
    command_options_.termination_grace = config.termination_grace;
}

std::vector<std::string> AdbTransport::base_argv() const {
    std::vector<std::string> argv{adb_path_};
    if (!serial_.empty()) {
        argv.push_back("-s");
        argv.push_back(serial_);
    }
    return argv;
}

std::vector<std::string> AdbTransport::exec_out_argv(const std::string& remote_command) const {
    auto argv = base_argv();
    argv.push_back("exec-out");
    argv.push_back(remote_command);
    return argv;
}

std::vector<std::string> AdbTransport::shell_argv(const std::string& remote_command) const {
    auto argv = base_argv();
    argv.push_back("shell");
    argv.push_back(remote_command);
    return argv;
}

process::CommandOptions AdbTransport::options_with(const CancelToken* cancel) const {
    process::CommandOptions options = command_options_;
    options.cancel = cancel;
    return options;
}

Result<void> AdbTransport::check_device(const CancelToken* cancel) const {
    auto argv = base_argv();
    argv.push_back("get-state");

    auto result = process::run_command(argv, options_with(cancel));
    if (result.is_error()) {
        return Err<void>(result.error());
    }

    const auto& output = result.value();
    const std::string state = trim_copy(output.stdout_text);
    if (output.status.success() && state == "device") {
        spdlog::debug("adb reports device state '{}'", state);
        return Ok();
    }

    Error error(ErrorKind::DeviceUnavailable,
                state.empty() ? "no device reachable over adb" : "device state is '" + state + "'");
    error.stage = "adb get-state";
    error.exit_code = output.status.exit_code;
    error.diagnostics = trim_copy(output.stderr_text);
    spdlog::error("Device check failed: {} {}", error.message, error.diagnostics);
    return Err<void>(std::move(error));
}

Result<process::CommandOutput> AdbTransport::run_shell(const std::string& remote_command,
                                                       const CancelToken* cancel) const {
    return process::run_command(shell_argv(remote_command), options_with(cancel));
}

std::optional<ErrorKind> AdbTransport::classify_diagnostics(const std::string& diagnostics) const {
    const std::string lowered = lowercase(diagnostics);
    for (const char* marker : kDeviceDownMarkers) {
        if (lowered.find(marker) != std::string::npos) {
            return ErrorKind::DeviceUnavailable;
        }
    }
    // "error: device 'R58M..' not found"
    if (lowered.find("error: device '") != std::string::npos && lowered.find("' not found") != std::string::npos) {
        return ErrorKind::DeviceUnavailable;
    }
    return std::nullopt;
}

} // namespace dtx::device
