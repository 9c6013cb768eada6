#include "dtx/core/config.hpp"
#include "dtx/core/logging.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace dtx::core {
using json = nlohmann::json;

namespace {

Result<void> invalid(const std::string& message) {
    return Err<void>(Error(ErrorKind::ConfigInvalid, message));
}

Result<void> read_string(const json& j, const char* key, std::string& target) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return invalid(std::string("'") + key + "' must be a string");
    }
    target = it->get<std::string>();
    return Ok();
}

Result<void> read_millis(const json& j, const char* key, std::chrono::milliseconds& target) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_number_integer()) {
        return invalid(std::string("'") + key + "' must be an integer (milliseconds)");
    }
    target = std::chrono::milliseconds(it->get<std::int64_t>());
    return Ok();
}

} // namespace

Result<void> TransferConfig::validate() const {
    if (adb_path.empty() || tar_path.empty() || pv_path.empty() || mkdir_path.empty()) {
        return invalid("tool paths must not be empty");
    }
    if (remote_root.empty() || remote_root.front() != '/') {
        return invalid("remote_root must be an absolute device path: '" + remote_root + "'");
    }
    if (remote_root == "/") {
        return invalid("remote_root must not be the device root");
    }
    if (!(meter_interval_s > 0.0)) {
        return invalid("meter_interval_s must be > 0");
    }
    if (poll_interval.count() <= 0) {
        return invalid("poll_interval_ms must be > 0");
    }
    if (termination_grace.count() < 0) {
        return invalid("termination_grace_ms must be >= 0");
    }
    if (speed_window.count() <= 0) {
        return invalid("speed_window_ms must be > 0");
    }
    if (parse_log_level(log_level).is_error()) {
        return invalid("unknown log_level '" + log_level + "'");
    }
    return Ok();
}

Result<TransferConfig> parse_config(const std::string& json_text) {
    const json j = json::parse(json_text, nullptr, false);
    if (j.is_discarded()) {
        return Fail<TransferConfig>(ErrorKind::ConfigInvalid, "configuration is not valid JSON");
    }
    if (!j.is_object()) {
        return Fail<TransferConfig>(ErrorKind::ConfigInvalid, "configuration must be a JSON object");
    }

    TransferConfig config;
    for (const auto& step : {
             read_string(j, "adb_path", config.adb_path),
             read_string(j, "tar_path", config.tar_path),
             read_string(j, "pv_path", config.pv_path),
             read_string(j, "mkdir_path", config.mkdir_path),
             read_string(j, "device_serial", config.device_serial),
             read_string(j, "remote_root", config.remote_root),
             read_string(j, "log_level", config.log_level),
             read_millis(j, "poll_interval_ms", config.poll_interval),
             read_millis(j, "termination_grace_ms", config.termination_grace),
             read_millis(j, "speed_window_ms", config.speed_window)}) {
        if (step.is_error()) {
            return Err<TransferConfig>(step.error());
        }
    }

    if (auto it = j.find("meter_interval_s"); it != j.end()) {
        if (!it->is_number()) {
            return Fail<TransferConfig>(ErrorKind::ConfigInvalid, "'meter_interval_s' must be a number");
        }
        config.meter_interval_s = it->get<double>();
    }

    if (auto valid = config.validate(); valid.is_error()) {
        return Err<TransferConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<TransferConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Fail<TransferConfig>(ErrorKind::ConfigInvalid,
                                    "cannot open configuration file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto config = parse_config(buffer.str());
    if (config.is_error()) {
        Error error = config.error();
        error.message = path.string() + ": " + error.message;
        return Err<TransferConfig>(std::move(error));
    }
    return config;
}

} // namespace dtx::core
