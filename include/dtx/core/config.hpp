#pragma once

/**
 * @file config.hpp
 * @brief Runtime configuration for the transfer orchestrator
 *
 * WHAT IT CONTAINS:
 * - Paths of the external tools (adb, tar, pv)
 * - Which device to talk to (adb serial, empty = the only attached one)
 * - The fixed transfer root on the device
 * - Timing knobs of the supervising loop and the progress parser
 *
 * EXAMPLE (JSON):
 * {
 *   "adb_path": "/usr/bin/adb",
 *   "device_serial": "R58M123ABC",
 *   "remote_root": "/sdcard/Transfer",
 *   "poll_interval_ms": 100,
 *   "log_level": "debug"
 * }
 *
 * Every key is optional; missing keys keep the defaults below.
 */

#include "dtx/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace dtx::core {

struct TransferConfig {
    std::string adb_path = "adb";
    std::string tar_path = "tar";
    std::string pv_path = "pv";
    std::string mkdir_path = "mkdir";
    std::string device_serial;                      ///< Empty: let adb pick the single device
    std::string remote_root = "/sdcard/Transfer";   ///< Created if missing, never deleted

    double meter_interval_s = 0.5;                  ///< pv -i, seconds between byte counts
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds termination_grace{2000};
    std::chrono::milliseconds speed_window{5000};

    std::string log_level = "info";

    /**
     * @brief Check value ranges; returns ConfigInvalid on the first problem
     */
    Result<void> validate() const;
};

/**
 * @brief Parse configuration from JSON text
 */
Result<TransferConfig> parse_config(const std::string& json_text);

/**
 * @brief Read and parse a JSON configuration file
 */
Result<TransferConfig> load_config(const std::filesystem::path& path);

} // namespace dtx::core
