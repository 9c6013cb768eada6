#pragma once

#include "dtx/core/result.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace dtx::core {

inline constexpr const char* kDefaultLogPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
 */
Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Apply level and pattern to the default spdlog logger
 */
Result<void> configure_logging(const std::string& level,
                               const std::string& pattern = kDefaultLogPattern);

} // namespace dtx::core
