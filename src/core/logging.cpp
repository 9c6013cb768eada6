#include "dtx/core/logging.hpp"

#include <algorithm>
#include <cctype>

namespace dtx::core {

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "warning") {
        lowered = "warn";
    }

    // from_str maps anything it does not know to "off"
    const auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off && lowered != "off") {
        return Fail<spdlog::level::level_enum>(ErrorKind::ConfigInvalid, "unknown log level: " + name);
    }
    return Ok(level);
}

Result<void> configure_logging(const std::string& level, const std::string& pattern) {
    auto parsed = parse_log_level(level);
    if (parsed.is_error()) {
        return Err<void>(parsed.error());
    }
    spdlog::set_level(parsed.value());
    spdlog::set_pattern(pattern);
    return Ok();
}

} // namespace dtx::core
