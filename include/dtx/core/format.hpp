#pragma once

#include <cstdint>
#include <string>

namespace dtx::core {

/**
 * @brief "512 B", "1.5 KB", "12.0 MB", "3.2 GB" (binary multiples)
 */
std::string format_bytes(std::uint64_t bytes);

/**
 * @brief "800 B/s", "12.3 KB/s", "41.0 MB/s"
 */
std::string format_speed(double bytes_per_second);

} // namespace dtx::core
