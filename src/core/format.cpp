#include "dtx/core/format.hpp"

#include <iomanip>
#include <sstream>

namespace dtx::core {
namespace {

constexpr double kKiB = 1024.0;
constexpr double kMiB = kKiB * 1024.0;
constexpr double kGiB = kMiB * 1024.0;

std::string scaled(double value, const char* suffix) {
    std::ostringstream oss;
    if (value < kKiB) {
        oss << std::fixed << std::setprecision(0) << value << " B" << suffix;
    } else if (value < kMiB) {
        oss << std::fixed << std::setprecision(1) << value / kKiB << " KB" << suffix;
    } else if (value < kGiB) {
        oss << std::fixed << std::setprecision(1) << value / kMiB << " MB" << suffix;
    } else {
        oss << std::fixed << std::setprecision(1) << value / kGiB << " GB" << suffix;
    }
    return oss.str();
}

} // namespace

std::string format_bytes(std::uint64_t bytes) {
    return scaled(static_cast<double>(bytes), "");
}

std::string format_speed(double bytes_per_second) {
    if (bytes_per_second < 0.0) {
        bytes_per_second = 0.0;
    }
    return scaled(bytes_per_second, "/s");
}

} // namespace dtx::core
