#include "atx/core/format.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace atx::core {

std::string format_file_size(std::uint64_t bytes) {
    if (bytes == 0) {
        return "0 B";
    }

    static constexpr std::array<const char*, 5> kUnits{"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit < kUnits.size() - 1) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << ' ' << kUnits[unit];
    return oss.str();
}

std::string format_duration(double seconds) {
    std::ostringstream oss;
    if (seconds < 60.0) {
        oss << std::fixed << std::setprecision(1) << seconds << 's';
    } else if (seconds < 3600.0) {
        const auto total = static_cast<std::uint64_t>(seconds);
        oss << total / 60 << "m " << total % 60 << 's';
    } else {
        const auto total = static_cast<std::uint64_t>(seconds);
        oss << total / 3600 << "h " << (total % 3600) / 60 << 'm';
    }
    return oss.str();
}

std::string format_rate(double bytes_per_second) {
    if (bytes_per_second < 0.0) {
        bytes_per_second = 0.0;
    }
    return format_file_size(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

} // namespace atx::core
