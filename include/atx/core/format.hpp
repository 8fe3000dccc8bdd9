#pragma once

#include <cstdint>
#include <string>

namespace atx::core {

/// "0 B", "512.0 B", "1.5 KB", "150.0 MB" (1024 based, one decimal)
std::string format_file_size(std::uint64_t bytes);

/// "12.3s", "4m 5s", "2h 3m"
std::string format_duration(double seconds);

/// format_file_size(bytes_per_second) + "/s"
std::string format_rate(double bytes_per_second);

} // namespace atx::core
