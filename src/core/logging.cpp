#include "atx/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace atx::core {

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str falls back to "off" for unknown names
    if (level == spdlog::level::off && name != "off") {
        return Err<spdlog::level::level_enum>(ErrorCode::InvalidConfig, "Unknown log level: " + name);
    }
    return Ok(level);
}

Result<void> configure_logging(const LoggingConfig& config) {
    auto level = parse_log_level(config.level);
    if (level.is_error()) {
        return Err<void>(level.error());
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (config.file) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file->string(), true));
        }
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("atx", sinks.begin(), sinks.end()));
    } catch (const spdlog::spdlog_ex& e) {
        return Err<void>(ErrorCode::InvalidConfig,
                         "Failed to open log file " + (config.file ? config.file->string() : std::string("<none>")) +
                         ": " + e.what());
    }

    spdlog::set_level(level.value());
    spdlog::set_pattern(config.pattern);
    return Ok();
}

} // namespace atx::core
