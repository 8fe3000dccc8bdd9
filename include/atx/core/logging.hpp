#pragma once

#include "atx/core/config.hpp"
#include "atx/core/result.hpp"

#include <spdlog/common.h>

#include <string>

namespace atx::core {

/// Maps "trace".."off" to an spdlog level; unknown names are rejected.
Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Installs the process-wide spdlog configuration
 *
 * The default logger writes to stderr, so stdout stays free for reports,
 * and additionally to the log file when one is configured.
 */
Result<void> configure_logging(const LoggingConfig& config);

} // namespace atx::core
