// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_LOG_INIT_HPP
#define CIRRUS_LOG_INIT_HPP

#include <optional>
#include <string>

#include "cirrus_console_sink.hpp"
#include "cirrus_file_sink.hpp"
#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

/**
 * Logging configuration for the uploader service and tools.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
 *
 * @return The parsed level, or std::nullopt if the string is not a level name
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig in place.
 *
 *   CIRRUS_LOG_LEVEL           - Level for both sinks
 *   CIRRUS_LOG_CONSOLE_LEVEL   - Console sink level
 *   CIRRUS_LOG_FILE_LEVEL      - File sink level
 *   CIRRUS_LOG_FILE_DIR        - Log file directory
 *   CIRRUS_LOG_FORMAT          - File format ("json" or "text")
 *   CIRRUS_LOG_FILE_ENABLED    - "true" / "false"
 *   CIRRUS_LOG_CONSOLE_ENABLED - "true" / "false"
 *   CIRRUS_LOG_CONSOLE_COLORS  - "true" / "false"
 *   NO_COLOR                   - Any value turns console colours off
 *
 * Per-sink levels win over CIRRUS_LOG_LEVEL; CIRRUS_LOG_CONSOLE_COLORS wins
 * over NO_COLOR. Unparseable values are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install console and file sinks. Calling it again before shutdown_logging()
 * has no effect.
 */
void init_logging(const LoggingConfig& config);

/**
 * Stop the async sinks, flush pending records and detach them from the core.
 */
void shutdown_logging();

bool is_logging_initialized();

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_LOG_INIT_HPP
