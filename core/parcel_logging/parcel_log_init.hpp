// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_LOG_INIT_HPP
#define PARCEL_LOG_INIT_HPP

#include <optional>
#include <string>

#include "parcel_console_sink.hpp"
#include "parcel_file_sink.hpp"
#include "parcel_log_severity.hpp"

namespace parcel {
namespace logging {

/**
 * Logging configuration: console and file sinks.
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse a string to severity_level.
 * Accepts "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive).
 *
 * @return The parsed level, or std::nullopt if invalid
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig in place.
 *
 *   PARCEL_LOG_LEVEL           - Global level (console and file)
 *   PARCEL_LOG_CONSOLE_LEVEL   - Console sink level
 *   PARCEL_LOG_FILE_LEVEL      - File sink level
 *   PARCEL_LOG_FILE_DIR        - Log file directory
 *   PARCEL_LOG_FORMAT          - File format ("json" or "text")
 *   PARCEL_LOG_FILE_ENABLED    - "true" / "false"
 *   PARCEL_LOG_CONSOLE_ENABLED - "true" / "false"
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Attach the configured sinks to the Boost.Log core and register the common
 * attributes (TimeStamp, ThreadID). A second call without shutdown_logging()
 * is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Drain the async sink queues and detach the sinks. Safe without init.
 */
void shutdown_logging();

bool is_logging_initialized();

}  // namespace logging
}  // namespace parcel

#endif  // PARCEL_LOG_INIT_HPP
