// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "parcel_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "parcel_log_macros.hpp"

namespace parcel {
namespace logging {

namespace {

struct LevelName {
  const char* name;
  severity_level level;
};

constexpr LevelName kLevelNames[] = {
  {"debug", severity_level::debug},
  {"info", severity_level::info},
  {"warn", severity_level::warn},
  {"warning", severity_level::warn},
  {"error", severity_level::error},
  {"fatal", severity_level::fatal},
};

// Sinks owned by init_logging() until shutdown_logging()
struct SinkRegistry {
  std::mutex mutex;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool initialized = false;
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

/// Value of a non-empty environment variable, nullptr otherwise
const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value && value[0] != '\0') ? value : nullptr;
}

void override_level(const char* name, severity_level& target) {
  if (const char* value = env_value(name)) {
    if (auto level = parse_severity_level(value)) {
      target = *level;
    }
  }
}

// Unrecognised values keep the configured setting
void override_flag(const char* name, bool& target) {
  const char* value = env_value(name);
  if (!value) {
    return;
  }
  const std::string lower = to_lower(value);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    target = true;
  } else if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    target = false;
  }
}

template<typename Sink>
void detach_sink(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  // stop() ends the feeding thread; flush() writes what is still queued
  sink->stop();
  sink->flush();
  sink.reset();
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string lower = to_lower(level_str);
  for (const auto& entry : kLevelNames) {
    if (lower == entry.name) {
      return entry.level;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  // The global level goes first so the per-sink variables can refine it
  if (const char* value = env_value("PARCEL_LOG_LEVEL")) {
    if (auto level = parse_severity_level(value)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  override_level("PARCEL_LOG_CONSOLE_LEVEL", config.console_level);
  override_level("PARCEL_LOG_FILE_LEVEL", config.file_level);

  override_flag("PARCEL_LOG_CONSOLE_ENABLED", config.console_enabled);
  override_flag("PARCEL_LOG_FILE_ENABLED", config.file_enabled);

  if (const char* dir = env_value("PARCEL_LOG_FILE_DIR")) {
    config.file_config.directory = dir;
  }
  if (const char* format = env_value("PARCEL_LOG_FORMAT")) {
    const std::string lower = to_lower(format);
    if (lower == "json" || lower == "text") {
      config.file_config.format_json = (lower == "json");
    }
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    reg.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(reg.console);
  }
  if (config.file_enabled) {
    reg.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(reg.file);
  }
  reg.initialized = true;
}

void shutdown_logging() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (!reg.initialized) {
    return;
  }

  detach_sink(reg.console);
  detach_sink(reg.file);
  reg.initialized = false;
}

bool is_logging_initialized() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  return reg.initialized;
}

}  // namespace logging
}  // namespace parcel
