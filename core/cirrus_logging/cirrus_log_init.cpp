// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cirrus_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "cirrus_log_macros.hpp"

namespace cirrus {
namespace logging {

namespace {

std::mutex g_sinks_mutex;
boost::shared_ptr<async_console_sink_t> g_console_sink;
boost::shared_ptr<async_file_sink_t> g_file_sink;
bool g_initialized = false;

struct LevelOverride {
  const char* env_name;
  bool console;
  bool file;
};

// Applied in order, so the per-sink variables win
const LevelOverride kLevelOverrides[] = {
  {"CIRRUS_LOG_LEVEL", true, true},
  {"CIRRUS_LOG_CONSOLE_LEVEL", true, false},
  {"CIRRUS_LOG_FILE_LEVEL", false, true},
};

struct SwitchOverride {
  const char* env_name;
  bool LoggingConfig::*field;
};

const SwitchOverride kSwitchOverrides[] = {
  {"CIRRUS_LOG_CONSOLE_ENABLED", &LoggingConfig::console_enabled},
  {"CIRRUS_LOG_CONSOLE_COLORS", &LoggingConfig::console_colors},
  {"CIRRUS_LOG_FILE_ENABLED", &LoggingConfig::file_enabled},
};

std::string to_lower(const std::string& s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return result;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<bool> parse_bool(const std::string& s) {
  std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

// stop() drains the async queue before the sink leaves the core
template<typename Sink>
void detach_sink(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  sink->stop();
  sink->flush();
  boost::log::core::get()->remove_sink(sink);
  sink.reset();
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);

  if (lower == "debug") {
    return severity_level::debug;
  } else if (lower == "info") {
    return severity_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return severity_level::warn;
  } else if (lower == "error") {
    return severity_level::error;
  }

  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  for (const auto& entry : kLevelOverrides) {
    auto value = get_env(entry.env_name);
    auto level = value ? parse_severity_level(*value) : std::nullopt;
    if (!level) {
      continue;
    }
    if (entry.console) {
      config.console_level = *level;
    }
    if (entry.file) {
      config.file_level = *level;
    }
  }

  if (get_env("NO_COLOR")) {
    config.console_colors = false;
  }
  for (const auto& entry : kSwitchOverrides) {
    auto value = get_env(entry.env_name);
    auto enabled = value ? parse_bool(*value) : std::nullopt;
    if (enabled) {
      config.*entry.field = *enabled;
    }
  }

  if (auto dir = get_env("CIRRUS_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = get_env("CIRRUS_LOG_FORMAT")) {
    std::string lower = to_lower(*format);
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
  std::lock_guard<std::mutex> lock(g_sinks_mutex);

  if (g_initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    g_console_sink = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(g_console_sink);
  }

  if (config.file_enabled) {
    g_file_sink = create_file_sink(config.file_config, config.file_level);
    core->add_sink(g_file_sink);
  }

  g_initialized = true;
}

void shutdown_logging() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);

  if (!g_initialized) {
    return;
  }

  detach_sink(g_console_sink);
  detach_sink(g_file_sink);

  g_initialized = false;
}

bool is_logging_initialized() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  return g_initialized;
}

}  // namespace logging
}  // namespace cirrus
