// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_log_init.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <utility>

namespace ferry {
namespace logging {

namespace {

struct AttachedSinks {
  std::mutex mutex;
  boost::shared_ptr<stream_sink_t> console;
  boost::shared_ptr<file_sink_t> file;
  bool common_attributes_added = false;
};

AttachedSinks& attached() {
  static AttachedSinks sinks;
  return sinks;
}

template <typename SinkT>
void detach(boost::shared_ptr<SinkT>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::optional<std::string> env_value(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

void override_level(const char* name, severity_level& target) {
  if (auto value = env_value(name)) {
    if (auto level = parse_severity_level(*value)) {
      target = *level;
    }
  }
}

void override_flag(const char* name, bool& target) {
  auto value = env_value(name);
  if (!value) {
    return;
  }
  const std::string flag = lowercase(*value);
  if (flag == "true" || flag == "1" || flag == "yes" || flag == "on") {
    target = true;
  } else if (flag == "false" || flag == "0" || flag == "no" || flag == "off") {
    target = false;
  }
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& name) {
  static const std::pair<const char*, severity_level> kNames[] = {
    {"debug", severity_level::debug}, {"info", severity_level::info},
    {"warn", severity_level::warn},   {"warning", severity_level::warn},
    {"error", severity_level::error}, {"fatal", severity_level::fatal},
  };
  const std::string lowered = lowercase(name);
  for (const auto& entry : kNames) {
    if (lowered == entry.first) {
      return entry.second;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  if (auto value = env_value("FERRY_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*value)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  override_level("FERRY_LOG_CONSOLE_LEVEL", config.console_level);
  override_level("FERRY_LOG_FILE_LEVEL", config.file_level);
  override_flag("FERRY_LOG_CONSOLE_ENABLED", config.console_enabled);
  override_flag("FERRY_LOG_FILE_ENABLED", config.file_enabled);

  if (auto dir = env_value("FERRY_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = env_value("FERRY_LOG_FORMAT")) {
    const std::string name = lowercase(*format);
    if (name == "json") {
      config.file_config.format = record_format::json;
    } else if (name == "text") {
      config.file_config.format = record_format::text;
    }
  }
}

void init_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);

  AttachedSinks& sinks = attached();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.console || sinks.file) {
    return;
  }

  auto core = boost::log::core::get();
  if (!sinks.common_attributes_added) {
    boost::log::add_common_attributes();
    sinks.common_attributes_added = true;
  }

  if (effective.console_enabled) {
    sinks.console = make_stream_sink(
      boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()), effective.console_level,
      effective.console_colors
    );
    core->add_sink(sinks.console);
  }
  if (effective.file_enabled) {
    sinks.file = make_file_sink(effective.file_config, effective.file_level);
    core->add_sink(sinks.file);
  }
}

void init_logging_default() {
  init_logging(LoggingConfig());
}

void shutdown_logging() {
  AttachedSinks& sinks = attached();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  detach(sinks.console);
  detach(sinks.file);
}

void reconfigure_logging(const LoggingConfig& config) {
  shutdown_logging();
  init_logging(config);
}

}  // namespace logging
}  // namespace ferry
