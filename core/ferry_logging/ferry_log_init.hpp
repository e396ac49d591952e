// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_INIT_HPP
#define FERRY_LOG_INIT_HPP

#include "ferry_log_record.hpp"
#include "ferry_log_sinks.hpp"

namespace ferry {
namespace logging {

struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Environment overrides, applied by init_logging():
 *
 *   FERRY_LOG_LEVEL            both sinks (per-sink variables take precedence)
 *   FERRY_LOG_CONSOLE_LEVEL
 *   FERRY_LOG_CONSOLE_ENABLED  true/false, 1/0, yes/no, on/off
 *   FERRY_LOG_FILE_LEVEL
 *   FERRY_LOG_FILE_ENABLED
 *   FERRY_LOG_FILE_DIR
 *   FERRY_LOG_FORMAT           json or text (file sink)
 *
 * Unparseable values are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Attach the configured sinks to the Boost.Log core.
 * No-op while sinks from an earlier call are still attached.
 */
void init_logging(const LoggingConfig& config);

// Console at INFO, no file
void init_logging_default();

/**
 * Detach the sinks and drain what they still queue. Safe to call repeatedly.
 */
void shutdown_logging();

void reconfigure_logging(const LoggingConfig& config);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_INIT_HPP
