// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_APP_CONFIG_PARSER_HPP
#define FERRY_APP_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstddef>
#include <string>

#include "attachment_store.hpp"
#include "backoff_controller.hpp"
#include "queue_service_client.hpp"
#include "storage_client.hpp"
#include "upload_orchestrator.hpp"

// Forward declaration in global namespace
namespace ferry { namespace logging { struct LoggingConfig; } }

namespace ferry {
namespace app {

/**
 * Logging configuration parsed from YAML.
 * This mirrors ferry::logging::LoggingConfig structure.
 */
struct LoggingConfigYaml {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";  // debug, info, warn, error, fatal

  // File sink
  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/ferry";
  std::string file_pattern = "uploader_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";  // json or text
  size_t rotation_size_mb = 50;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

/**
 * Daemon behaviour between runs
 */
struct DaemonSettings {
  // Delay before the next run after a run ended on its own
  std::chrono::seconds rerun_interval{300};
  bool verify_ssl = true;  // For the queue service connection
};

/**
 * Complete configuration of ferry_uploader_daemon
 */
struct DaemonConfig {
  uploader::QueueServiceConfig queue_service;
  uploader::StorageConfig storage;
  uploader::AttachmentStoreConfig attachments;
  uploader::UploaderConfig uploader;
  LoggingConfigYaml logging;
  DaemonSettings daemon;
};

/**
 * Convert LoggingConfigYaml to ferry::logging::LoggingConfig.
 * Unknown level names keep the LoggingConfig default.
 */
void convert_logging_config(
  const LoggingConfigYaml& yaml_config, ::ferry::logging::LoggingConfig& log_config
);

/**
 * YAML loader for DaemonConfig.
 *
 * Every key is optional; missing keys keep their defaults. A file looks like:
 *
 *   queue_service:
 *     base_url: https://api.example.com/v1
 *     access_token: ...
 *   attachments:
 *     storage_root: /home/user/Zotero/storage
 *   uploader:
 *     max_concurrent: 3
 *     idle_backoff: {initial_delay_ms: 2500, max_delay_ms: 60000}
 *   logging:
 *     console: {level: info}
 */
class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, DaemonConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, DaemonConfig& config);

  /**
   * Apply FERRY_ACCESS_TOKEN and FERRY_QUEUE_URL when set and non-empty
   */
  static void apply_env_overrides(DaemonConfig& config);

  /**
   * Validate configuration
   * @param error_msg Set to the first problem found
   */
  static bool validate(const DaemonConfig& config, std::string& error_msg);

private:
  bool parse_queue_service(const YAML::Node& node, uploader::QueueServiceConfig& queue_service);
  bool parse_storage(const YAML::Node& node, uploader::StorageConfig& storage);
  bool parse_attachments(const YAML::Node& node, uploader::AttachmentStoreConfig& attachments);
  bool parse_uploader(const YAML::Node& node, uploader::UploaderConfig& uploader);
  bool parse_backoff(const YAML::Node& node, uploader::BackoffConfig& backoff);
  bool parse_logging(const YAML::Node& node, LoggingConfigYaml& logging);
  bool parse_daemon(const YAML::Node& node, DaemonSettings& daemon);
};

}  // namespace app
}  // namespace ferry

#endif  // FERRY_APP_CONFIG_PARSER_HPP
