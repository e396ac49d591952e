// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <cstdlib>

#include "http_client.hpp"

// Logging infrastructure
#define FERRY_LOG_COMPONENT "config_parser"
#include <ferry_log_init.hpp>
#include <ferry_log_macros.hpp>

namespace ferry {
namespace app {

namespace {

bool validate_backoff(
  const uploader::BackoffConfig& backoff, const std::string& name, std::string& error_msg
) {
  if (backoff.initial_delay.count() <= 0) {
    error_msg = name + ".initial_delay_ms must be positive";
    return false;
  }
  if (backoff.max_delay < backoff.initial_delay) {
    error_msg = name + ".max_delay_ms must not be below initial_delay_ms";
    return false;
  }
  if (backoff.factor < 1.0) {
    error_msg = name + ".factor must be at least 1.0";
    return false;
  }
  if (backoff.jitter_factor < 0.0 || backoff.jitter_factor > 1.0) {
    error_msg = name + ".jitter_factor must be within [0, 1]";
    return false;
  }
  return true;
}

}  // namespace

bool ConfigParser::load_from_file(const std::string& path, DaemonConfig& config) {
  try {
    YAML::Node node = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(node), config);
  } catch (const YAML::Exception& e) {
    FERRY_LOG_ERROR(
      "YAML parsing error" << ::ferry::logging::kv("path", path)
                           << ::ferry::logging::kv("error", e.what())
    );
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, DaemonConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      FERRY_LOG_ERROR("Configuration root must be a mapping");
      return false;
    }

    bool ok = true;
    if (node["queue_service"]) {
      ok = parse_queue_service(node["queue_service"], config.queue_service) && ok;
    }
    if (node["storage"]) {
      ok = parse_storage(node["storage"], config.storage) && ok;
    }
    if (node["attachments"]) {
      ok = parse_attachments(node["attachments"], config.attachments) && ok;
    }
    if (node["uploader"]) {
      ok = parse_uploader(node["uploader"], config.uploader) && ok;
    }
    // Optional, uses defaults if not present
    if (node["logging"]) {
      ok = parse_logging(node["logging"], config.logging) && ok;
    }
    if (node["daemon"]) {
      ok = parse_daemon(node["daemon"], config.daemon) && ok;
    }
    return ok;
  } catch (const YAML::Exception& e) {
    FERRY_LOG_ERROR("YAML parsing error" << ::ferry::logging::kv("error", e.what()));
    return false;
  }
}

bool ConfigParser::parse_queue_service(
  const YAML::Node& node, uploader::QueueServiceConfig& queue_service
) {
  if (!node.IsMap()) {
    return false;
  }
  if (node["base_url"]) {
    queue_service.base_url = node["base_url"].as<std::string>();
  }
  if (node["access_token"]) {
    queue_service.access_token = node["access_token"].as<std::string>();
  }
  if (node["client_version"]) {
    queue_service.client_version = node["client_version"].as<std::string>();
  }
  if (node["request_timeout_s"]) {
    queue_service.request_timeout = std::chrono::seconds(node["request_timeout_s"].as<int>());
  }
  return true;
}

bool ConfigParser::parse_storage(const YAML::Node& node, uploader::StorageConfig& storage) {
  if (!node.IsMap()) {
    return false;
  }
  if (node["put_timeout_s"]) {
    storage.put_timeout = std::chrono::seconds(node["put_timeout_s"].as<int>());
  }
  if (node["verify_ssl"]) {
    storage.verify_ssl = node["verify_ssl"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_attachments(
  const YAML::Node& node, uploader::AttachmentStoreConfig& attachments
) {
  if (!node.IsMap()) {
    return false;
  }
  if (node["storage_root"]) {
    attachments.storage_root = node["storage_root"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_backoff(const YAML::Node& node, uploader::BackoffConfig& backoff) {
  if (!node.IsMap()) {
    return false;
  }
  if (node["initial_delay_ms"]) {
    backoff.initial_delay = std::chrono::milliseconds(node["initial_delay_ms"].as<int64_t>());
  }
  if (node["max_delay_ms"]) {
    backoff.max_delay = std::chrono::milliseconds(node["max_delay_ms"].as<int64_t>());
  }
  if (node["factor"]) {
    backoff.factor = node["factor"].as<double>();
  }
  if (node["jitter"]) {
    backoff.jitter = node["jitter"].as<bool>();
  }
  if (node["jitter_factor"]) {
    backoff.jitter_factor = node["jitter_factor"].as<double>();
  }
  return true;
}

bool ConfigParser::parse_uploader(const YAML::Node& node, uploader::UploaderConfig& uploader) {
  if (!node.IsMap()) {
    return false;
  }

  bool ok = true;
  if (node["max_concurrent"]) {
    uploader.max_concurrent = node["max_concurrent"].as<int>();
  }
  if (node["max_idle_polls"]) {
    uploader.max_idle_polls = node["max_idle_polls"].as<int>();
  }
  if (node["max_consecutive_errors"]) {
    uploader.max_consecutive_errors = node["max_consecutive_errors"].as<int>();
  }
  if (node["error_pause_ms"]) {
    uploader.error_pause = std::chrono::milliseconds(node["error_pause_ms"].as<int64_t>());
  }
  if (node["idle_backoff"]) {
    ok = parse_backoff(node["idle_backoff"], uploader.idle_backoff) && ok;
  }
  if (node["error_backoff"]) {
    ok = parse_backoff(node["error_backoff"], uploader.error_backoff) && ok;
  }

  // Per-item retry policy
  if (node["put_max_attempts"]) {
    uploader.task.put_max_attempts = node["put_max_attempts"].as<int>();
  }
  if (node["put_retry_step_ms"]) {
    uploader.task.put_retry_step =
      std::chrono::milliseconds(node["put_retry_step_ms"].as<int64_t>());
  }
  if (node["max_server_attempts"]) {
    uploader.task.max_server_attempts = node["max_server_attempts"].as<int>();
  }
  return ok;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingConfigYaml& logging) {
  if (!node.IsMap()) {
    return false;
  }

  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::parse_daemon(const YAML::Node& node, DaemonSettings& daemon) {
  if (!node.IsMap()) {
    return false;
  }
  if (node["rerun_interval_s"]) {
    daemon.rerun_interval = std::chrono::seconds(node["rerun_interval_s"].as<int>());
  }
  if (node["verify_ssl"]) {
    daemon.verify_ssl = node["verify_ssl"].as<bool>();
  }
  return true;
}

void ConfigParser::apply_env_overrides(DaemonConfig& config) {
  if (const char* token = std::getenv("FERRY_ACCESS_TOKEN")) {
    if (*token != '\0') {
      config.queue_service.access_token = token;
    }
  }
  if (const char* url = std::getenv("FERRY_QUEUE_URL")) {
    if (*url != '\0') {
      config.queue_service.base_url = url;
    }
  }
}

bool ConfigParser::validate(const DaemonConfig& config, std::string& error_msg) {
  uploader::ParsedUrl url;
  if (config.queue_service.base_url.empty()) {
    error_msg = "queue_service.base_url is required";
    return false;
  }
  if (!uploader::parse_url(config.queue_service.base_url, url)) {
    error_msg = "queue_service.base_url is not an http(s) URL: " + config.queue_service.base_url;
    return false;
  }
  if (config.queue_service.access_token.empty()) {
    error_msg = "queue_service.access_token is required (or set FERRY_ACCESS_TOKEN)";
    return false;
  }
  if (config.queue_service.request_timeout.count() <= 0) {
    error_msg = "queue_service.request_timeout_s must be positive";
    return false;
  }
  if (config.storage.put_timeout.count() <= 0) {
    error_msg = "storage.put_timeout_s must be positive";
    return false;
  }
  if (config.attachments.storage_root.empty()) {
    error_msg = "attachments.storage_root is required";
    return false;
  }

  const auto& up = config.uploader;
  if (up.max_concurrent < 1) {
    error_msg = "uploader.max_concurrent must be at least 1";
    return false;
  }
  if (up.max_idle_polls < 1) {
    error_msg = "uploader.max_idle_polls must be at least 1";
    return false;
  }
  if (up.max_consecutive_errors < 1) {
    error_msg = "uploader.max_consecutive_errors must be at least 1";
    return false;
  }
  if (up.error_pause.count() < 0) {
    error_msg = "uploader.error_pause_ms must not be negative";
    return false;
  }
  if (!validate_backoff(up.idle_backoff, "uploader.idle_backoff", error_msg) ||
      !validate_backoff(up.error_backoff, "uploader.error_backoff", error_msg)) {
    return false;
  }
  if (up.task.put_max_attempts < 1) {
    error_msg = "uploader.put_max_attempts must be at least 1";
    return false;
  }
  if (up.task.put_retry_step.count() < 0) {
    error_msg = "uploader.put_retry_step_ms must not be negative";
    return false;
  }
  if (up.task.max_server_attempts < 1) {
    error_msg = "uploader.max_server_attempts must be at least 1";
    return false;
  }

  if (!::ferry::logging::parse_severity_level(config.logging.console_level)) {
    error_msg = "logging.console.level is invalid: " + config.logging.console_level;
    return false;
  }
  if (!::ferry::logging::parse_severity_level(config.logging.file_level)) {
    error_msg = "logging.file.level is invalid: " + config.logging.file_level;
    return false;
  }
  if (config.logging.file_format != "json" && config.logging.file_format != "text") {
    error_msg = "logging.file.format must be json or text";
    return false;
  }
  if (config.daemon.rerun_interval.count() < 0) {
    error_msg = "daemon.rerun_interval_s must not be negative";
    return false;
  }
  return true;
}

void convert_logging_config(
  const LoggingConfigYaml& yaml_config, ::ferry::logging::LoggingConfig& log_config
) {
  // Console settings
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;
  if (auto level = ::ferry::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  // File settings
  log_config.file_enabled = yaml_config.file_enabled;
  if (auto level = ::ferry::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  // File sink config
  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format = yaml_config.file_format == "json"
                                    ? ::ferry::logging::record_format::json
                                    : ::ferry::logging::record_format::text;
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(yaml_config.max_files);
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

}  // namespace app
}  // namespace ferry
