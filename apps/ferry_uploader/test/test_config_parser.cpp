// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_config_parser.cpp
 * @brief Unit tests for the daemon YAML configuration
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <ferry_log_init.hpp>

#include "../config_parser.hpp"

namespace fs = std::filesystem;

using namespace ferry::app;

namespace {

const char* kMinimalYaml = R"(
queue_service:
  base_url: https://api.example.com/v1
  access_token: secret-token
attachments:
  storage_root: /home/user/Zotero/storage
)";

}  // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("ferry_config_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
    unsetenv("FERRY_ACCESS_TOKEN");
    unsetenv("FERRY_QUEUE_URL");
  }

  void TearDown() override {
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
    unsetenv("FERRY_ACCESS_TOKEN");
    unsetenv("FERRY_QUEUE_URL");
  }

  std::string write_test_file(const std::string& filename, const std::string& content) {
    auto path = test_dir_ / filename;
    std::ofstream file(path);
    file << content;
    return path.string();
  }

  fs::path test_dir_;
  ConfigParser parser_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigParserTest, MinimalConfigKeepsDefaults) {
  DaemonConfig config;
  ASSERT_TRUE(parser_.load_from_string(kMinimalYaml, config));

  EXPECT_EQ(config.queue_service.base_url, "https://api.example.com/v1");
  EXPECT_EQ(config.queue_service.access_token, "secret-token");
  EXPECT_EQ(config.attachments.storage_root, "/home/user/Zotero/storage");

  EXPECT_EQ(config.uploader.max_concurrent, 3);
  EXPECT_EQ(config.uploader.idle_backoff.initial_delay, std::chrono::milliseconds(2500));
  EXPECT_EQ(config.uploader.error_backoff.initial_delay, std::chrono::milliseconds(1000));
  EXPECT_EQ(config.uploader.max_idle_polls, 10);
  EXPECT_EQ(config.uploader.max_consecutive_errors, 5);
  EXPECT_EQ(config.uploader.error_pause, std::chrono::milliseconds(60000));
  EXPECT_EQ(config.uploader.task.put_max_attempts, 3);
  EXPECT_EQ(config.uploader.task.put_retry_step, std::chrono::milliseconds(2000));
  EXPECT_EQ(config.uploader.task.max_server_attempts, 3);
  EXPECT_EQ(config.storage.put_timeout, std::chrono::seconds(300));

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, FullConfig) {
  const std::string yaml = R"(
queue_service:
  base_url: http://localhost:8080/api
  access_token: abc
  client_version: 9.9.9
  request_timeout_s: 10
storage:
  put_timeout_s: 120
  verify_ssl: false
attachments:
  storage_root: /data/storage
uploader:
  max_concurrent: 5
  max_idle_polls: 4
  max_consecutive_errors: 2
  error_pause_ms: 30000
  idle_backoff:
    initial_delay_ms: 500
    max_delay_ms: 8000
    factor: 1.5
    jitter: true
    jitter_factor: 0.1
  error_backoff:
    initial_delay_ms: 250
  put_max_attempts: 4
  put_retry_step_ms: 100
  max_server_attempts: 6
logging:
  console:
    level: debug
    colors: false
  file:
    enabled: true
    level: warn
    directory: /tmp/ferry-logs
    format: text
    max_files: 3
daemon:
  rerun_interval_s: 60
  verify_ssl: false
)";

  DaemonConfig config;
  ASSERT_TRUE(parser_.load_from_string(yaml, config));

  EXPECT_EQ(config.queue_service.client_version, "9.9.9");
  EXPECT_EQ(config.queue_service.request_timeout, std::chrono::seconds(10));
  EXPECT_EQ(config.storage.put_timeout, std::chrono::seconds(120));
  EXPECT_FALSE(config.storage.verify_ssl);

  EXPECT_EQ(config.uploader.max_concurrent, 5);
  EXPECT_EQ(config.uploader.max_idle_polls, 4);
  EXPECT_EQ(config.uploader.max_consecutive_errors, 2);
  EXPECT_EQ(config.uploader.error_pause, std::chrono::milliseconds(30000));
  EXPECT_EQ(config.uploader.idle_backoff.initial_delay, std::chrono::milliseconds(500));
  EXPECT_EQ(config.uploader.idle_backoff.max_delay, std::chrono::milliseconds(8000));
  EXPECT_DOUBLE_EQ(config.uploader.idle_backoff.factor, 1.5);
  EXPECT_TRUE(config.uploader.idle_backoff.jitter);
  EXPECT_DOUBLE_EQ(config.uploader.idle_backoff.jitter_factor, 0.1);
  EXPECT_EQ(config.uploader.error_backoff.initial_delay, std::chrono::milliseconds(250));
  EXPECT_EQ(config.uploader.error_backoff.max_delay, std::chrono::milliseconds(60000));
  EXPECT_EQ(config.uploader.task.put_max_attempts, 4);
  EXPECT_EQ(config.uploader.task.put_retry_step, std::chrono::milliseconds(100));
  EXPECT_EQ(config.uploader.task.max_server_attempts, 6);

  EXPECT_EQ(config.logging.console_level, "debug");
  EXPECT_FALSE(config.logging.console_colors);
  EXPECT_TRUE(config.logging.file_enabled);
  EXPECT_EQ(config.logging.file_format, "text");
  EXPECT_EQ(config.logging.max_files, 3u);

  EXPECT_EQ(config.daemon.rerun_interval, std::chrono::seconds(60));
  EXPECT_FALSE(config.daemon.verify_ssl);

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, LoadFromFile) {
  auto path = write_test_file("ferry.yaml", kMinimalYaml);
  DaemonConfig config;
  ASSERT_TRUE(parser_.load_from_file(path, config));
  EXPECT_EQ(config.queue_service.access_token, "secret-token");
}

TEST_F(ConfigParserTest, MissingFileFails) {
  DaemonConfig config;
  EXPECT_FALSE(parser_.load_from_file((test_dir_ / "absent.yaml").string(), config));
}

TEST_F(ConfigParserTest, MalformedYamlFails) {
  DaemonConfig config;
  EXPECT_FALSE(parser_.load_from_string("queue_service: [unclosed", config));
}

TEST_F(ConfigParserTest, WrongValueTypeFails) {
  DaemonConfig config;
  EXPECT_FALSE(parser_.load_from_string("uploader:\n  max_concurrent: many\n", config));
}

TEST_F(ConfigParserTest, SectionMustBeMapping) {
  DaemonConfig config;
  EXPECT_FALSE(parser_.load_from_string("uploader: [1, 2]\n", config));
}

// ============================================================================
// Environment overrides
// ============================================================================

TEST_F(ConfigParserTest, EnvironmentOverridesFile) {
  DaemonConfig config;
  ASSERT_TRUE(parser_.load_from_string(kMinimalYaml, config));

  setenv("FERRY_ACCESS_TOKEN", "env-token", 1);
  setenv("FERRY_QUEUE_URL", "https://other.example.com", 1);
  ConfigParser::apply_env_overrides(config);

  EXPECT_EQ(config.queue_service.access_token, "env-token");
  EXPECT_EQ(config.queue_service.base_url, "https://other.example.com");
}

TEST_F(ConfigParserTest, EmptyEnvironmentIsIgnored) {
  DaemonConfig config;
  ASSERT_TRUE(parser_.load_from_string(kMinimalYaml, config));

  setenv("FERRY_ACCESS_TOKEN", "", 1);
  ConfigParser::apply_env_overrides(config);
  EXPECT_EQ(config.queue_service.access_token, "secret-token");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigParserTest, RequiresQueueUrlTokenAndRoot) {
  DaemonConfig config;
  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("base_url"), std::string::npos);

  config.queue_service.base_url = "ftp://example.com";
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("base_url"), std::string::npos);

  config.queue_service.base_url = "https://example.com";
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("access_token"), std::string::npos);

  config.queue_service.access_token = "t";
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("storage_root"), std::string::npos);

  config.attachments.storage_root = "/data";
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, RejectsBadUploaderValues) {
  DaemonConfig config;
  ASSERT_TRUE(parser_.load_from_string(kMinimalYaml, config));
  std::string error;

  DaemonConfig bad = config;
  bad.uploader.max_concurrent = 0;
  EXPECT_FALSE(ConfigParser::validate(bad, error));
  EXPECT_NE(error.find("max_concurrent"), std::string::npos);

  bad = config;
  bad.uploader.idle_backoff.max_delay = std::chrono::milliseconds(10);
  EXPECT_FALSE(ConfigParser::validate(bad, error));
  EXPECT_NE(error.find("idle_backoff"), std::string::npos);

  bad = config;
  bad.uploader.error_backoff.factor = 0.5;
  EXPECT_FALSE(ConfigParser::validate(bad, error));
  EXPECT_NE(error.find("error_backoff"), std::string::npos);

  bad = config;
  bad.uploader.task.put_max_attempts = 0;
  EXPECT_FALSE(ConfigParser::validate(bad, error));
  EXPECT_NE(error.find("put_max_attempts"), std::string::npos);
}

TEST_F(ConfigParserTest, RejectsBadLoggingValues) {
  DaemonConfig config;
  ASSERT_TRUE(parser_.load_from_string(kMinimalYaml, config));
  std::string error;

  config.logging.console_level = "verbose";
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("console.level"), std::string::npos);

  config.logging.console_level = "info";
  config.logging.file_format = "xml";
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("format"), std::string::npos);
}

// ============================================================================
// Logging conversion
// ============================================================================

TEST(ConvertLoggingConfigTest, MapsAllFields) {
  LoggingConfigYaml yaml;
  yaml.console_enabled = false;
  yaml.console_level = "error";
  yaml.file_enabled = true;
  yaml.file_level = "warn";
  yaml.file_directory = "/tmp/ferry";
  yaml.file_format = "text";
  yaml.rotation_size_mb = 5;
  yaml.max_files = 2;
  yaml.rotate_at_midnight = false;

  ferry::logging::LoggingConfig log_config;
  convert_logging_config(yaml, log_config);

  EXPECT_FALSE(log_config.console_enabled);
  EXPECT_EQ(log_config.console_level, ferry::logging::severity_level::error);
  EXPECT_TRUE(log_config.file_enabled);
  EXPECT_EQ(log_config.file_level, ferry::logging::severity_level::warn);
  EXPECT_EQ(log_config.file_config.directory, "/tmp/ferry");
  EXPECT_EQ(log_config.file_config.format, ferry::logging::record_format::text);
  EXPECT_EQ(log_config.file_config.rotation_size_mb, 5u);
  EXPECT_EQ(log_config.file_config.max_files, 2);
  EXPECT_FALSE(log_config.file_config.rotate_at_midnight);
}

TEST(ConvertLoggingConfigTest, UnknownLevelKeepsDefault) {
  LoggingConfigYaml yaml;
  yaml.console_level = "loud";

  ferry::logging::LoggingConfig log_config;
  convert_logging_config(yaml, log_config);
  EXPECT_EQ(log_config.console_level, ferry::logging::severity_level::info);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
