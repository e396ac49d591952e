// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_log_init.cpp
 * @brief Unit tests for logging lifecycle, level parsing and env overrides
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "ferry_log_init.hpp"
#include "ferry_log_macros.hpp"

namespace fs = std::filesystem;

using namespace ferry::logging;

// ============================================================================
// parse_severity_level
// ============================================================================

TEST(ParseSeverityLevelTest, AcceptsAllLevelsCaseInsensitive) {
  EXPECT_EQ(parse_severity_level("debug"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("INFO"), severity_level::info);
  EXPECT_EQ(parse_severity_level("Warn"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("warning"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("error"), severity_level::error);
  EXPECT_EQ(parse_severity_level("FATAL"), severity_level::fatal);
}

TEST(ParseSeverityLevelTest, RejectsUnknown) {
  EXPECT_FALSE(parse_severity_level("verbose").has_value());
  EXPECT_FALSE(parse_severity_level("").has_value());
}

// ============================================================================
// Environment overrides
// ============================================================================

class EnvOverrideTest : public ::testing::Test {
protected:
  void TearDown() override {
    for (const char* name :
         {"FERRY_LOG_LEVEL",
          "FERRY_LOG_CONSOLE_LEVEL",
          "FERRY_LOG_CONSOLE_ENABLED",
          "FERRY_LOG_FILE_LEVEL",
          "FERRY_LOG_FILE_ENABLED",
          "FERRY_LOG_FILE_DIR",
          "FERRY_LOG_FORMAT"}) {
      unsetenv(name);
    }
  }
};

TEST_F(EnvOverrideTest, NoVariablesLeavesConfigUntouched) {
  LoggingConfig config;
  apply_env_overrides(config);
  EXPECT_TRUE(config.console_enabled);
  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_FALSE(config.file_enabled);
  EXPECT_EQ(config.file_level, severity_level::debug);
}

TEST_F(EnvOverrideTest, GlobalLevelThenSinkSpecificLevel) {
  setenv("FERRY_LOG_LEVEL", "error", 1);
  setenv("FERRY_LOG_FILE_LEVEL", "warn", 1);

  LoggingConfig config;
  apply_env_overrides(config);
  EXPECT_EQ(config.console_level, severity_level::error);
  EXPECT_EQ(config.file_level, severity_level::warn);
}

TEST_F(EnvOverrideTest, InvalidLevelIgnored) {
  setenv("FERRY_LOG_CONSOLE_LEVEL", "loud", 1);
  LoggingConfig config;
  apply_env_overrides(config);
  EXPECT_EQ(config.console_level, severity_level::info);
}

TEST_F(EnvOverrideTest, FileSettings) {
  setenv("FERRY_LOG_FILE_ENABLED", "yes", 1);
  setenv("FERRY_LOG_CONSOLE_ENABLED", "off", 1);
  setenv("FERRY_LOG_FILE_DIR", "/tmp/ferry-logs", 1);
  setenv("FERRY_LOG_FORMAT", "TEXT", 1);

  LoggingConfig config;
  apply_env_overrides(config);
  EXPECT_TRUE(config.file_enabled);
  EXPECT_FALSE(config.console_enabled);
  EXPECT_EQ(config.file_config.directory, "/tmp/ferry-logs");
  EXPECT_EQ(config.file_config.format, record_format::text);
}

TEST_F(EnvOverrideTest, UnparseableBoolKeepsCurrentValue) {
  setenv("FERRY_LOG_CONSOLE_ENABLED", "maybe", 1);
  LoggingConfig config;
  apply_env_overrides(config);
  EXPECT_TRUE(config.console_enabled);
}

// ============================================================================
// Lifecycle
// ============================================================================

class LoggingLifecycleTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("ferry_log_init_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    shutdown_logging();
  }

  void TearDown() override {
    shutdown_logging();
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  LoggingConfig fileOnly(severity_level level) const {
    LoggingConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.file_level = level;
    config.file_config.directory = dir_.string();
    config.file_config.file_pattern = "lifecycle_%N.log";
    config.file_config.format = record_format::text;
    return config;
  }

  std::string logs() const {
    std::ostringstream oss;
    for (const auto& entry : fs::directory_iterator(dir_)) {
      std::ifstream in(entry.path());
      oss << in.rdbuf();
    }
    return oss.str();
  }

  size_t occurrences(const std::string& text) const {
    std::string all = logs();
    size_t count = 0;
    for (size_t pos = all.find(text); pos != std::string::npos;
         pos = all.find(text, pos + text.size())) {
      ++count;
    }
    return count;
  }

  fs::path dir_;
};

TEST_F(LoggingLifecycleTest, SecondInitDoesNotDuplicateSinks) {
  init_logging(fileOnly(severity_level::info));
  init_logging(fileOnly(severity_level::info));
  FERRY_LOG_INFO("once");
  shutdown_logging();

  EXPECT_EQ(occurrences("once"), 1u);
}

TEST_F(LoggingLifecycleTest, ReconfigureReplacesLevels) {
  init_logging(fileOnly(severity_level::debug));
  FERRY_LOG_INFO("before reconfigure");
  reconfigure_logging(fileOnly(severity_level::error));
  FERRY_LOG_INFO("after reconfigure");
  FERRY_LOG_ERROR("error after reconfigure");
  shutdown_logging();

  EXPECT_EQ(occurrences("before reconfigure"), 1u);
  EXPECT_EQ(occurrences("] after reconfigure"), 0u);
  EXPECT_EQ(occurrences("error after reconfigure"), 1u);
}

TEST_F(LoggingLifecycleTest, EnvironmentAppliedAtInit) {
  setenv("FERRY_LOG_FILE_LEVEL", "error", 1);
  init_logging(fileOnly(severity_level::debug));
  FERRY_LOG_WARN("suppressed by env");
  shutdown_logging();
  unsetenv("FERRY_LOG_FILE_LEVEL");

  EXPECT_EQ(occurrences("suppressed by env"), 0u);
}

TEST_F(LoggingLifecycleTest, ShutdownWithoutInitIsHarmless) {
  shutdown_logging();
  shutdown_logging();
  init_logging_default();
  shutdown_logging();
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
