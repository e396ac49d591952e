// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file ferry_uploader.cpp
 * @brief Entry point for ferry_uploader_daemon
 *
 * Usage: ferry_uploader_daemon --config <file.yaml> [--once]
 *
 * Drains the server upload queue. With --once the process exits when the
 * first run ends; otherwise a new run starts after daemon.rerun_interval_s.
 */

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "attachment_store.hpp"
#include "config_parser.hpp"
#include "http_client.hpp"
#include "queue_service_client.hpp"
#include "session_state.hpp"
#include "storage_client.hpp"
#include "upload_orchestrator.hpp"

// Logging infrastructure
#define FERRY_LOG_COMPONENT "main"
#include <ferry_log_init.hpp>
#include <ferry_log_macros.hpp>

using ferry::logging::kv;

namespace {
// Global flag for signal handling
volatile std::sig_atomic_t g_shutdown_requested = 0;
volatile std::sig_atomic_t g_received_signal = 0;

void signal_handler(int signum) {
  // Only async-signal-safe work here: Boost.Log takes locks and allocates.
  g_received_signal = signum;
  g_shutdown_requested = 1;
}

struct CommandLine {
  std::string config_path;
  bool once = false;
  bool help = false;
};

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " --config <file.yaml> [--once]\n"
            << "  --config <file>  Daemon configuration (YAML)\n"
            << "  --once           Exit when the first upload run ends\n"
            << "  --help           Show this message\n";
}

bool parse_command_line(int argc, char** argv, CommandLine& cmd) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      cmd.config_path = argv[++i];
    } else if (arg == "--once") {
      cmd.once = true;
    } else if (arg == "--help" || arg == "-h") {
      cmd.help = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return false;
    }
  }
  return cmd.help || !cmd.config_path.empty();
}

// Sleep in short slices so a signal ends the wait promptly
bool wait_unless_shutdown(std::chrono::milliseconds duration) {
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!g_shutdown_requested) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  return false;
}

void log_queue_status(ferry::uploader::IQueueService& queue) {
  try {
    auto status = queue.getQueueStatus();
    FERRY_LOG_INFO(
      "Queue status" << kv("pending", status.pending) << kv("in_progress", status.in_progress)
                     << kv("completed", status.completed) << kv("failed", status.failed)
                     << kv("total", status.total)
    );
  } catch (const std::exception& e) {
    FERRY_LOG_WARN("Could not fetch queue status" << kv("error", e.what()));
  }
}

}  // namespace

int main(int argc, char** argv) {
  // Initialize logging first (console only, reconfigured from the file below)
  ferry::logging::init_logging_default();

  CommandLine cmd;
  if (!parse_command_line(argc, argv, cmd)) {
    print_usage(argv[0]);
    ferry::logging::shutdown_logging();
    return 1;
  }
  if (cmd.help) {
    print_usage(argv[0]);
    ferry::logging::shutdown_logging();
    return 0;
  }

  ferry::app::DaemonConfig config;
  ferry::app::ConfigParser parser;
  if (!parser.load_from_file(cmd.config_path, config)) {
    FERRY_LOG_FATAL("Failed to load configuration" << kv("path", cmd.config_path));
    ferry::logging::shutdown_logging();
    return 1;
  }
  ferry::app::ConfigParser::apply_env_overrides(config);

  std::string error_msg;
  if (!ferry::app::ConfigParser::validate(config, error_msg)) {
    FERRY_LOG_FATAL("Invalid configuration" << kv("error", error_msg));
    ferry::logging::shutdown_logging();
    return 1;
  }

  ferry::logging::LoggingConfig log_config;
  ferry::app::convert_logging_config(config.logging, log_config);
  ferry::logging::reconfigure_logging(log_config);

  FERRY_LOG_INFO(
    "ferry_uploader_daemon starting" << kv("version", FERRY_VERSION)
                                     << kv("queue_url", config.queue_service.base_url)
                                     << kv("storage_root", config.attachments.storage_root)
  );

  std::signal(SIGTERM, signal_handler);
  std::signal(SIGINT, signal_handler);

  int exit_code = 0;
  {
    auto session =
      std::make_shared<ferry::uploader::StaticSessionState>(config.queue_service.access_token);

    ferry::uploader::HttpClient::Config api_config;
    api_config.request_timeout = config.queue_service.request_timeout;
    api_config.verify_ssl = config.daemon.verify_ssl;
    auto queue = std::make_shared<ferry::uploader::HttpQueueService>(
      config.queue_service, std::make_shared<ferry::uploader::HttpClient>(api_config), session
    );
    auto storage = std::make_shared<ferry::uploader::HttpStorageClient>(
      ferry::uploader::make_storage_transport(config.storage)
    );
    auto attachments = std::make_shared<ferry::uploader::LocalAttachmentStore>(config.attachments);

    ferry::uploader::UploadOrchestrator orchestrator(
      config.uploader, queue, attachments, storage, session
    );
    orchestrator.setStatusCallback([](const ferry::uploader::UploadProgressInfo& info) {
      FERRY_LOG_INFO(
        "Upload progress" << kv("status", ferry::uploader::to_string(info.status))
                          << kv("current", info.current) << kv("total", info.total)
      );
    });

    while (!g_shutdown_requested) {
      log_queue_status(*queue);
      orchestrator.start();

      while (orchestrator.isRunning() && !g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
      }
      if (g_shutdown_requested) {
        break;
      }

      auto stats = orchestrator.stats().snapshot();
      FERRY_LOG_INFO(
        "Upload run finished" << kv("completed", stats.tasks_completed)
                              << kv("failed", stats.tasks_failed) << kv("reset", stats.tasks_reset)
                              << kv("report_failures", stats.report_failures)
                              << kv("bytes", stats.bytes_uploaded)
      );

      if (!session->isAuthenticated()) {
        FERRY_LOG_ERROR("Session is no longer authenticated, exiting");
        exit_code = 2;
        break;
      }
      if (cmd.once) {
        break;
      }
      if (!wait_unless_shutdown(config.daemon.rerun_interval)) {
        break;
      }
    }

    // Log the signal that triggered shutdown (safe to log here, outside signal handler)
    if (g_received_signal != 0) {
      FERRY_LOG_INFO(
        "Received signal, shutting down" << kv("signal", static_cast<int>(g_received_signal))
      );
    }

    // Waits for in-flight uploads; a no-op if the run already ended
    orchestrator.stop();
  }

  FERRY_LOG_INFO("Exiting" << kv("exit_code", exit_code));

  // Shutdown logging (flushes all pending log messages)
  ferry::logging::shutdown_logging();

  return exit_code;
}
