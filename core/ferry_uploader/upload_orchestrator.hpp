// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_ORCHESTRATOR_HPP
#define FERRY_UPLOAD_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>

#include "backoff_controller.hpp"
#include "concurrency_scheduler.hpp"
#include "progress_tracker.hpp"
#include "upload_task.hpp"
#include "uploader_interfaces.hpp"
#include "uploader_types.hpp"

namespace ferry {
namespace uploader {

/**
 * Configuration for the upload run loop
 */
struct UploaderConfig {
  // Concurrent uploads, also the pop batch size
  int max_concurrent = 3;

  // Queue had work but none was claimed
  BackoffConfig idle_backoff = BackoffConfig{std::chrono::milliseconds(2500)};

  // A loop-level operation failed
  BackoffConfig error_backoff = BackoffConfig{std::chrono::milliseconds(1000)};

  // Consecutive empty polls before a soft stop
  int max_idle_polls = 10;

  // Consecutive loop errors before the long pause
  int max_consecutive_errors = 5;
  std::chrono::milliseconds error_pause{60000};

  // Per-item PUT retry policy
  UploadTaskConfig task;
};

/**
 * Copyable view of UploaderStats
 */
struct UploaderStatsSnapshot {
  uint64_t tasks_completed = 0;
  uint64_t tasks_failed = 0;
  uint64_t tasks_reset = 0;
  uint64_t report_failures = 0;
  uint64_t bytes_uploaded = 0;
  uint64_t polls = 0;
  uint64_t systemic_errors = 0;
};

/**
 * Uploader statistics, cumulative over the orchestrator lifetime
 */
struct UploaderStats {
  std::atomic<uint64_t> tasks_completed{0};
  std::atomic<uint64_t> tasks_failed{0};
  std::atomic<uint64_t> tasks_reset{0};
  std::atomic<uint64_t> report_failures{0};
  std::atomic<uint64_t> bytes_uploaded{0};
  std::atomic<uint64_t> polls{0};
  std::atomic<uint64_t> systemic_errors{0};

  UploaderStatsSnapshot snapshot() const {
    UploaderStatsSnapshot s;
    s.tasks_completed = tasks_completed.load(std::memory_order_relaxed);
    s.tasks_failed = tasks_failed.load(std::memory_order_relaxed);
    s.tasks_reset = tasks_reset.load(std::memory_order_relaxed);
    s.report_failures = report_failures.load(std::memory_order_relaxed);
    s.bytes_uploaded = bytes_uploaded.load(std::memory_order_relaxed);
    s.polls = polls.load(std::memory_order_relaxed);
    s.systemic_errors = systemic_errors.load(std::memory_order_relaxed);
    return s;
  }
};

/**
 * Upload Orchestrator - drains the server upload queue
 *
 * Run loop (one background thread):
 * 1. Stop if the session is no longer authenticated
 * 2. After a failed iteration, wait for the error backoff
 * 3. Pop up to max_concurrent items, fold the status into progress, emit
 * 4. Empty batch and nothing pending or in progress: emit completed, exit
 * 5. Empty batch with work elsewhere: idle backoff; soft stop after
 *    max_idle_polls consecutive empty polls
 * 6. Otherwise run every item as an UploadTask on the scheduler and wait
 *    for the batch to drain before the next pop
 *
 * Loop-level errors emit `failed` and trigger the error backoff; after
 * max_consecutive_errors in a row the loop pauses for error_pause.
 *
 * The status callback is invoked from the loop thread and from scheduler
 * workers, one call at a time. Calling stop() from the callback only
 * signals the loop; the loop then drains and emits the final status.
 * std::exception from the callback is logged; anything else thrown on a
 * worker fails the batch.
 *
 * Usage:
 *   UploadOrchestrator orchestrator(config, queue, attachments, storage, session);
 *   orchestrator.setStatusCallback(on_status);
 *   orchestrator.start();  // Returns immediately
 *   ...
 *   orchestrator.stop();   // Waits for in-flight uploads
 */
class UploadOrchestrator {
public:
  UploadOrchestrator(
    const UploaderConfig& config, std::shared_ptr<IQueueService> queue,
    std::shared_ptr<IAttachmentStore> attachments, std::shared_ptr<IStorageClient> storage,
    std::shared_ptr<ISessionState> session
  );
  ~UploadOrchestrator();

  // Non-copyable, non-movable
  UploadOrchestrator(const UploadOrchestrator&) = delete;
  UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;
  UploadOrchestrator(UploadOrchestrator&&) = delete;
  UploadOrchestrator& operator=(UploadOrchestrator&&) = delete;

  /**
   * Start the run loop in the background.
   * A call while already running is logged and ignored.
   */
  void start();

  /**
   * Stop taking new batches and wait for in-flight uploads.
   *
   * Emits `completed` with the last known total as current and total when
   * the drain succeeds, `failed` when it errors. Idempotent.
   */
  void stop();

  bool isRunning() const;

  /**
   * Replace the status sink. Passing nullptr disables notifications.
   */
  void setStatusCallback(StatusCallback callback);

  /**
   * Current local progress of this run
   */
  ProgressSnapshot progress() const;

  const UploaderStats& stats() const;

  const UploaderConfig& config() const;

private:
  void runLoop();

  // Run one item on a scheduler worker
  void processItem(const UploadQueueItem& item);

  // Called by a task after completeUpload succeeded
  void onUploadSuccess(const UploadQueueItem& item, uint64_t bytes);

  // Emit {status, completed, total}; Completed emits {total, total}
  void emitStatus(UploadStatus status);

  // Wait for submitted jobs; the first job error, if any
  std::exception_ptr drainScheduler();

  // Drain after a stop request and emit Completed or Failed
  void finishStop();

  // Called on the loop thread or a worker
  bool isInternalThread() const;

  // Interruptible sleep; false if stop was requested
  bool waitFor(std::chrono::milliseconds delay);

  void joinLoopThread();

  UploaderConfig config_;
  std::shared_ptr<IQueueService> queue_;
  std::shared_ptr<IAttachmentStore> attachments_;
  std::shared_ptr<IStorageClient> storage_;
  std::shared_ptr<ISessionState> session_;

  std::unique_ptr<ConcurrencyScheduler> scheduler_;
  ProgressTracker tracker_;
  UploaderStats stats_;

  std::thread loop_thread_;
  std::atomic<std::thread::id> loop_thread_id_{};
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;

  // stop() came from the loop or a worker; the loop finishes the stop
  std::atomic<bool> deferred_stop_{false};

  // Job error of the batch a stop interrupted; reported by finishStop()
  std::exception_ptr drain_error_;

  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  // Serializes emissions so observers see non-decreasing progress
  std::mutex emit_mutex_;

  StatusCallback callback_;
  std::mutex callback_mutex_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOAD_ORCHESTRATOR_HPP
