// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_orchestrator.hpp"

#include <string>
#include <utility>

#include "uploader_errors.hpp"

#define FERRY_LOG_COMPONENT "upload_orchestrator"
#include <ferry_log_macros.hpp>

using ferry::logging::kv;

namespace ferry {
namespace uploader {

namespace {

std::string describe_error(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

}  // namespace

UploadOrchestrator::UploadOrchestrator(
  const UploaderConfig& config, std::shared_ptr<IQueueService> queue,
  std::shared_ptr<IAttachmentStore> attachments, std::shared_ptr<IStorageClient> storage,
  std::shared_ptr<ISessionState> session
)
    : config_(config)
    , queue_(std::move(queue))
    , attachments_(std::move(attachments))
    , storage_(std::move(storage))
    , session_(std::move(session)) {
  if (config_.max_concurrent < 1) {
    config_.max_concurrent = 1;
  }
  // Workers outlive individual runs
  scheduler_ = std::make_unique<ConcurrencyScheduler>(static_cast<size_t>(config_.max_concurrent));
}

UploadOrchestrator::~UploadOrchestrator() {
  stop();
  joinLoopThread();
}

void UploadOrchestrator::start() {
  if (isInternalThread()) {
    FERRY_LOG_WARN("start() called from the upload loop or a worker, ignored");
    return;
  }

  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    FERRY_LOG_INFO("Upload orchestrator already running, start ignored");
    return;
  }

  // A previous run may have ended on its own
  joinLoopThread();

  tracker_.reset();
  deferred_stop_ = false;
  drain_error_ = nullptr;

  running_ = true;
  loop_thread_ = std::thread(&UploadOrchestrator::runLoop, this);

  FERRY_LOG_INFO("Upload orchestrator started" << kv("max_concurrent", config_.max_concurrent));
}

void UploadOrchestrator::stop() {
  // Joining from inside the run would wait on ourselves; the loop finishes the stop
  if (isInternalThread()) {
    if (running_.exchange(false)) {
      deferred_stop_ = true;
      FERRY_LOG_INFO("Stop requested from the upload loop, finishing after the current batch");
    }
    {
      std::lock_guard<std::mutex> wait_lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    return;
  }

  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  bool was_running = running_.exchange(false);
  {
    std::lock_guard<std::mutex> wait_lock(wait_mutex_);
  }
  wait_cv_.notify_all();
  joinLoopThread();

  if (!was_running) {
    return;
  }
  finishStop();
}

void UploadOrchestrator::finishStop() {
  FERRY_LOG_INFO("Stopping upload orchestrator, waiting for in-flight uploads");
  std::exception_ptr error = drain_error_;
  drain_error_ = nullptr;
  if (!error) {
    error = drainScheduler();
  }

  if (error) {
    FERRY_LOG_ERROR("Error while draining uploads" << kv("error", describe_error(error)));
    emitStatus(UploadStatus::Failed);
  } else {
    emitStatus(UploadStatus::Completed);
  }
  FERRY_LOG_INFO("Upload orchestrator stopped");
}

std::exception_ptr UploadOrchestrator::drainScheduler() {
  try {
    scheduler_->waitIdle();
  } catch (...) {
    return std::current_exception();
  }
  return nullptr;
}

bool UploadOrchestrator::isInternalThread() const {
  if (std::this_thread::get_id() == loop_thread_id_.load()) {
    return true;
  }
  return scheduler_->isWorkerThread();
}

bool UploadOrchestrator::isRunning() const {
  return running_.load();
}

void UploadOrchestrator::setStatusCallback(StatusCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  callback_ = std::move(callback);
}

ProgressSnapshot UploadOrchestrator::progress() const {
  return tracker_.snapshot();
}

const UploaderStats& UploadOrchestrator::stats() const {
  return stats_;
}

const UploaderConfig& UploadOrchestrator::config() const {
  return config_;
}

void UploadOrchestrator::joinLoopThread() {
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  loop_thread_id_ = std::thread::id();
}

bool UploadOrchestrator::waitFor(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  wait_cv_.wait_for(lock, delay, [this] {
    return !running_.load();
  });
  return running_.load();
}

void UploadOrchestrator::emitStatus(UploadStatus status) {
  std::lock_guard<std::mutex> emit_lock(emit_mutex_);

  // Read under the emit lock so emissions follow tracker order
  ProgressSnapshot snap = tracker_.snapshot();
  UploadProgressInfo info;
  info.status = status;
  info.current = status == UploadStatus::Completed ? snap.total : snap.completed;
  info.total = snap.total;

  StatusCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = callback_;
  }
  if (!callback) {
    return;
  }

  try {
    callback(info);
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR(
      "Status callback threw" << kv("status", to_string(status)) << kv("error", e.what())
    );
  }
}

void UploadOrchestrator::onUploadSuccess(const UploadQueueItem& item, uint64_t bytes) {
  stats_.bytes_uploaded += bytes;
  FERRY_LOG_DEBUG("Local completion" << kv("queue_id", item.id));
  tracker_.bumpCompleted();
  emitStatus(UploadStatus::InProgress);
}

void UploadOrchestrator::processItem(const UploadQueueItem& item) {
  UploadTaskContext context{*queue_, *attachments_, *storage_, nullptr};
  UploadTask task(item, config_.task, context, [this](const UploadQueueItem& done, uint64_t bytes) {
    onUploadSuccess(done, bytes);
  });

  switch (task.run()) {
    case TaskOutcome::Completed:
      ++stats_.tasks_completed;
      break;
    case TaskOutcome::Failed:
      ++stats_.tasks_failed;
      break;
    case TaskOutcome::Reset:
      ++stats_.tasks_reset;
      break;
    case TaskOutcome::ReportFailed:
      ++stats_.report_failures;
      break;
  }
}

void UploadOrchestrator::runLoop() {
  loop_thread_id_ = std::this_thread::get_id();

  BackoffController backoff(config_.idle_backoff, config_.error_backoff);
  int idle_polls = 0;
  int consecutive_errors = 0;
  bool last_failed = false;

  while (running_.load()) {
    if (!session_->isAuthenticated()) {
      FERRY_LOG_WARN("Session is not authenticated, upload loop stopping");
      running_ = false;
      break;
    }

    try {
      if (last_failed) {
        auto delay = backoff.nextError();
        FERRY_LOG_DEBUG("Error backoff" << kv("delay_ms", delay.count()));
        if (!waitFor(delay)) {
          break;
        }
      }

      PopQueueResult batch = queue_->popQueueItems(config_.max_concurrent);
      ++stats_.polls;
      last_failed = false;
      consecutive_errors = 0;
      backoff.resetError();

      const QueueStatus& status = batch.status;
      FERRY_LOG_INFO(
        "Popped items" << kv("count", batch.items.size()) << kv("pending", status.pending)
                       << kv("in_progress", status.in_progress) << kv("completed", status.completed)
                       << kv("failed", status.failed) << kv("total", status.total)
      );

      tracker_.fold(status);
      emitStatus(UploadStatus::InProgress);

      if (batch.items.empty()) {
        if (status.pending == 0 && status.in_progress == 0) {
          backoff.resetIdle();
          FERRY_LOG_INFO("Upload queue is empty, run complete");
          // A concurrent stop() that already cleared running_ reports instead
          if (running_.exchange(false)) {
            emitStatus(UploadStatus::Completed);
          }
          break;
        }

        ++idle_polls;
        if (idle_polls >= config_.max_idle_polls) {
          FERRY_LOG_INFO(
            "No items claimed after repeated polls, pausing uploads" << kv("polls", idle_polls)
          );
          if (running_.exchange(false)) {
            emitStatus(UploadStatus::Idle);
          }
          break;
        }

        auto delay = backoff.nextIdle();
        FERRY_LOG_INFO_THROTTLE(
          30.0, "Queue busy elsewhere, backing off" << kv("delay_ms", delay.count())
                                                    << kv("idle_polls", idle_polls)
        );
        if (!waitFor(delay)) {
          break;
        }
        continue;
      }

      idle_polls = 0;
      backoff.reset();

      for (const auto& item : batch.items) {
        if (!scheduler_->submit([this, item] {
              processItem(item);
            })) {
          throw UploaderError("upload scheduler is shut down");
        }
      }

      // Next pop only after the whole batch drained
      if (std::exception_ptr error = drainScheduler()) {
        if (!running_.load()) {
          drain_error_ = error;
          break;
        }
        throw UploaderError("upload job failed: " + describe_error(error));
      }
    } catch (const std::exception& e) {
      // Rejected credentials end the run without a failure report
      if (!session_->isAuthenticated()) {
        FERRY_LOG_WARN("Session ended during upload loop" << kv("error", e.what()));
        running_ = false;
        break;
      }
      ++stats_.systemic_errors;
      ++consecutive_errors;
      last_failed = true;
      FERRY_LOG_ERROR_THROTTLE(
        5.0, "Upload loop error" << kv("error", e.what())
                                 << kv("consecutive_errors", consecutive_errors)
      );
      emitStatus(UploadStatus::Failed);

      if (consecutive_errors >= config_.max_consecutive_errors) {
        FERRY_LOG_WARN(
          "Too many consecutive errors, pausing" << kv("pause_ms", config_.error_pause.count())
        );
        if (!waitFor(config_.error_pause)) {
          break;
        }
        consecutive_errors = 0;
        last_failed = false;
        backoff.resetError();
      }
    }
  }

  running_ = false;
  if (deferred_stop_.exchange(false)) {
    finishStop();
  }
  FERRY_LOG_INFO("Upload loop finished");
}

}  // namespace uploader
}  // namespace ferry
