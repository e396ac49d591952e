// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_task.hpp"

#include <thread>
#include <utility>

#include "uploader_errors.hpp"

#define FERRY_LOG_COMPONENT "upload_task"
#include <ferry_log_macros.hpp>

using ferry::logging::kv;

namespace ferry {
namespace uploader {

const char* to_string(TaskOutcome outcome) {
  switch (outcome) {
    case TaskOutcome::Completed:
      return "completed";
    case TaskOutcome::Failed:
      return "failed";
    case TaskOutcome::Reset:
      return "reset";
    case TaskOutcome::ReportFailed:
      return "report_failed";
  }
  return "unknown";
}

PutClassification classify_put_outcome(int status_code) {
  if (status_code >= 200 && status_code < 300) {
    return PutClassification::Success;
  }
  if (status_code >= 500 && status_code < 600) {
    return PutClassification::Transient;
  }
  return PutClassification::Permanent;
}

UploadTask::UploadTask(
  UploadQueueItem item, const UploadTaskConfig& config, UploadTaskContext context,
  SuccessCallback on_success
)
    : item_(std::move(item))
    , config_(config)
    , context_(std::move(context))
    , on_success_(std::move(on_success)) {}

void UploadTask::sleepFor(std::chrono::milliseconds delay) {
  if (context_.sleep) {
    context_.sleep(delay);
  } else {
    std::this_thread::sleep_for(delay);
  }
}

TaskOutcome UploadTask::run() {
  FERRY_LOG_SCOPED_ITEM(item_.id, item_.attachment_key);

  AttachmentFile file;
  std::vector<uint8_t> data;
  try {
    auto resolved = context_.attachments.resolve(item_.library_id, item_.attachment_key);
    if (!resolved) {
      FERRY_LOG_WARN("Attachment has no local file" << kv("library_id", item_.library_id));
      return reportFailed("missing_file");
    }
    file = *resolved;
    data = context_.attachments.readFile(file.path);
  } catch (const std::exception& e) {
    FERRY_LOG_WARN("Attachment unreadable" << kv("error", e.what()));
    return reportFailed("unreadable_file");
  }

  int page_count = 0;
  try {
    page_count = context_.attachments.pageCount(file, data);
  } catch (const std::exception& e) {
    FERRY_LOG_DEBUG("Page count unavailable" << kv("error", e.what()));
  }

  PutClassification result = PutClassification::Transient;
  try {
    result = putWithRetry(file, data);
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR("Upload failed with unexpected error" << kv("error", e.what()));
    return reportFailed("unexpected_error");
  }

  switch (result) {
    case PutClassification::Success:
      break;
    case PutClassification::Permanent:
      return reportFailed("permanent_status");
    case PutClassification::Transient:
      // Server-side attempt counter decides between a later retry and giving up
      if (item_.attempts >= config_.max_server_attempts) {
        FERRY_LOG_WARN(
          "Transient failure, server attempts exhausted" << kv("attempts", item_.attempts)
        );
        return reportFailed("attempts_exhausted");
      }
      return reportReset();
  }

  try {
    context_.queue.completeUpload(item_, page_count);
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR("Failed to report completed upload" << kv("error", e.what()));
    return TaskOutcome::ReportFailed;
  }

  FERRY_LOG_INFO(
    "Upload completed" << kv("bytes", data.size()) << kv("pages", page_count)
                       << kv("content_type", file.content_type)
  );

  if (on_success_) {
    on_success_(item_, data.size());
  }
  return TaskOutcome::Completed;
}

PutClassification UploadTask::putWithRetry(
  const AttachmentFile& file, const std::vector<uint8_t>& data
) {
  const int max_attempts = config_.put_max_attempts < 1 ? 1 : config_.put_max_attempts;

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    PutClassification outcome = PutClassification::Transient;
    try {
      StorageResponse res = context_.storage.put(item_.upload_url, data, file.content_type);
      outcome = classify_put_outcome(res.status_code);
      if (outcome != PutClassification::Success) {
        FERRY_LOG_WARN(
          "PUT rejected" << kv("status", res.status_code) << kv("attempt", attempt)
                         << kv("max_attempts", max_attempts)
        );
      }
    } catch (const TransportError& e) {
      FERRY_LOG_WARN(
        "PUT network error" << kv("error", e.what()) << kv("attempt", attempt)
                            << kv("max_attempts", max_attempts)
      );
      outcome = PutClassification::Transient;
    }

    if (outcome != PutClassification::Transient) {
      return outcome;
    }
    if (attempt < max_attempts) {
      sleepFor(config_.put_retry_step * attempt);
    }
  }
  return PutClassification::Transient;
}

TaskOutcome UploadTask::reportFailed(const char* reason) {
  try {
    context_.queue.markUploadAsFailed(item_.id, item_.file_hash);
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR(
      "Failed to mark upload as failed" << kv("reason", reason) << kv("error", e.what())
    );
    return TaskOutcome::ReportFailed;
  }
  FERRY_LOG_INFO("Upload marked as failed" << kv("reason", reason));
  return TaskOutcome::Failed;
}

TaskOutcome UploadTask::reportReset() {
  try {
    context_.queue.resetUpload(item_.id);
  } catch (const std::exception& e) {
    FERRY_LOG_ERROR("Failed to reset upload" << kv("error", e.what()));
    return TaskOutcome::ReportFailed;
  }
  FERRY_LOG_INFO("Upload returned to queue" << kv("attempts", item_.attempts));
  return TaskOutcome::Reset;
}

}  // namespace uploader
}  // namespace ferry
