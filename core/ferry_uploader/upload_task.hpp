// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_TASK_HPP
#define FERRY_UPLOAD_TASK_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

#include "uploader_interfaces.hpp"
#include "uploader_types.hpp"

namespace ferry {
namespace uploader {

/**
 * How one item's life cycle ended
 */
enum class TaskOutcome {
  Completed,    // PUT succeeded and completeUpload was reported
  Failed,       // markUploadAsFailed was reported
  Reset,        // resetUpload was reported, item goes back to the pool
  ReportFailed  // The terminal queue service call itself failed
};

const char* to_string(TaskOutcome outcome);

/**
 * Classification of one PUT attempt
 */
enum class PutClassification {
  Success,    // 2xx
  Permanent,  // Any other non-5xx status; waiting will not help
  Transient   // 5xx or a transport failure
};

/**
 * Classify an object store status code.
 */
PutClassification classify_put_outcome(int status_code);

struct UploadTaskConfig {
  int put_max_attempts = 3;                       // PUT attempts inside one task
  std::chrono::milliseconds put_retry_step{2000};  // Wait step * attempt between attempts
  int max_server_attempts = 3;                    // attempts >= this fails instead of reset
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

/**
 * Collaborators shared by every task of one run
 */
struct UploadTaskContext {
  IQueueService& queue;
  IAttachmentStore& attachments;
  IStorageClient& storage;
  SleepFunction sleep;  // Defaults to std::this_thread::sleep_for when empty
};

/**
 * Called after completeUpload succeeded, before run() returns.
 */
using SuccessCallback = std::function<void(const UploadQueueItem& item, uint64_t bytes)>;

/**
 * Uploads one queue item and reports exactly one terminal outcome:
 *
 * - Success: completeUpload(item, page_count), then the success callback
 * - Permanent failure (no local file, unreadable file, non-5xx error status,
 *   or transient failure with server attempts exhausted): markUploadAsFailed
 * - Transient failure with server attempts remaining: resetUpload
 *
 * run() never throws. Failures of the terminal call are logged and
 * reported as TaskOutcome::ReportFailed.
 */
class UploadTask {
public:
  UploadTask(
    UploadQueueItem item, const UploadTaskConfig& config, UploadTaskContext context,
    SuccessCallback on_success = nullptr
  );

  TaskOutcome run();

  const UploadQueueItem& item() const {
    return item_;
  }

private:
  PutClassification putWithRetry(const AttachmentFile& file, const std::vector<uint8_t>& data);
  TaskOutcome reportFailed(const char* reason);
  TaskOutcome reportReset();
  void sleepFor(std::chrono::milliseconds delay);

  UploadQueueItem item_;
  UploadTaskConfig config_;
  UploadTaskContext context_;
  SuccessCallback on_success_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOAD_TASK_HPP
