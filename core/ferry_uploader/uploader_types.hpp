// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOADER_TYPES_HPP
#define FERRY_UPLOADER_TYPES_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ferry {
namespace uploader {

/**
 * One unit of upload work handed out by the queue service.
 */
struct UploadQueueItem {
  std::string id;              // Queue-assigned id, used for complete/fail/reset
  std::string file_id;         // Echoed back on completion
  int64_t library_id = 0;      // Host library the attachment belongs to
  std::string attachment_key;  // Host attachment key
  std::string upload_url;      // Pre-authorized PUT destination
  std::string storage_path;    // Object path the URL writes to
  std::string file_hash;       // Recorded on failure
  int attempts = 0;            // Server-side attempt counter (authoritative)
};

/**
 * Aggregate queue snapshot. Values are not monotonic across snapshots.
 */
struct QueueStatus {
  uint64_t pending = 0;
  uint64_t in_progress = 0;
  uint64_t completed = 0;
  uint64_t failed = 0;
  uint64_t total = 0;
};

/**
 * Result of a pop: the claimed items plus the status after the claim.
 */
struct PopQueueResult {
  std::vector<UploadQueueItem> items;
  QueueStatus status;
};

enum class UploadStatus { Idle, InProgress, Completed, Failed };

inline const char* to_string(UploadStatus status) {
  switch (status) {
    case UploadStatus::Idle:
      return "idle";
    case UploadStatus::InProgress:
      return "in_progress";
    case UploadStatus::Completed:
      return "completed";
    case UploadStatus::Failed:
      return "failed";
  }
  return "unknown";
}

/**
 * Progress event delivered to the status callback.
 */
struct UploadProgressInfo {
  UploadStatus status = UploadStatus::Idle;
  uint64_t current = 0;
  uint64_t total = 0;
};

using StatusCallback = std::function<void(const UploadProgressInfo&)>;

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOADER_TYPES_HPP
