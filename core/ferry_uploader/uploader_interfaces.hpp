// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOADER_INTERFACES_HPP
#define FERRY_UPLOADER_INTERFACES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "uploader_types.hpp"

namespace ferry {
namespace uploader {

/**
 * Interface to the remote upload queue.
 * Implementations throw UploaderError subclasses on failure.
 */
class IQueueService {
public:
  virtual ~IQueueService() = default;

  /**
   * Atomically claim up to max_count pending items.
   * @return Claimed items and the aggregate status after the claim
   */
  virtual PopQueueResult popQueueItems(int max_count) = 0;

  /**
   * Mark an item as uploaded.
   */
  virtual void completeUpload(const UploadQueueItem& item, int page_count) = 0;

  /**
   * Mark an item as permanently failed.
   */
  virtual void markUploadAsFailed(const std::string& item_id, const std::string& file_hash) = 0;

  /**
   * Return an item to the pending pool. The server increments its attempt counter.
   */
  virtual void resetUpload(const std::string& item_id) = 0;

  /**
   * Current aggregate status without claiming anything.
   */
  virtual QueueStatus getQueueStatus() = 0;
};

/**
 * A resolved local attachment file.
 */
struct AttachmentFile {
  std::string path;
  std::string content_type;
};

/**
 * Interface to the host file store.
 */
class IAttachmentStore {
public:
  virtual ~IAttachmentStore() = default;

  /**
   * Resolve an attachment to a local file.
   * @return std::nullopt if the attachment has no local file
   */
  virtual std::optional<AttachmentFile> resolve(
    int64_t library_id, const std::string& attachment_key
  ) = 0;

  /**
   * Read the whole file.
   * @throws AttachmentError if the file cannot be read
   */
  virtual std::vector<uint8_t> readFile(const std::string& path) = 0;

  /**
   * Page count for reporting only; 0 when unknown.
   */
  virtual int pageCount(const AttachmentFile& file, const std::vector<uint8_t>& data) = 0;
};

/**
 * Answer of the object store to a PUT.
 */
struct StorageResponse {
  int status_code = 0;
  std::string body;
};

/**
 * Interface to the object store.
 */
class IStorageClient {
public:
  virtual ~IStorageClient() = default;

  /**
   * PUT raw bytes to a pre-authorized URL.
   * Any HTTP answer is returned; only network failures throw.
   * @throws TransportError on network-level failure
   */
  virtual StorageResponse put(
    const std::string& url, const std::vector<uint8_t>& data, const std::string& content_type
  ) = 0;
};

/**
 * The process-wide session, owned elsewhere.
 */
class ISessionState {
public:
  virtual ~ISessionState() = default;

  virtual bool isAuthenticated() const = 0;
  virtual std::string accessToken() const = 0;

  /**
   * The server rejected the credentials; isAuthenticated() turns false.
   */
  virtual void revoke() = 0;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOADER_INTERFACES_HPP
