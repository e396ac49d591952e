// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_QUEUE_SERVICE_CLIENT_HPP
#define FERRY_QUEUE_SERVICE_CLIENT_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

/**
 * Queue service connection settings
 */
struct QueueServiceConfig {
  std::string base_url;        // e.g. https://api.example.com/v1
  std::string access_token;    // Seeds the session; requests read ISessionState
  std::string client_version = "1.0.0";
  std::chrono::seconds request_timeout{30};
};

/**
 * Parse a queue status object. Missing or negative counts read as 0.
 * @throws ProtocolError if `j` is not an object
 */
QueueStatus parse_queue_status(const nlohmann::json& j);

/**
 * Parse one queue item.
 * @throws ProtocolError if `id` or `upload_url` is missing
 */
UploadQueueItem parse_queue_item(const nlohmann::json& j);

/**
 * An entry of a pop response that is not a usable item.
 * `id` and `file_hash` are empty when the entry does not carry them.
 */
struct RejectedQueueEntry {
  std::string id;
  std::string file_hash;
  std::string reason;
};

/**
 * Parse the body of POST /queue/pop: {"items": [...], "status": {...}}
 *
 * Entries are parsed one by one. Malformed entries go to `rejected` (when
 * given) and the remaining items are returned.
 *
 * @throws ProtocolError if the body, `items` or `status` is malformed
 */
PopQueueResult parse_pop_response(
  const std::string& body, std::vector<RejectedQueueEntry>* rejected = nullptr
);

/**
 * JSON-over-HTTP implementation of IQueueService.
 *
 * Endpoints (relative to base_url):
 *   POST /queue/pop       {limit}
 *   POST /queue/complete  {queue_id, file_id, storage_path, page_count}
 *   POST /queue/fail      {queue_id, file_hash}
 *   POST /queue/reset     {queue_id}
 *   GET  /queue/status
 *
 * Every request carries `Authorization: Bearer <token>` from the session
 * and `X-Ferry-Version`. A 401 answer revokes the session.
 *
 * Malformed entries of a claimed batch are logged and, when they carry an
 * id, marked failed so the server does not keep them in progress.
 */
class HttpQueueService : public IQueueService {
public:
  HttpQueueService(
    const QueueServiceConfig& config, std::shared_ptr<IHttpTransport> transport,
    std::shared_ptr<ISessionState> session
  );

  PopQueueResult popQueueItems(int max_count) override;
  void completeUpload(const UploadQueueItem& item, int page_count) override;
  void markUploadAsFailed(const std::string& item_id, const std::string& file_hash) override;
  void resetUpload(const std::string& item_id) override;
  QueueStatus getQueueStatus() override;

private:
  HttpResponse call(HttpMethod method, const std::string& path, const nlohmann::json* body);

  QueueServiceConfig config_;
  std::shared_ptr<IHttpTransport> transport_;
  std::shared_ptr<ISessionState> session_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_QUEUE_SERVICE_CLIENT_HPP
