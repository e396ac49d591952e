// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "queue_service_client.hpp"

#include <utility>

#include "uploader_errors.hpp"

#define FERRY_LOG_COMPONENT "queue_service"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace uploader {

using nlohmann::json;

namespace {

uint64_t count_field(const json& j, const char* name) {
  auto it = j.find(name);
  if (it == j.end() || !it->is_number()) {
    return 0;
  }
  if (it->is_number_float()) {
    double value = it->get<double>();
    return value > 0 ? static_cast<uint64_t>(value) : 0;
  }
  int64_t value = it->get<int64_t>();
  return value > 0 ? static_cast<uint64_t>(value) : 0;
}

std::string string_field(const json& j, const char* name) {
  auto it = j.find(name);
  if (it == j.end() || it->is_null()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

// Server error bodies look like {"message": "..."}
std::string error_message(const HttpResponse& res) {
  json body = json::parse(res.body, nullptr, false);
  if (body.is_object()) {
    auto it = body.find("message");
    if (it != body.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return res.body.substr(0, 200);
}

}  // namespace

QueueStatus parse_queue_status(const json& j) {
  if (!j.is_object()) {
    throw ProtocolError("queue status is not an object");
  }
  QueueStatus status;
  status.pending = count_field(j, "pending");
  status.in_progress = count_field(j, "in_progress");
  status.completed = count_field(j, "completed");
  status.failed = count_field(j, "failed");
  status.total = count_field(j, "total");
  return status;
}

UploadQueueItem parse_queue_item(const json& j) {
  if (!j.is_object()) {
    throw ProtocolError("queue item is not an object");
  }

  UploadQueueItem item;
  item.id = string_field(j, "id");
  item.upload_url = string_field(j, "upload_url");
  if (item.id.empty() || item.upload_url.empty()) {
    throw ProtocolError("queue item without id or upload_url");
  }

  item.file_id = string_field(j, "file_id");
  item.attachment_key = string_field(j, "attachment_key");
  item.storage_path = string_field(j, "storage_path");
  item.file_hash = string_field(j, "file_hash");

  auto lib = j.find("library_id");
  if (lib != j.end() && lib->is_number_integer()) {
    item.library_id = lib->get<int64_t>();
  }
  item.attempts = static_cast<int>(count_field(j, "attempts"));
  return item;
}

PopQueueResult parse_pop_response(
  const std::string& body, std::vector<RejectedQueueEntry>* rejected
) {
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw ProtocolError("pop response is not a JSON object");
  }

  auto status = j.find("status");
  if (status == j.end()) {
    throw ProtocolError("pop response without status");
  }

  PopQueueResult result;
  result.status = parse_queue_status(*status);

  auto items = j.find("items");
  if (items == j.end() || items->is_null()) {
    return result;
  }
  if (!items->is_array()) {
    throw ProtocolError("pop response items is not an array");
  }

  for (const auto& entry : *items) {
    try {
      result.items.push_back(parse_queue_item(entry));
    } catch (const ProtocolError& e) {
      if (rejected) {
        RejectedQueueEntry bad;
        if (entry.is_object()) {
          bad.id = string_field(entry, "id");
          bad.file_hash = string_field(entry, "file_hash");
        }
        bad.reason = e.what();
        rejected->push_back(std::move(bad));
      }
    }
  }
  return result;
}

HttpQueueService::HttpQueueService(
  const QueueServiceConfig& config, std::shared_ptr<IHttpTransport> transport,
  std::shared_ptr<ISessionState> session
)
    : config_(config)
    , transport_(std::move(transport))
    , session_(std::move(session)) {
  // Strip trailing slash so paths can be appended directly
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
}

HttpResponse HttpQueueService::call(HttpMethod method, const std::string& path, const json* body) {
  HttpRequest req;
  req.method = method;
  req.url = config_.base_url + path;
  req.headers.emplace_back("Authorization", "Bearer " + session_->accessToken());
  req.headers.emplace_back("X-Ferry-Version", config_.client_version);
  req.headers.emplace_back("Accept", "application/json");
  if (body) {
    std::string text = body->dump();
    req.content_type = "application/json";
    req.body.assign(text.begin(), text.end());
  }

  HttpResponse res = transport_->send(req);
  if (res.status_code < 200 || res.status_code >= 300) {
    std::string message = error_message(res);
    FERRY_LOG_DEBUG(
      "Queue service error" << ferry::logging::kv("path", path)
                            << ferry::logging::kv("status", res.status_code)
    );
    if (res.status_code == 401) {
      FERRY_LOG_WARN(
        "Queue service rejected the access token, ending session" << ferry::logging::kv("path", path)
      );
      session_->revoke();
    }
    if (res.status_code >= 500) {
      throw HttpStatusError(
        res.status_code, "Server error: " + std::to_string(res.status_code) + " - " + message
      );
    }
    throw HttpStatusError(
      res.status_code, path + " returned " + std::to_string(res.status_code) + " - " + message
    );
  }
  return res;
}

PopQueueResult HttpQueueService::popQueueItems(int max_count) {
  json body = {{"limit", max_count}};
  HttpResponse res = call(HttpMethod::Post, "/queue/pop", &body);

  std::vector<RejectedQueueEntry> rejected;
  PopQueueResult result = parse_pop_response(res.body, &rejected);

  // Claimed but unusable; without an id the server times the claim out
  for (const auto& entry : rejected) {
    FERRY_LOG_WARN(
      "Discarding malformed queue item" << ferry::logging::kv("queue_id", entry.id)
                                        << ferry::logging::kv("reason", entry.reason)
    );
    if (entry.id.empty()) {
      continue;
    }
    try {
      markUploadAsFailed(entry.id, entry.file_hash);
    } catch (const std::exception& e) {
      FERRY_LOG_ERROR(
        "Failed to mark malformed item as failed" << ferry::logging::kv("queue_id", entry.id)
                                                  << ferry::logging::kv("error", e.what())
      );
    }
  }
  return result;
}

void HttpQueueService::completeUpload(const UploadQueueItem& item, int page_count) {
  json body = {
    {"queue_id", item.id},
    {"file_id", item.file_id},
    {"storage_path", item.storage_path},
    {"page_count", page_count}
  };
  call(HttpMethod::Post, "/queue/complete", &body);
}

void HttpQueueService::markUploadAsFailed(
  const std::string& item_id, const std::string& file_hash
) {
  json body = {{"queue_id", item_id}, {"file_hash", file_hash}};
  call(HttpMethod::Post, "/queue/fail", &body);
}

void HttpQueueService::resetUpload(const std::string& item_id) {
  json body = {{"queue_id", item_id}};
  call(HttpMethod::Post, "/queue/reset", &body);
}

QueueStatus HttpQueueService::getQueueStatus() {
  HttpResponse res = call(HttpMethod::Get, "/queue/status", nullptr);
  json j = json::parse(res.body, nullptr, false);
  if (j.is_discarded()) {
    throw ProtocolError("queue status is not valid JSON");
  }
  return parse_queue_status(j);
}

}  // namespace uploader
}  // namespace ferry
