// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "storage_client.hpp"

#include <utility>

#define FERRY_LOG_COMPONENT "storage_client"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace uploader {

HttpStorageClient::HttpStorageClient(std::shared_ptr<IHttpTransport> transport)
    : transport_(std::move(transport)) {}

StorageResponse HttpStorageClient::put(
  const std::string& url, const std::vector<uint8_t>& data, const std::string& content_type
) {
  HttpRequest req;
  req.method = HttpMethod::Put;
  req.url = url;
  req.content_type = content_type.empty() ? "application/octet-stream" : content_type;
  req.borrowed_body = &data;

  HttpResponse res = transport_->send(req);

  FERRY_LOG_DEBUG(
    "PUT finished" << ferry::logging::kv("status", res.status_code)
                   << ferry::logging::kv("bytes", data.size())
  );

  StorageResponse response;
  response.status_code = res.status_code;
  response.body = std::move(res.body);
  return response;
}

std::shared_ptr<IHttpTransport> make_storage_transport(const StorageConfig& config) {
  HttpClient::Config http_config;
  http_config.request_timeout = config.put_timeout;
  http_config.verify_ssl = config.verify_ssl;
  return std::make_shared<HttpClient>(http_config);
}

}  // namespace uploader
}  // namespace ferry
