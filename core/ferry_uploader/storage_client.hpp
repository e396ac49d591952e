// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_STORAGE_CLIENT_HPP
#define FERRY_STORAGE_CLIENT_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

/**
 * Object store settings
 */
struct StorageConfig {
  std::chrono::seconds put_timeout{300};  // Deadline for one whole PUT
  bool verify_ssl = true;
};

/**
 * PUTs raw bytes to pre-authorized object store URLs.
 * The body is sent unchanged in a single request.
 */
class HttpStorageClient : public IStorageClient {
public:
  explicit HttpStorageClient(std::shared_ptr<IHttpTransport> transport);

  StorageResponse put(
    const std::string& url, const std::vector<uint8_t>& data, const std::string& content_type
  ) override;

private:
  std::shared_ptr<IHttpTransport> transport_;
};

/**
 * Build the transport used for object store PUTs.
 */
std::shared_ptr<IHttpTransport> make_storage_transport(const StorageConfig& config);

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_STORAGE_CLIENT_HPP
