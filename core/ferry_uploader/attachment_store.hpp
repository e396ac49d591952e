// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_ATTACHMENT_STORE_HPP
#define FERRY_ATTACHMENT_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

struct AttachmentStoreConfig {
  std::string storage_root;  // Holds <attachment_key>/<file>
};

/**
 * MIME type from a file extension (case-insensitive).
 * Unknown extensions map to application/octet-stream.
 */
std::string guess_content_type(const std::string& path);

/**
 * Count page objects (`/Type /Page`, not `/Pages`) in raw PDF bytes.
 * Compressed object streams are not inspected, so the count may be 0.
 */
int count_pdf_pages(const std::vector<uint8_t>& data);

/**
 * Attachment store over the host's on-disk storage directory.
 *
 * An attachment resolves to the first regular file (by name) inside
 * `<storage_root>/<attachment_key>/`. Hidden files are skipped.
 */
class LocalAttachmentStore : public IAttachmentStore {
public:
  explicit LocalAttachmentStore(const AttachmentStoreConfig& config);

  std::optional<AttachmentFile> resolve(
    int64_t library_id, const std::string& attachment_key
  ) override;

  std::vector<uint8_t> readFile(const std::string& path) override;

  int pageCount(const AttachmentFile& file, const std::vector<uint8_t>& data) override;

private:
  AttachmentStoreConfig config_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_ATTACHMENT_STORE_HPP
