// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "attachment_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>

#include "uploader_errors.hpp"

#define FERRY_LOG_COMPONENT "attachment_store"
#include <ferry_log_macros.hpp>

namespace fs = std::filesystem;

namespace ferry {
namespace uploader {

namespace {

bool is_pdf_whitespace(uint8_t c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\0';
}

// Name characters end at whitespace or a delimiter
bool is_pdf_delimiter(uint8_t c) {
  return is_pdf_whitespace(c) || std::strchr("()<>[]{}/%", c) != nullptr;
}

bool valid_key(const std::string& key) {
  return !key.empty() && key != "." && key != ".." && key.find('/') == std::string::npos &&
         key.find('\\') == std::string::npos;
}

}  // namespace

std::string guess_content_type(const std::string& path) {
  static const std::map<std::string, std::string> types = {
    {".pdf", "application/pdf"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".epub", "application/epub+zip"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".txt", "text/plain"},
  };

  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return std::tolower(c);
  });

  auto it = types.find(ext);
  return it == types.end() ? "application/octet-stream" : it->second;
}

int count_pdf_pages(const std::vector<uint8_t>& data) {
  static const char kType[] = "/Type";
  static const char kPage[] = "/Page";
  const size_t type_len = sizeof(kType) - 1;
  const size_t page_len = sizeof(kPage) - 1;

  int pages = 0;
  auto it = data.begin();
  while (true) {
    it = std::search(it, data.end(), kType, kType + type_len);
    if (it == data.end()) {
      break;
    }
    it += type_len;

    auto value = it;
    while (value != data.end() && is_pdf_whitespace(*value)) {
      ++value;
    }
    if (static_cast<size_t>(data.end() - value) < page_len ||
        !std::equal(kPage, kPage + page_len, value)) {
      continue;
    }
    value += page_len;
    // "/Pages" is the page tree node, not a page
    if (value == data.end() || is_pdf_delimiter(*value)) {
      ++pages;
    }
    it = value;
  }
  return pages;
}

LocalAttachmentStore::LocalAttachmentStore(const AttachmentStoreConfig& config)
    : config_(config) {}

std::optional<AttachmentFile> LocalAttachmentStore::resolve(
  int64_t library_id, const std::string& attachment_key
) {
  if (!valid_key(attachment_key)) {
    FERRY_LOG_WARN("Invalid attachment key" << ferry::logging::kv("key", attachment_key));
    return std::nullopt;
  }

  fs::path dir = fs::path(config_.storage_root) / attachment_key;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    FERRY_LOG_DEBUG(
      "No storage directory for attachment" << ferry::logging::kv("library_id", library_id)
                                            << ferry::logging::kv("path", dir.string())
    );
    return std::nullopt;
  }

  std::vector<fs::path> candidates;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.empty() || name[0] == '.') {
      continue;
    }
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      candidates.push_back(it->path());
    }
  }
  if (ec) {
    FERRY_LOG_WARN(
      "Cannot list attachment directory" << ferry::logging::kv("path", dir.string())
                                         << ferry::logging::kv("error", ec.message())
    );
    return std::nullopt;
  }
  if (candidates.empty()) {
    return std::nullopt;
  }

  std::sort(candidates.begin(), candidates.end());

  AttachmentFile file;
  file.path = candidates.front().string();
  file.content_type = guess_content_type(file.path);
  return file;
}

std::vector<uint8_t> LocalAttachmentStore::readFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    throw AttachmentError("Cannot open attachment file: " + path);
  }

  std::streamsize size = in.tellg();
  if (size < 0) {
    throw AttachmentError("Cannot determine size of attachment file: " + path);
  }
  in.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<size_t>(size));
  if (size > 0 && !in.read(reinterpret_cast<char*>(data.data()), size)) {
    throw AttachmentError("Failed to read attachment file: " + path);
  }
  return data;
}

int LocalAttachmentStore::pageCount(const AttachmentFile& file, const std::vector<uint8_t>& data) {
  if (file.content_type != "application/pdf") {
    return 0;
  }
  return count_pdf_pages(data);
}

}  // namespace uploader
}  // namespace ferry
