// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOADER_ERRORS_HPP
#define FERRY_UPLOADER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ferry {
namespace uploader {

/**
 * Base class for all uploader errors.
 */
class UploaderError : public std::runtime_error {
public:
  explicit UploaderError(const std::string& what)
      : std::runtime_error(what) {}
};

/**
 * Network-level failure: resolve, connect, TLS handshake, read/write, timeout.
 * Always transient.
 */
class TransportError : public UploaderError {
public:
  explicit TransportError(const std::string& what)
      : UploaderError(what) {}
};

/**
 * Non-2xx answer from the queue service.
 */
class HttpStatusError : public UploaderError {
public:
  HttpStatusError(int status_code, const std::string& what)
      : UploaderError(what)
      , status_code_(status_code) {}

  int status_code() const noexcept {
    return status_code_;
  }

  bool is_server_error() const noexcept {
    return status_code_ >= 500 && status_code_ < 600;
  }

private:
  int status_code_;
};

/**
 * Host file store failure: no attachment, no file, unreadable file.
 * Always permanent.
 */
class AttachmentError : public UploaderError {
public:
  explicit AttachmentError(const std::string& what)
      : UploaderError(what) {}
};

/**
 * 2xx answer whose body is not the expected JSON.
 */
class ProtocolError : public UploaderError {
public:
  explicit ProtocolError(const std::string& what)
      : UploaderError(what) {}
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOADER_ERRORS_HPP
