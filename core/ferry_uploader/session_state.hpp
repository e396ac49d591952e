// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_SESSION_STATE_HPP
#define FERRY_SESSION_STATE_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <utility>

#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

/**
 * Session backed by a configured access token.
 * Authenticated while the token is non-empty and not revoked.
 */
class StaticSessionState : public ISessionState {
public:
  explicit StaticSessionState(std::string token)
      : token_(std::move(token))
      , revoked_(false) {}

  bool isAuthenticated() const override {
    if (revoked_.load()) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return !token_.empty();
  }

  std::string accessToken() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
  }

  void setToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    token_ = token;
    revoked_ = false;
  }

  /**
   * End the session until the next setToken(); the upload loop stops at
   * its next iteration.
   */
  void revoke() override {
    revoked_ = true;
  }

private:
  mutable std::mutex mutex_;
  std::string token_;
  std::atomic<bool> revoked_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_SESSION_STATE_HPP
