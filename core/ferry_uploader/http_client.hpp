// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_HTTP_CLIENT_HPP
#define FERRY_HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ferry {
namespace uploader {

enum class HttpMethod { Get, Post, Put };

struct HttpRequest {
  HttpMethod method = HttpMethod::Get;
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string content_type;  // Omitted when empty
  std::vector<uint8_t> body;

  // Caller-owned body sent instead of `body`; must outlive send()
  const std::vector<uint8_t>* borrowed_body = nullptr;

  const std::vector<uint8_t>& payload() const {
    return borrowed_body ? *borrowed_body : body;
  }
};

struct HttpResponse {
  int status_code = 0;
  std::string body;
};

/**
 * Components of an http(s) URL
 */
struct ParsedUrl {
  std::string host;
  std::string port;
  std::string target;  // Path plus query, "/" when absent
  bool use_ssl = false;
  bool explicit_port = false;
};

/**
 * Parse http://host[:port][/path] or https://...
 *
 * @return false if the URL is not a supported http(s) URL
 */
bool parse_url(const std::string& url, ParsedUrl& out);

/**
 * Synchronous request/response transport.
 * Allows mocking the network for testing.
 */
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  /**
   * Send one request and read the complete response.
   * Non-2xx answers are returned, not thrown.
   *
   * @throws TransportError on network-level failure
   * @throws UploaderError if the URL is invalid
   */
  virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * Boost.Beast implementation of IHttpTransport.
 *
 * One connection per request, HTTP/1.1, TLS with SNI for https URLs.
 * The timeout covers the whole exchange. Redirects are not followed.
 * The request body is written from the caller's buffer without a copy.
 */
class HttpClient : public IHttpTransport {
public:
  struct Config {
    std::chrono::seconds request_timeout{30};
    bool verify_ssl = true;
    std::string user_agent = "ferry-uploader/1.0";
  };

  HttpClient();
  explicit HttpClient(const Config& config);
  ~HttpClient() override;

  // Non-copyable
  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResponse send(const HttpRequest& request) override;

  const Config& config() const {
    return config_;
  }

private:
  Config config_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_HTTP_CLIENT_HPP
