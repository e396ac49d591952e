// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <regex>

#include "uploader_errors.hpp"

#define FERRY_LOG_COMPONENT "http_client"
#include <ferry_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace ferry {
namespace uploader {

namespace {

// Views HttpRequest::payload()
using RequestType = http::request<http::span_body<const uint8_t>>;
using ResponseType = http::response<http::string_body>;

http::verb to_verb(HttpMethod method) {
  switch (method) {
    case HttpMethod::Get:
      return http::verb::get;
    case HttpMethod::Post:
      return http::verb::post;
    case HttpMethod::Put:
      return http::verb::put;
  }
  return http::verb::get;
}

const char* method_name(HttpMethod method) {
  switch (method) {
    case HttpMethod::Get:
      return "GET";
    case HttpMethod::Post:
      return "POST";
    case HttpMethod::Put:
      return "PUT";
  }
  return "?";
}

template <typename Stream>
ResponseType exchange(Stream& stream, const RequestType& req) {
  beast::flat_buffer buffer;
  ResponseType res;
  http::write(stream, req);
  http::read(stream, buffer, res);
  return res;
}

}  // namespace

bool parse_url(const std::string& url, ParsedUrl& out) {
  // Compiled once
  static const std::regex url_regex(R"(^(https?)://([^/:?#]+)(?::(\d+))?(.*)$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return false;
  }

  std::string scheme = match[1].str();
  std::string port_str = match[3].str();
  std::string target = match[4].str();

  if (!target.empty() && target[0] != '/' && target[0] != '?') {
    return false;
  }
  if (target.empty()) {
    target = "/";
  } else if (target[0] == '?') {
    target = "/" + target;
  }

  out.host = match[2].str();
  out.target = target;
  out.use_ssl = (scheme.size() == 5);
  out.explicit_port = !port_str.empty();
  out.port = out.explicit_port ? port_str : (out.use_ssl ? "443" : "80");
  return true;
}

HttpClient::HttpClient()
    : config_() {}

HttpClient::HttpClient(const Config& config)
    : config_(config) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::send(const HttpRequest& request) {
  ParsedUrl url;
  if (!parse_url(request.url, url)) {
    throw UploaderError("Invalid URL: " + request.url);
  }

  RequestType req{to_verb(request.method), url.target, 11};
  req.set(http::field::host, url.explicit_port ? url.host + ":" + url.port : url.host);
  req.set(http::field::user_agent, config_.user_agent);
  if (!request.content_type.empty()) {
    req.set(http::field::content_type, request.content_type);
  }
  for (const auto& header : request.headers) {
    req.set(header.first, header.second);
  }
  const std::vector<uint8_t>& payload = request.payload();
  req.body() = beast::span<const uint8_t>(payload.data(), payload.size());
  if (request.method != HttpMethod::Get || !payload.empty()) {
    req.prepare_payload();
  }

  FERRY_LOG_DEBUG(
    "HTTP request" << ferry::logging::kv("method", method_name(request.method))
                   << ferry::logging::kv("host", url.host)
                   << ferry::logging::kv("bytes", payload.size())
  );

  ResponseType res;
  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);

    if (url.use_ssl) {
      ssl::context ctx(ssl::context::tlsv12_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(config_.verify_ssl ? ssl::verify_peer : ssl::verify_none);

      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

      // SNI is required by most object stores
      if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw TransportError("SNI hostname failed: " + ec.message());
      }

      beast::get_lowest_layer(stream).expires_after(config_.request_timeout);
      auto const results = resolver.resolve(url.host, url.port);
      beast::get_lowest_layer(stream).connect(results);
      stream.handshake(ssl::stream_base::client);

      res = ::ferry::uploader::exchange(stream, req);

      beast::error_code ec;
      stream.shutdown(ec);
      // Peers often close without close_notify
      if (ec && ec != net::ssl::error::stream_truncated && ec != beast::errc::not_connected) {
        FERRY_LOG_DEBUG("SSL shutdown warning" << ferry::logging::kv("error", ec.message()));
      }
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_after(config_.request_timeout);
      auto const results = resolver.resolve(url.host, url.port);
      stream.connect(results);

      res = ::ferry::uploader::exchange(stream, req);

      beast::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
      if (ec && ec != beast::errc::not_connected) {
        FERRY_LOG_DEBUG("Socket shutdown warning" << ferry::logging::kv("error", ec.message()));
      }
    }
  } catch (const boost::system::system_error& e) {
    throw TransportError(
      std::string(method_name(request.method)) + " " + url.host + " failed: " + e.what()
    );
  }

  HttpResponse response;
  response.status_code = static_cast<int>(res.result_int());
  response.body = std::move(res.body());
  return response;
}

}  // namespace uploader
}  // namespace ferry
