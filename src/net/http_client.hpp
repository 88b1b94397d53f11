#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mcpterm::net {

// Parsed http(s) URL
struct ParsedUrl {
  std::string scheme;  // "http" or "https"
  std::string host;
  std::string port;   // Empty when not given explicitly
  std::string path;   // Always starts with '/'
  std::string query;  // Includes the leading '?', or empty

  static std::optional<ParsedUrl> parse(const std::string &url);

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const {
    if (!port.empty()) return port;
    return is_https() ? "443" : "80";
  }

  // Request target: path plus query
  std::string target() const {
    return path + query;
  }

  // Host header value
  std::string authority() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return port.empty() ? h : h + ":" + port;
  }
};

struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // Names lower-cased
  std::string body;
  std::string error;  // Set on network failure, timeout or cancellation

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }

  // Case-insensitive header lookup, empty when absent
  std::string header(const std::string &name) const;
};

// Asynchronous HTTP/1.1 client driven by the caller's io_context.
// One request at a time per client; the returned future resolves once the
// io_context has run the request to completion.
class HttpClient {
 public:
  // Called for each decoded body chunk once status and headers are known.
  // Returning false abandons the rest of the body.
  using ChunkHandler = std::function<bool(const HttpResponse &head, std::string_view chunk)>;

  explicit HttpClient(asio::io_context &io_ctx);
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  // Buffers the whole body into HttpResponse::body
  std::future<HttpResponse> request(const std::string &url, const HttpOptions &opts);

  // Streams the body through on_chunk; HttpResponse::body stays empty
  std::future<HttpResponse> request_stream(const std::string &url, const HttpOptions &opts, ChunkHandler on_chunk);

  // Abort the in-flight request; its future resolves with an error
  void cancel();

 private:
  class Connection;

  asio::ssl::context &ssl_context();

  asio::io_context &io_ctx_;
  std::unique_ptr<asio::ssl::context> ssl_ctx_;
  std::mutex active_mutex_;
  std::weak_ptr<Connection> active_;
};

}  // namespace mcpterm::net
