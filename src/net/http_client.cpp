#include "net/http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

#include "core/version.hpp"

namespace mcpterm::net {

using asio::ip::tcp;

namespace {

constexpr size_t kMaxHeaderBytes = 64 * 1024;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim(std::string_view s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return std::string(s.substr(begin, end - begin));
}

bool all_digits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

}  // namespace

// ============================================================
// ParsedUrl
// ============================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return std::nullopt;

  ParsedUrl out;
  out.scheme = to_lower(url.substr(0, scheme_end));
  if (out.scheme != "http" && out.scheme != "https") return std::nullopt;

  size_t authority_start = scheme_end + 3;
  size_t authority_end = url.find_first_of("/?#", authority_start);
  std::string authority =
      url.substr(authority_start, authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);

  // Drop userinfo
  if (auto at = authority.rfind('@'); at != std::string::npos) {
    authority = authority.substr(at + 1);
  }
  if (authority.empty()) return std::nullopt;

  if (authority.front() == '[') {
    // IPv6 literal: [::1]:8080
    auto close = authority.find(']');
    if (close == std::string::npos) return std::nullopt;
    out.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') return std::nullopt;
      out.port = authority.substr(close + 2);
    }
  } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
  } else {
    out.host = authority;
  }

  if (out.host.empty()) return std::nullopt;
  if (!out.port.empty() && !all_digits(out.port)) return std::nullopt;

  std::string remainder = authority_end == std::string::npos ? "" : url.substr(authority_end);
  if (auto hash = remainder.find('#'); hash != std::string::npos) {
    remainder.erase(hash);
  }
  if (auto q = remainder.find('?'); q != std::string::npos) {
    out.path = remainder.substr(0, q);
    out.query = remainder.substr(q);
  } else {
    out.path = remainder;
  }
  if (out.path.empty()) out.path = "/";

  return out;
}

// ============================================================
// HttpResponse
// ============================================================

std::string HttpResponse::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  if (it != headers.end()) return it->second;
  return "";
}

// ============================================================
// HttpClient::Connection: one request/response exchange
// ============================================================

class HttpClient::Connection : public std::enable_shared_from_this<HttpClient::Connection> {
 public:
  Connection(asio::io_context &io_ctx, asio::ssl::context *ssl_ctx, ParsedUrl url, HttpOptions opts, ChunkHandler on_chunk,
             std::promise<HttpResponse> promise)
      : resolver_(io_ctx),
        socket_(io_ctx),
        timer_(io_ctx),
        url_(std::move(url)),
        opts_(std::move(opts)),
        on_chunk_(std::move(on_chunk)),
        promise_(std::move(promise)) {
    if (ssl_ctx) {
      tls_ = std::make_unique<asio::ssl::stream<tcp::socket &>>(socket_, *ssl_ctx);
    }
  }

  void start() {
    auto self = shared_from_this();

    timer_.expires_after(opts_.timeout);
    timer_.async_wait([self](std::error_code ec) {
      if (!ec) {
        self->fail("Request timed out after " + std::to_string(self->opts_.timeout.count()) + " ms");
      }
    });

    resolver_.async_resolve(url_.host, url_.port_or_default(), [self](std::error_code ec, tcp::resolver::results_type results) {
      if (self->done_) return;
      if (ec) {
        self->fail("Failed to resolve " + self->url_.host + ": " + ec.message());
        return;
      }
      self->connect(results);
    });
  }

  void cancel() {
    fail("Request cancelled");
  }

 private:
  enum class BodyMode { Length, Chunked, UntilClose };

  void connect(const tcp::resolver::results_type &results) {
    auto self = shared_from_this();
    asio::async_connect(socket_, results, [self](std::error_code ec, const tcp::endpoint &) {
      if (self->done_) return;
      if (ec) {
        self->fail("Failed to connect to " + self->url_.authority() + ": " + ec.message());
        return;
      }
      if (self->tls_) {
        self->handshake();
      } else {
        self->write_request();
      }
    });
  }

  void handshake() {
    auto self = shared_from_this();

    // SNI
    SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str());
    tls_->set_verify_mode(asio::ssl::verify_peer);
    tls_->set_verify_callback(asio::ssl::host_name_verification(url_.host));

    tls_->async_handshake(asio::ssl::stream_base::client, [self](std::error_code ec) {
      if (self->done_) return;
      if (ec) {
        self->fail("TLS handshake with " + self->url_.host + " failed: " + ec.message());
        return;
      }
      self->write_request();
    });
  }

  void write_request() {
    request_ = opts_.method + " " + url_.target() + " HTTP/1.1\r\n";
    request_ += "Host: " + url_.authority() + "\r\n";

    bool has_user_agent = false;
    for (const auto &[name, value] : opts_.headers) {
      if (to_lower(name) == "user-agent") has_user_agent = true;
      request_ += name + ": " + value + "\r\n";
    }
    if (!has_user_agent) {
      request_ += std::string("User-Agent: ") + kClientName + "/" + kClientVersion + "\r\n";
    }
    if (!opts_.body.empty() || opts_.method == "POST" || opts_.method == "PUT" || opts_.method == "PATCH") {
      request_ += "Content-Length: " + std::to_string(opts_.body.size()) + "\r\n";
    }
    request_ += "Connection: close\r\n\r\n";
    request_ += opts_.body;

    auto self = shared_from_this();
    auto on_written = [self](std::error_code ec, size_t) {
      if (self->done_) return;
      if (ec) {
        self->fail("Failed to send request: " + ec.message());
        return;
      }
      self->read_more();
    };

    if (tls_) {
      asio::async_write(*tls_, asio::buffer(request_), on_written);
    } else {
      asio::async_write(socket_, asio::buffer(request_), on_written);
    }
  }

  void read_more() {
    auto self = shared_from_this();
    auto on_read = [self](std::error_code ec, size_t n) {
      if (self->done_) return;
      if (n > 0) {
        self->buffer_.append(self->read_buf_.data(), n);
        if (!self->process()) return;
      }
      if (ec) {
        if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
          self->on_eof();
        } else {
          self->fail("Failed to read response: " + ec.message());
        }
        return;
      }
      self->read_more();
    };

    if (tls_) {
      tls_->async_read_some(asio::buffer(read_buf_), on_read);
    } else {
      socket_.async_read_some(asio::buffer(read_buf_), on_read);
    }
  }

  // Returns false once the exchange has completed
  bool process() {
    if (!headers_done_) {
      auto end = buffer_.find("\r\n\r\n");
      if (end == std::string::npos) {
        if (buffer_.size() > kMaxHeaderBytes) {
          fail("Response headers too large");
          return false;
        }
        return true;
      }
      if (!parse_head(std::string_view(buffer_).substr(0, end))) {
        fail("Malformed HTTP response header");
        return false;
      }
      buffer_.erase(0, end + 4);
      headers_done_ = true;

      bool no_body = response_.status_code == 204 || response_.status_code == 304 || opts_.method == "HEAD";
      if (no_body || (mode_ == BodyMode::Length && remaining_ == 0)) {
        complete();
        return false;
      }
    }
    return consume_body();
  }

  bool parse_head(std::string_view head) {
    size_t line_end = head.find("\r\n");
    std::string_view status_line = head.substr(0, line_end);
    if (status_line.substr(0, 5) != "HTTP/") return false;

    auto space = status_line.find(' ');
    if (space == std::string_view::npos || space + 4 > status_line.size()) return false;
    std::string code(status_line.substr(space + 1, 3));
    if (!all_digits(code)) return false;
    response_.status_code = std::stoi(code);

    while (line_end != std::string_view::npos) {
      size_t next = head.find("\r\n", line_end + 2);
      std::string_view line = head.substr(line_end + 2, next == std::string_view::npos ? std::string_view::npos : next - line_end - 2);
      line_end = next;

      auto colon = line.find(':');
      if (colon == std::string_view::npos) continue;
      std::string name = to_lower(trim(line.substr(0, colon)));
      std::string value = trim(line.substr(colon + 1));
      auto [it, inserted] = response_.headers.emplace(name, value);
      if (!inserted) it->second += ", " + value;
    }

    if (to_lower(response_.header("transfer-encoding")).find("chunked") != std::string::npos) {
      mode_ = BodyMode::Chunked;
    } else if (auto length = response_.header("content-length"); !length.empty()) {
      if (!all_digits(length)) return false;
      mode_ = BodyMode::Length;
      remaining_ = std::stoull(length);
    } else {
      mode_ = BodyMode::UntilClose;
    }
    return true;
  }

  bool consume_body() {
    switch (mode_) {
      case BodyMode::Length: {
        size_t n = std::min(remaining_, buffer_.size());
        if (n > 0) {
          std::string chunk = buffer_.substr(0, n);
          buffer_.erase(0, n);
          remaining_ -= n;
          if (!emit(chunk)) return false;
        }
        if (remaining_ == 0) {
          complete();
          return false;
        }
        return true;
      }

      case BodyMode::UntilClose: {
        if (!buffer_.empty()) {
          std::string chunk;
          chunk.swap(buffer_);
          if (!emit(chunk)) return false;
        }
        return true;
      }

      case BodyMode::Chunked:
        while (true) {
          if (!in_chunk_) {
            auto eol = buffer_.find("\r\n");
            if (eol == std::string::npos) return true;

            std::string size_line = buffer_.substr(0, eol);
            if (auto ext = size_line.find(';'); ext != std::string::npos) size_line.erase(ext);
            size_line = trim(size_line);
            size_t size = 0;
            try {
              size = std::stoull(size_line, nullptr, 16);
            } catch (const std::exception &) {
              fail("Malformed chunk size: " + size_line);
              return false;
            }
            buffer_.erase(0, eol + 2);

            if (size == 0) {
              complete();
              return false;
            }
            chunk_remaining_ = size;
            in_chunk_ = true;
          }

          if (chunk_remaining_ > 0) {
            size_t n = std::min(chunk_remaining_, buffer_.size());
            if (n == 0) return true;
            std::string chunk = buffer_.substr(0, n);
            buffer_.erase(0, n);
            chunk_remaining_ -= n;
            if (!emit(chunk)) return false;
            if (chunk_remaining_ > 0) return true;
          }

          // CRLF after chunk data
          if (buffer_.size() < 2) return true;
          buffer_.erase(0, 2);
          in_chunk_ = false;
        }
    }
    return true;
  }

  bool emit(const std::string &chunk) {
    if (!on_chunk_) {
      response_.body += chunk;
      return true;
    }
    if (!on_chunk_(response_, chunk)) {
      spdlog::debug("[HTTP] Stream from {} abandoned by consumer", url_.authority());
      complete();
      return false;
    }
    return true;
  }

  void on_eof() {
    if (!headers_done_) {
      fail("Connection closed before a response was received");
    } else if (mode_ == BodyMode::UntilClose) {
      complete();
    } else {
      fail("Connection closed in the middle of the response body");
    }
  }

  void fail(const std::string &message) {
    if (done_) return;
    spdlog::debug("[HTTP] {} {}: {}", opts_.method, url_.authority(), message);
    response_.error = message;
    complete();
  }

  void complete() {
    if (done_) return;
    done_ = true;

    std::error_code ignored;
    timer_.cancel();
    resolver_.cancel();
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    promise_.set_value(std::move(response_));
  }

  tcp::resolver resolver_;
  tcp::socket socket_;
  std::unique_ptr<asio::ssl::stream<tcp::socket &>> tls_;
  asio::steady_timer timer_;

  ParsedUrl url_;
  HttpOptions opts_;
  ChunkHandler on_chunk_;
  std::promise<HttpResponse> promise_;

  std::string request_;
  std::array<char, 8192> read_buf_{};
  std::string buffer_;

  HttpResponse response_;
  bool done_ = false;
  bool headers_done_ = false;
  BodyMode mode_ = BodyMode::UntilClose;
  size_t remaining_ = 0;
  size_t chunk_remaining_ = 0;
  bool in_chunk_ = false;
};

// ============================================================
// HttpClient
// ============================================================

HttpClient::HttpClient(asio::io_context &io_ctx) : io_ctx_(io_ctx) {}

HttpClient::~HttpClient() = default;

asio::ssl::context &HttpClient::ssl_context() {
  if (!ssl_ctx_) {
    ssl_ctx_ = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
    std::error_code ec;
    ssl_ctx_->set_default_verify_paths(ec);
    if (ec) {
      spdlog::warn("[HTTP] Failed to load default CA paths: {}", ec.message());
    }
  }
  return *ssl_ctx_;
}

std::future<HttpResponse> HttpClient::request(const std::string &url, const HttpOptions &opts) {
  return request_stream(url, opts, nullptr);
}

std::future<HttpResponse> HttpClient::request_stream(const std::string &url, const HttpOptions &opts, ChunkHandler on_chunk) {
  std::promise<HttpResponse> promise;
  auto future = promise.get_future();

  auto parsed = ParsedUrl::parse(url);
  if (!parsed) {
    HttpResponse resp;
    resp.error = "Invalid URL: " + url;
    promise.set_value(std::move(resp));
    return future;
  }

  asio::ssl::context *ssl = nullptr;
  if (parsed->is_https()) {
    try {
      ssl = &ssl_context();
    } catch (const std::exception &e) {
      HttpResponse resp;
      resp.error = std::string("Failed to initialize TLS: ") + e.what();
      promise.set_value(std::move(resp));
      return future;
    }
  }

  spdlog::debug("[HTTP] {} {}", opts.method, url);

  auto conn = std::make_shared<Connection>(io_ctx_, ssl, std::move(*parsed), opts, std::move(on_chunk), std::move(promise));
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_ = conn;
  }
  conn->start();
  return future;
}

void HttpClient::cancel() {
  std::shared_ptr<Connection> conn;
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    conn = active_.lock();
  }
  if (conn) {
    asio::post(io_ctx_, [conn]() {
      conn->cancel();
    });
  }
}

}  // namespace mcpterm::net
