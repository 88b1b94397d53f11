#pragma once

#include <asio.hpp>
#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace mcpterm::test {

using json = nlohmann::json;

struct MockRequest {
  std::string method;
  std::string target;
  std::map<std::string, std::string> headers;  // Names lower-cased
  std::string body;

  std::string header(const std::string &name) const {
    auto it = headers.find(name);
    return it == headers.end() ? "" : it->second;
  }
};

struct MockResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::map<std::string, std::string> headers;
  std::vector<std::string> chunks;  // Body, written piece by piece
  bool chunked = false;             // Transfer-Encoding: chunked instead of Content-Length
  std::chrono::milliseconds delay{0};        // Before the status line
  std::chrono::milliseconds chunk_delay{0};  // Between body pieces
  std::chrono::milliseconds hold{0};         // Keep the connection open after the body

  static MockResponse json_body(const json &body) {
    MockResponse r;
    r.chunks.push_back(body.dump());
    return r;
  }

  static MockResponse sse(std::vector<std::string> events) {
    MockResponse r;
    r.content_type = "text/event-stream";
    r.chunked = true;
    r.chunks = std::move(events);
    return r;
  }

  static MockResponse text(int status, std::string body) {
    MockResponse r;
    r.status = status;
    r.content_type = "text/plain";
    r.chunks.push_back(std::move(body));
    return r;
  }
};

inline json rpc_result(const json &id, const json &result) {
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

// Minimal blocking HTTP/1.1 server on 127.0.0.1, one thread per connection
class MockHttpServer {
 public:
  using Handler = std::function<MockResponse(const MockRequest &request)>;

  explicit MockHttpServer(Handler handler)
      : handler_(std::move(handler)), acceptor_(io_ctx_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    accept_thread_ = std::thread([this]() {
      accept_loop();
    });
  }

  ~MockHttpServer() {
    stopped_ = true;

    // Wake the blocking accept()
    asio::error_code ec;
    asio::ip::tcp::socket wake(io_ctx_);
    wake.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port_), ec);
    wake.close(ec);

    if (accept_thread_.joinable()) accept_thread_.join();

    std::vector<std::thread> workers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      workers.swap(workers_);
    }
    for (auto &t : workers) {
      if (t.joinable()) t.join();
    }
  }

  unsigned short port() const {
    return port_;
  }

  std::string url(const std::string &path = "/mcp") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  std::vector<MockRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  void accept_loop() {
    while (!stopped_) {
      auto socket = std::make_shared<asio::ip::tcp::socket>(io_ctx_);
      asio::error_code ec;
      acceptor_.accept(*socket, ec);
      if (ec || stopped_) break;

      std::lock_guard<std::mutex> lock(mutex_);
      workers_.emplace_back([this, socket]() {
        handle_connection(*socket);
      });
    }
  }

  void handle_connection(asio::ip::tcp::socket &socket) {
    asio::error_code ec;
    std::string buffer;
    asio::read_until(socket, asio::dynamic_buffer(buffer), "\r\n\r\n", ec);
    if (ec) return;

    auto header_end = buffer.find("\r\n\r\n");
    MockRequest request;
    std::istringstream head(buffer.substr(0, header_end));
    std::string line;
    std::getline(head, line);
    {
      std::istringstream request_line(line);
      request_line >> request.method >> request.target;
    }
    while (std::getline(head, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      auto colon = line.find(':');
      if (colon == std::string::npos) continue;
      std::string name = line.substr(0, colon);
      for (auto &c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      std::string value = line.substr(colon + 1);
      while (!value.empty() && value.front() == ' ') value.erase(0, 1);
      request.headers[name] = value;
    }

    request.body = buffer.substr(header_end + 4);
    size_t content_length = 0;
    if (auto len = request.header("content-length"); !len.empty()) {
      content_length = std::stoul(len);
    }
    if (request.body.size() < content_length) {
      std::string rest(content_length - request.body.size(), '\0');
      asio::read(socket, asio::buffer(rest), ec);
      if (ec) return;
      request.body += rest;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
    }

    auto response = handler_(request);
    if (response.delay.count() > 0) std::this_thread::sleep_for(response.delay);

    std::string out = "HTTP/1.1 " + std::to_string(response.status) + " Mock\r\n";
    out += "Content-Type: " + response.content_type + "\r\n";
    for (const auto &[name, value] : response.headers) {
      out += name + ": " + value + "\r\n";
    }
    if (response.chunked) {
      out += "Transfer-Encoding: chunked\r\n";
    } else {
      size_t total = 0;
      for (const auto &c : response.chunks) total += c.size();
      out += "Content-Length: " + std::to_string(total) + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    asio::write(socket, asio::buffer(out), ec);
    if (ec) return;

    for (const auto &chunk : response.chunks) {
      if (response.chunk_delay.count() > 0) std::this_thread::sleep_for(response.chunk_delay);
      std::string piece = chunk;
      if (response.chunked) {
        std::ostringstream hex;
        hex << std::hex << chunk.size();
        piece = hex.str() + "\r\n" + chunk + "\r\n";
      }
      asio::write(socket, asio::buffer(piece), ec);
      if (ec) return;
    }

    if (response.hold.count() > 0) std::this_thread::sleep_for(response.hold);

    if (response.chunked) {
      asio::write(socket, asio::buffer(std::string("0\r\n\r\n")), ec);
    }
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
  }

  Handler handler_;
  asio::io_context io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  std::atomic<bool> stopped_{false};

  std::thread accept_thread_;
  mutable std::mutex mutex_;
  std::vector<std::thread> workers_;
  std::vector<MockRequest> requests_;
};

}  // namespace mcpterm::test
