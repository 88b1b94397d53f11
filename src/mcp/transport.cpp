#include "mcp/transport.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <csignal>
#include <cstring>
#include <thread>
#include <unordered_map>

#include "net/http_client.hpp"
#include "net/sse_client.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace mcpterm::mcp {

namespace {

constexpr size_t kMaxDiagnosticBody = 200;
constexpr auto kTerminateGrace = std::chrono::milliseconds(500);

ResponseFuture ready_failure(Error error) {
  std::promise<Result<JsonRpcResponse>> promise;
  promise.set_value(Result<JsonRpcResponse>::failure(std::move(error)));
  return promise.get_future();
}

std::string truncate(const std::string &s, size_t max_len) {
  if (s.size() <= max_len) return s;
  return s.substr(0, max_len) + "...";
}

std::string dump_message(const json &msg) {
  return msg.dump(-1, ' ', false, json::error_handler_t::replace);
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

}  // namespace

std::string to_string(TransportState state) {
  switch (state) {
    case TransportState::Disconnected:
      return "Disconnected";
    case TransportState::Connecting:
      return "Connecting";
    case TransportState::Connected:
      return "Connected";
    case TransportState::Failed:
      return "Failed";
  }
  return "Unknown";
}

// ============================================================
// Transport
// ============================================================

ResponseFuture Transport::send(const std::string &method, const json &params) {
  JsonRpcRequest request;
  request.method = method;
  request.params = params;
  request.id = correlator_.next_id();
  return send_request(request);
}

void Transport::set_notification_handler(NotificationHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  notification_handler_ = std::move(handler);
}

void Transport::dispatch_notification(const std::string &method, const json &params) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  if (notification_handler_) {
    notification_handler_(method, params);
  }
}

// ============================================================
// StdioTransport::Impl: POSIX child process over pipes
// ============================================================

class StdioTransport::Impl {
 public:
  Impl(StdioTransport &owner, std::string command, std::vector<std::string> args, std::map<std::string, std::string> env,
       std::string cwd)
      : owner_(owner), command_(std::move(command)), args_(std::move(args)), env_(std::move(env)), cwd_(std::move(cwd)) {}

  ~Impl() {
    disconnect();
  }

  std::future<Status> connect() {
    return std::async(std::launch::async, [this]() -> Status {
      std::lock_guard<std::mutex> lock(process_mutex_);
      return spawn();
    });
  }

  void disconnect() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ < 0 && !reader_thread_.joinable()) {
      state_ = TransportState::Disconnected;
      return;
    }

    stopped_ = true;
    state_ = TransportState::Disconnected;

    // Callers waiting on a response get an error right away
    owner_.correlator().fail_all(Error::transport("Transport closed while waiting for a response"));

    // Wake the reader, then signal EOF on the child's stdin
    if (wake_write_ >= 0) {
      char c = 1;
      if (write(wake_write_, &c, 1) < 0) {
        spdlog::debug("[MCP] Failed to wake reader: {}", strerror(errno));
      }
    }
    close_fd(write_fd_);

    terminate_child();

    if (reader_thread_.joinable()) {
      reader_thread_.join();
    }

    close_fd(read_fd_);
    close_fd(wake_read_);
    close_fd(wake_write_);
  }

  ResponseFuture send_request(const JsonRpcRequest &request) {
    if (state_ != TransportState::Connected) {
      return ready_failure(Error::transport("Transport not connected"));
    }

    auto &correlator = owner_.correlator();
    auto future = correlator.track(request.id);

    // The reader may have seen EOF between the check above and track()
    if (state_ != TransportState::Connected) {
      correlator.fail(request.id, Error::transport("No response from server"));
      return future;
    }

    std::string line = dump_message(request.to_json()) + "\n";
    spdlog::debug("[MCP] -> {}", line.substr(0, line.size() - 1));
    if (!write_all(line)) {
      correlator.fail(request.id, Error::transport(std::string("Failed to write request: ") + strerror(errno)));
    }
    return future;
  }

  void send_notification(const JsonRpcNotification &notification) {
    if (state_ != TransportState::Connected) return;
    if (!write_all(dump_message(notification.to_json()) + "\n")) {
      spdlog::warn("[MCP] Failed to write notification '{}': {}", notification.method, strerror(errno));
    }
  }

  TransportState state() const {
    return state_;
  }

 private:
  Status spawn() {
    if (state_ == TransportState::Connected) return Status::success();
    state_ = TransportState::Connecting;

    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, []() {
      // Writes to an exited child must fail with EPIPE instead of killing us
      std::signal(SIGPIPE, SIG_IGN);
    });

    // Everything the child needs is built before fork()
    std::vector<const char *> argv;
    argv.push_back(command_.c_str());
    for (const auto &arg : args_) {
      argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    for (char **e = environ; e && *e; ++e) {
      std::string entry(*e);
      auto eq = entry.find('=');
      if (eq != std::string::npos && env_.count(entry.substr(0, eq))) continue;
      env_strings.push_back(std::move(entry));
    }
    for (const auto &[key, val] : env_) {
      env_strings.push_back(key + "=" + val);
    }
    std::vector<char *> envp;
    for (auto &entry : env_strings) {
      envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};   // [read-end, write-end]
    int stdout_pipe[2] = {-1, -1};  // [read-end, write-end]
    int exec_pipe[2] = {-1, -1};    // reports exec failure to the parent
    int wake_pipe[2] = {-1, -1};

    auto close_all = [&]() {
      for (int *p : {stdin_pipe, stdout_pipe, exec_pipe, wake_pipe}) {
        close_fd(p[0]);
        close_fd(p[1]);
      }
    };

    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0 ||
        pipe2(wake_pipe, O_CLOEXEC) != 0) {
      std::string reason = strerror(errno);
      close_all();
      state_ = TransportState::Failed;
      spdlog::error("[MCP] Failed to create pipes: {}", reason);
      return Status::failure(Error::transport("Failed to create pipes: " + reason));
    }

    pid_t pid = fork();
    if (pid < 0) {
      std::string reason = strerror(errno);
      close_all();
      state_ = TransportState::Failed;
      spdlog::error("[MCP] Fork failed: {}", reason);
      return Status::failure(Error::transport("Failed to start '" + command_ + "': " + reason));
    }

    if (pid == 0) {
      // Child process: own process group so the whole tree can be signalled
      setpgid(0, 0);

      dup2(stdin_pipe[0], STDIN_FILENO);
      dup2(stdout_pipe[1], STDOUT_FILENO);

      // stderr is not part of the protocol channel
      int devnull = open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        dup2(devnull, STDERR_FILENO);
        close(devnull);
      }

      if (!cwd_.empty() && chdir(cwd_.c_str()) != 0) {
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
      }

      execvpe(command_.c_str(), const_cast<char *const *>(argv.data()), envp.data());

      int err = errno;
      ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
      (void)ignored;
      _exit(127);
    }

    // Parent process
    setpgid(pid, pid);
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF means exec succeeded (the CLOEXEC end was closed)
    int child_errno = 0;
    ssize_t n;
    do {
      n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
      int status;
      waitpid(pid, &status, 0);
      close_all();
      state_ = TransportState::Failed;
      std::string reason = strerror(child_errno);
      spdlog::error("[MCP] Failed to start '{}': {}", command_, reason);
      if (!cwd_.empty() && child_errno == ENOENT) {
        reason += " (command or working directory '" + cwd_ + "')";
      }
      return Status::failure(Error::transport("Failed to start '" + command_ + "': " + reason));
    }

    pid_ = pid;
    write_fd_ = stdin_pipe[1];
    read_fd_ = stdout_pipe[0];
    wake_read_ = wake_pipe[0];
    wake_write_ = wake_pipe[1];

    stopped_ = false;
    state_ = TransportState::Connected;

    reader_thread_ = std::thread([this]() {
      reader_loop();
    });

    spdlog::info("[MCP] Stdio transport connected: {} (pid: {})", command_, pid_);
    return Status::success();
  }

  void terminate_child() {
    if (pid_ <= 0) return;

    kill(-pid_, SIGTERM);

    int status;
    auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
    while (waitpid(pid_, &status, WNOHANG) == 0) {
      if (std::chrono::steady_clock::now() >= deadline) {
        kill(-pid_, SIGKILL);
        waitpid(pid_, &status, 0);
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    spdlog::debug("[MCP] Child process {} exited", pid_);
    pid_ = -1;
  }

  bool write_all(const std::string &data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ < 0) {
      errno = EPIPE;
      return false;
    }

    size_t offset = 0;
    while (offset < data.size()) {
      ssize_t written = write(write_fd_, data.data() + offset, data.size() - offset);
      if (written < 0) {
        if (errno == EINTR) continue;
        spdlog::error("[MCP] Write failed: {}", strerror(errno));
        return false;
      }
      offset += static_cast<size_t>(written);
    }
    return true;
  }

  void reader_loop() {
    std::string buffer;
    std::array<char, 4096> read_buf;

    while (!stopped_) {
      pollfd fds[2] = {{read_fd_, POLLIN, 0}, {wake_read_, POLLIN, 0}};
      int rc = poll(fds, 2, -1);
      if (rc < 0) {
        if (errno == EINTR) continue;
        spdlog::error("[MCP] Reader: poll failed: {}", strerror(errno));
        break;
      }
      if (fds[1].revents != 0) break;  // disconnect()
      if (fds[0].revents == 0) continue;

      ssize_t n = read(read_fd_, read_buf.data(), read_buf.size());
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) {
        if (!stopped_) {
          spdlog::warn("[MCP] Reader: '{}' closed its output stream", command_);
          state_ = TransportState::Failed;
          owner_.correlator().fail_all(Error::transport("No response from server"));
        }
        break;
      }

      buffer.append(read_buf.data(), n);

      // One message per line
      size_t eol;
      while ((eol = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, eol);
        buffer.erase(0, eol + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        handle_line(line);
      }
    }
  }

  void handle_line(const std::string &line) {
    spdlog::debug("[MCP] <- {}", line);
    auto &correlator = owner_.correlator();

    json msg;
    try {
      msg = json::parse(line);
    } catch (const json::parse_error &e) {
      spdlog::warn("[MCP] Invalid JSON from '{}': {}", command_, e.what());
      correlator.fail_all(Error::transport(std::string("Invalid JSON response: ") + e.what() + ". Response: " +
                                           truncate(line, kMaxDiagnosticBody)));
      return;
    }

    if (JsonRpcResponse::is_response(msg)) {
      auto resp = JsonRpcResponse::from_json(msg);
      if (resp.id.is_null() && !resp.ok()) {
        // The server could not attribute the error to a request
        correlator.fail_all(Error::protocol(resp.error_message()));
        return;
      }
      if (!correlator.resolve(resp)) {
        spdlog::debug("[MCP] Discarding response with unmatched id '{}'", resp.id_string());
      }
      return;
    }

    if (msg.is_object() && msg.contains("method") && msg["method"].is_string()) {
      owner_.dispatch_notification(msg["method"].get<std::string>(), msg.value("params", json::object()));
      return;
    }

    spdlog::debug("[MCP] Ignoring unrecognized message from '{}'", command_);
  }

  StdioTransport &owner_;

  std::string command_;
  std::vector<std::string> args_;
  std::map<std::string, std::string> env_;
  std::string cwd_;

  pid_t pid_ = -1;
  int write_fd_ = -1;
  int read_fd_ = -1;
  int wake_read_ = -1;
  int wake_write_ = -1;

  std::atomic<TransportState> state_{TransportState::Disconnected};
  std::atomic<bool> stopped_{false};

  std::thread reader_thread_;

  std::mutex write_mutex_;
  std::mutex process_mutex_;
};

// ============================================================
// StdioTransport: delegates to Impl
// ============================================================

StdioTransport::StdioTransport(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env,
                               std::string cwd)
    : impl_(std::make_unique<Impl>(*this, std::move(command), std::move(args), std::move(env), std::move(cwd))) {}

StdioTransport::~StdioTransport() = default;

ResponseFuture StdioTransport::send_request(const JsonRpcRequest &request) {
  return impl_->send_request(request);
}

void StdioTransport::send_notification(const JsonRpcNotification &notification) {
  impl_->send_notification(notification);
}

std::future<Status> StdioTransport::connect() {
  return impl_->connect();
}

void StdioTransport::disconnect() {
  impl_->disconnect();
}

TransportState StdioTransport::state() const {
  return impl_->state();
}

// ============================================================
// HttpTransport::Impl: POST per message, JSON or SSE replies
// ============================================================

class HttpTransport::Impl {
 public:
  Impl(HttpTransport &owner, std::string url, std::map<std::string, std::string> headers, std::chrono::milliseconds timeout)
      : owner_(owner), url_(std::move(url)), headers_(std::move(headers)), timeout_(timeout) {}

  ~Impl() {
    disconnect();
  }

  std::future<Status> connect() {
    return std::async(std::launch::async, [this]() -> Status {
      // No I/O happens until the first request
      if (!net::ParsedUrl::parse(url_)) {
        state_ = TransportState::Failed;
        return Status::failure(Error::transport("Invalid URL: " + url_));
      }

      {
        std::lock_guard<std::mutex> lock(active_mutex_);
        stopped_ = false;
      }
      state_ = TransportState::Connected;
      spdlog::info("[MCP] HTTP transport ready for: {}", url_);
      return Status::success();
    });
  }

  void disconnect() {
    // Only one caller ends the server-side session
    bool was_connected = state_.exchange(TransportState::Disconnected) == TransportState::Connected;

    {
      std::lock_guard<std::mutex> lock(active_mutex_);
      stopped_ = true;
      for (auto &[key, io_ctx] : active_) {
        io_ctx->stop();
      }
    }

    owner_.correlator().fail_all(Error::transport("Transport closed while waiting for a response"));

    std::vector<std::future<void>> workers;
    {
      std::lock_guard<std::mutex> lock(workers_mutex_);
      workers.swap(workers_);
    }
    for (auto &worker : workers) {
      worker.wait();
    }

    if (was_connected) {
      end_session();
    }
  }

  ResponseFuture send_request(const JsonRpcRequest &request) {
    auto &correlator = owner_.correlator();

    if (state_ != TransportState::Connected) {
      return ready_failure(Error::transport("Transport not connected"));
    }

    auto future = correlator.track(request.id);
    spawn_worker([this, request]() {
      perform(request);
    });
    return future;
  }

  void send_notification(const JsonRpcNotification &notification) {
    if (state_ != TransportState::Connected) return;

    spawn_worker([this, notification]() {
      auto response = post("notify:" + notification.method, dump_message(notification.to_json()), nullptr);
      if (!response) return;
      if (!response->error.empty() || !response->ok()) {
        spdlog::warn("[MCP] HTTP notification '{}' failed: {}", notification.method,
                     response->error.empty() ? "HTTP " + std::to_string(response->status_code) : response->error);
      }
    });
  }

  TransportState state() const {
    return state_;
  }

  std::string session_id() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
  }

 private:
  void spawn_worker(std::function<void()> work) {
    std::lock_guard<std::mutex> lock(workers_mutex_);

    // Reap finished workers
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }

    workers_.push_back(std::async(std::launch::async, std::move(work)));
  }

  net::HttpOptions make_options(const std::string &body) const {
    net::HttpOptions opts;
    opts.method = "POST";
    opts.headers = headers_;
    opts.headers["Content-Type"] = "application/json";
    opts.headers["Accept"] = "application/json, text/event-stream";
    if (auto sid = session_id(); !sid.empty()) {
      opts.headers["Mcp-Session-Id"] = sid;
    }
    opts.body = body;
    opts.timeout = timeout_;
    return opts;
  }

  // Runs one POST on a private io_context. nullopt when cancelled by disconnect().
  std::optional<net::HttpResponse> post(const std::string &key, const std::string &body, net::HttpClient::ChunkHandler on_chunk) {
    auto io_ctx = std::make_shared<asio::io_context>();
    {
      std::lock_guard<std::mutex> lock(active_mutex_);
      if (stopped_) return std::nullopt;
      active_[key] = io_ctx;
    }

    net::HttpClient http(*io_ctx);
    auto response_future = http.request_stream(url_, make_options(body), std::move(on_chunk));

    try {
      io_ctx->run();
    } catch (const std::exception &e) {
      spdlog::error("[MCP] HTTP event loop failed: {}", e.what());
    }

    {
      std::lock_guard<std::mutex> lock(active_mutex_);
      active_.erase(key);
    }

    if (response_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      return std::nullopt;
    }
    return response_future.get();
  }

  void perform(const JsonRpcRequest &request) {
    auto &correlator = owner_.correlator();
    const std::string &id = request.id;

    std::string json_body;
    std::string error_body;
    bool matched = false;

    net::SseParser sse([&](const net::SseEvent &event) -> bool {
      return !handle_event(id, event, matched);
    });

    spdlog::debug("[MCP] POST {} -> {}", url_, request.method);
    auto response = post(id, dump_message(request.to_json()), [&](const net::HttpResponse &head, std::string_view chunk) -> bool {
      if (!head.ok()) {
        error_body.append(chunk);
        return error_body.size() < kMaxDiagnosticBody;
      }
      if (is_event_stream(head)) {
        return sse.feed(chunk);
      }
      json_body.append(chunk);
      return true;
    });

    if (!response) {
      correlator.fail(id, Error::transport("Request cancelled"));
      return;
    }

    if (response->status_code > 0) {
      remember_session(*response);
    }

    if (response->status_code > 0 && !response->ok()) {
      correlator.fail(id, Error::transport("HTTP " + std::to_string(response->status_code) + ": " +
                                           truncate(error_body, kMaxDiagnosticBody)));
      return;
    }

    if (!response->error.empty() && !matched) {
      correlator.fail(id, Error::transport("HTTP request failed: " + response->error));
      return;
    }

    if (is_event_stream(*response)) {
      if (!matched && !sse.stopped()) sse.flush();
      if (!matched) {
        correlator.fail(id, Error::transport("No valid JSON data found in SSE stream"));
      }
      return;
    }

    try {
      auto msg = json::parse(json_body);
      if (!JsonRpcResponse::is_response(msg)) {
        correlator.fail(id, Error::transport("Unexpected response: " + truncate(json_body, kMaxDiagnosticBody)));
        return;
      }
      // The body answers this POST, whatever id it echoes
      correlator.complete(id, JsonRpcResponse::from_json(msg));
    } catch (const json::parse_error &e) {
      correlator.fail(id, Error::transport(std::string("Invalid JSON response: ") + e.what() + ". Response: " +
                                           truncate(json_body, kMaxDiagnosticBody)));
    }
  }

  // Returns true once the stream should be abandoned
  bool handle_event(const std::string &id, const net::SseEvent &event, bool &matched) {
    std::vector<std::string> payloads{event.data};
    if (event.data_lines.size() > 1 && !json::accept(event.data)) {
      payloads = event.data_lines;
    }

    for (const auto &payload : payloads) {
      if (payload == "[DONE]") return true;
      if (payload.empty()) continue;

      json msg;
      try {
        msg = json::parse(payload);
      } catch (const json::parse_error &) {
        spdlog::debug("[MCP] Skipping non-JSON SSE data: {}", truncate(payload, kMaxDiagnosticBody));
        continue;
      }

      if (JsonRpcResponse::is_response(msg)) {
        auto resp = JsonRpcResponse::from_json(msg);
        if (resp.id_string() == id || resp.id.is_null()) {
          owner_.correlator().complete(id, std::move(resp));
          matched = true;
          return true;
        }
        spdlog::debug("[MCP] Discarding SSE response with unmatched id '{}'", resp.id_string());
        continue;
      }

      if (msg.is_object() && msg.contains("method") && msg["method"].is_string()) {
        owner_.dispatch_notification(msg["method"].get<std::string>(), msg.value("params", json::object()));
      }
    }
    return false;
  }

  static bool is_event_stream(const net::HttpResponse &response) {
    return response.header("content-type").find("text/event-stream") != std::string::npos;
  }

  void remember_session(const net::HttpResponse &response) {
    auto sid = response.header("mcp-session-id");
    if (sid.empty()) return;

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_id_ != sid) {
      spdlog::debug("[MCP] HTTP session id for {}: {}", url_, sid);
      session_id_ = sid;
    }
  }

  // Best-effort DELETE so the server can drop its session state
  void end_session() {
    std::string sid = session_id();
    if (sid.empty()) return;

    asio::io_context io_ctx;
    net::HttpClient http(io_ctx);

    net::HttpOptions opts;
    opts.method = "DELETE";
    opts.headers = headers_;
    opts.headers["Mcp-Session-Id"] = sid;
    opts.timeout = std::min<std::chrono::milliseconds>(timeout_, std::chrono::seconds(2));

    auto future = http.request(url_, opts);
    try {
      io_ctx.run();
      auto response = future.get();
      spdlog::debug("[MCP] Closed HTTP session {} (status {})", sid, response.status_code);
    } catch (const std::exception &e) {
      spdlog::debug("[MCP] Failed to close HTTP session {}: {}", sid, e.what());
    }

    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_.clear();
  }

  HttpTransport &owner_;

  std::string url_;
  std::map<std::string, std::string> headers_;
  std::chrono::milliseconds timeout_;

  std::atomic<TransportState> state_{TransportState::Disconnected};

  std::mutex active_mutex_;
  bool stopped_ = false;
  std::unordered_map<std::string, std::shared_ptr<asio::io_context>> active_;

  std::mutex workers_mutex_;
  std::vector<std::future<void>> workers_;

  mutable std::mutex session_mutex_;
  std::string session_id_;
};

// ============================================================
// HttpTransport: delegates to Impl
// ============================================================

HttpTransport::HttpTransport(std::string url, std::map<std::string, std::string> headers, std::chrono::milliseconds timeout)
    : impl_(std::make_unique<Impl>(*this, std::move(url), std::move(headers), timeout)) {}

HttpTransport::~HttpTransport() = default;

ResponseFuture HttpTransport::send_request(const JsonRpcRequest &request) {
  return impl_->send_request(request);
}

void HttpTransport::send_notification(const JsonRpcNotification &notification) {
  impl_->send_notification(notification);
}

std::future<Status> HttpTransport::connect() {
  return impl_->connect();
}

void HttpTransport::disconnect() {
  impl_->disconnect();
}

TransportState HttpTransport::state() const {
  return impl_->state();
}

std::string HttpTransport::session_id() const {
  return impl_->session_id();
}

}  // namespace mcpterm::mcp
