#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "mcp/jsonrpc.hpp"

namespace mcpterm::mcp {

using json = nlohmann::json;

// Transport state
enum class TransportState { Disconnected, Connecting, Connected, Failed };

std::string to_string(TransportState state);

// Abstract transport interface for MCP communication.
// A transport carries exactly one response per request; callers serialize
// their own requests.
class Transport {
 public:
  virtual ~Transport() = default;

  // Send a JSON-RPC request tagged with a fresh id and wait for its response.
  // Transport failures resolve the future with an Error of kind Transport.
  ResponseFuture send(const std::string &method, const json &params = json::object());

  // Send a notification (no response expected)
  virtual void send_notification(const JsonRpcNotification &notification) = 0;

  // Set handler for incoming notifications from server
  using NotificationHandler = std::function<void(const std::string &method, const json &params)>;
  void set_notification_handler(NotificationHandler handler);

  // Lifecycle
  virtual std::future<Status> connect() = 0;

  // Release the process or connection. Pending requests resolve with an error.
  virtual void disconnect() = 0;

  // State
  virtual TransportState state() const = 0;
  virtual bool is_connected() const {
    return state() == TransportState::Connected;
  }

 protected:
  virtual ResponseFuture send_request(const JsonRpcRequest &request) = 0;

  void dispatch_notification(const std::string &method, const json &params);

  RequestCorrelator &correlator() {
    return correlator_;
  }

 private:
  RequestCorrelator correlator_;

  std::mutex handler_mutex_;
  NotificationHandler notification_handler_;
};

// Stdio transport: one JSON-RPC message per line on a child process's stdin/stdout
class StdioTransport : public Transport {
 public:
  StdioTransport(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env = {},
                 std::string cwd = {});
  ~StdioTransport() override;

  void send_notification(const JsonRpcNotification &notification) override;

  std::future<Status> connect() override;
  void disconnect() override;
  TransportState state() const override;

 protected:
  ResponseFuture send_request(const JsonRpcRequest &request) override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// HTTP transport: one POST per message; the response is either a single
// JSON envelope or a text/event-stream carrying it
class HttpTransport : public Transport {
 public:
  HttpTransport(std::string url, std::map<std::string, std::string> headers = {},
                std::chrono::milliseconds timeout = std::chrono::seconds(30));
  ~HttpTransport() override;

  void send_notification(const JsonRpcNotification &notification) override;

  std::future<Status> connect() override;
  void disconnect() override;
  TransportState state() const override;

  // Value of the Mcp-Session-Id header issued by the server, if any
  std::string session_id() const;

 protected:
  ResponseFuture send_request(const JsonRpcRequest &request) override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace mcpterm::mcp
