#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "mcp/tool.hpp"
#include "mcp/transport.hpp"

namespace mcpterm::mcp {

using json = nlohmann::json;

// MCP server capabilities (returned during initialize)
struct ServerCapabilities {
  bool supports_tools = false;
  bool supports_resources = false;
  bool supports_prompts = false;
  bool supports_logging = false;
};

struct ServerInfo {
  std::string name;
  std::string version;
};

// Session state. There is no way back from Closed; retrying needs a new session.
enum class ClientState { Disconnected, Handshaking, Ready, Closed };

std::string to_string(ClientState state);

// McpClient: one session with one MCP server.
// Must be owned by a std::shared_ptr: pending operations keep the session alive.
class McpClient : public std::enable_shared_from_this<McpClient> {
 public:
  explicit McpClient(const McpServerConfig &config);

  // Use a caller-supplied transport instead of building one from the config
  McpClient(const McpServerConfig &config, std::unique_ptr<Transport> transport);

  ~McpClient();

  McpClient(const McpClient &) = delete;
  McpClient &operator=(const McpClient &) = delete;

  // Start the transport, run initialize and load the tool catalog
  std::future<Status> connect();

  // Terminate the process or end the HTTP session; pending calls fail
  void disconnect();

  // State
  ClientState state() const {
    return state_;
  }
  bool is_ready() const {
    return state() == ClientState::Ready;
  }
  const std::string &server_name() const {
    return config_.name;
  }
  const McpServerConfig &config() const {
    return config_;
  }

  // Catalog loaded during connect()
  std::vector<ToolDescriptor> tools() const;

  // Invoke a tool by its underlying name. Only valid while Ready.
  std::future<Result<ToolResult>> call_tool(const std::string &name, const json &arguments);

  // Server info
  ServerCapabilities capabilities() const;
  ServerInfo server_info() const;
  std::optional<Error> last_error() const;

 private:
  Status handshake();
  Status initialize();
  Status load_tools();

  // One request at a time per session
  Result<JsonRpcResponse> request(const std::string &method, const json &params);

  Error fail(Error error);

  // Transport teardown that never throws
  void release_transport();

  McpServerConfig config_;
  std::optional<Error> config_error_;
  std::unique_ptr<Transport> transport_;

  std::atomic<ClientState> state_{ClientState::Disconnected};

  mutable std::mutex mutex_;  // Guards the fields below
  std::vector<ToolDescriptor> tools_;
  ServerCapabilities capabilities_;
  ServerInfo server_info_;
  std::optional<Error> last_error_;

  std::mutex call_mutex_;
};

}  // namespace mcpterm::mcp
