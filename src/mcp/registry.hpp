#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "mcp/client.hpp"
#include "mcp/tool.hpp"
#include "mcp/transport.hpp"

namespace mcpterm::mcp {

using json = nlohmann::json;

// Read model for status displays
struct ServerStatus {
  std::string name;
  TransportKind transport = TransportKind::Local;
  std::string description;
  size_t tool_count = 0;
  ClientState state = ClientState::Disconnected;
  bool connected = false;
  std::string error;  // Last failure, if any
};

// McpRegistry: owns every session and the merged tool namespace.
// Tools are keyed by "<server>:<tool>"; a bare name resolves only when
// exactly one server exposes it.
class McpRegistry {
 public:
  McpRegistry() = default;
  ~McpRegistry();

  McpRegistry(const McpRegistry &) = delete;
  McpRegistry &operator=(const McpRegistry &) = delete;

  // Connect one server and merge its tools. An existing session with the
  // same name is closed first. On failure nothing is registered.
  Status add_server(const McpServerConfig &config);
  Status add_server(const McpServerConfig &config, std::unique_ptr<Transport> transport);

  // Connect all enabled servers concurrently; returns how many connected
  size_t add_servers(const std::vector<McpServerConfig> &configs);

  // Close and unregister one session
  bool remove_server(const std::string &name);

  // Tear down every session and clear all indices
  void close();

  // Name lookup. Never modifies the registry.
  Result<QualifiedToolName> resolve(const std::string &name) const;
  Result<ToolDescriptor> get_tool(const std::string &name) const;

  std::future<Result<ToolResult>> call_tool(const std::string &name, const json &arguments);

  std::vector<ToolDescriptor> list_tools() const;
  std::vector<ServerStatus> status() const;

  size_t server_count() const;
  size_t tool_count() const;

 private:
  Status connect_client(const McpServerConfig &config, std::shared_ptr<McpClient> client);

  // Removes a session from both indices; caller holds mutex_
  std::shared_ptr<McpClient> detach_locked(const std::string &name);

  void record_failure(const McpServerConfig &config, const Error &error);

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<McpClient>> clients_;  // server name -> session
  std::map<std::string, QualifiedToolName> tool_index_;         // "<server>:<tool>" -> key
  std::map<std::string, ServerStatus> failures_;                // servers whose last add failed
};

}  // namespace mcpterm::mcp
