#include "mcp/registry.hpp"

#include <spdlog/spdlog.h>

namespace mcpterm::mcp {

namespace {

std::string join(const std::vector<std::string> &items, const std::string &sep) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) out += sep;
    out += item;
  }
  return out;
}

}  // namespace

McpRegistry::~McpRegistry() {
  close();
}

// ============================================================
// Lifecycle
// ============================================================

Status McpRegistry::add_server(const McpServerConfig &config) {
  if (auto error = config.validate()) {
    error->with_server(config.name);
    record_failure(config, *error);
    spdlog::warn("[MCP] Rejected server '{}': {}", config.name, error->message);
    return Status::failure(*error);
  }
  return connect_client(config, std::make_shared<McpClient>(config));
}

Status McpRegistry::add_server(const McpServerConfig &config, std::unique_ptr<Transport> transport) {
  if (auto error = config.validate()) {
    error->with_server(config.name);
    record_failure(config, *error);
    spdlog::warn("[MCP] Rejected server '{}': {}", config.name, error->message);
    return Status::failure(*error);
  }
  return connect_client(config, std::make_shared<McpClient>(config, std::move(transport)));
}

Status McpRegistry::connect_client(const McpServerConfig &config, std::shared_ptr<McpClient> client) {
  // Replacing a server: the old session goes away before the new one starts
  std::shared_ptr<McpClient> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = detach_locked(config.name);
  }
  if (previous) {
    spdlog::info("[MCP] Replacing server '{}'", config.name);
    previous->disconnect();
  }

  spdlog::info("[MCP] Connecting to server '{}' ({})", config.name, to_string(config.transport));
  auto status = client->connect().get();
  if (status.failed()) {
    client->disconnect();
    record_failure(config, *status.error);
    spdlog::warn("[MCP] Failed to connect to server '{}': {}", config.name, status.error->message);
    return status;
  }

  auto tools = client->tools();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // A concurrent add_server may have registered the same name meanwhile
    previous = detach_locked(config.name);

    clients_[config.name] = client;
    failures_.erase(config.name);
    for (const auto &tool : tools) {
      auto key = tool.qualified_name();
      tool_index_[key.to_string()] = key;
    }
  }
  if (previous) {
    previous->disconnect();
  }

  spdlog::info("[MCP] Registered server '{}' with {} tools", config.name, tools.size());
  return Status::success();
}

size_t McpRegistry::add_servers(const std::vector<McpServerConfig> &configs) {
  std::vector<std::future<Status>> futures;

  for (const auto &config : configs) {
    if (!config.enabled) {
      spdlog::info("[MCP] Skipping disabled server '{}'", config.name);
      continue;
    }
    futures.push_back(std::async(std::launch::async, [this, config]() {
      return add_server(config);
    }));
  }

  // Wait for all connections
  size_t connected = 0;
  for (size_t i = 0; i < futures.size(); ++i) {
    if (futures[i].get().ok()) {
      ++connected;
    }
  }

  spdlog::info("[MCP] Connected {}/{} servers", connected, futures.size());
  return connected;
}

bool McpRegistry::remove_server(const std::string &name) {
  std::shared_ptr<McpClient> client;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.erase(name);
    client = detach_locked(name);
  }
  if (!client) return false;

  client->disconnect();
  spdlog::info("[MCP] Removed server '{}'", name);
  return true;
}

void McpRegistry::close() {
  std::map<std::string, std::shared_ptr<McpClient>> clients;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    clients.swap(clients_);
    tool_index_.clear();
    failures_.clear();
  }
  if (clients.empty()) return;

  // One failing teardown must not stop the rest
  for (auto &[name, client] : clients) {
    try {
      client->disconnect();
    } catch (const std::exception &e) {
      spdlog::warn("[MCP] Error while closing server '{}': {}", name, e.what());
    }
  }

  spdlog::info("[MCP] Closed {} sessions", clients.size());
}

std::shared_ptr<McpClient> McpRegistry::detach_locked(const std::string &name) {
  auto it = clients_.find(name);
  if (it == clients_.end()) return nullptr;

  auto client = std::move(it->second);
  clients_.erase(it);

  for (auto idx = tool_index_.begin(); idx != tool_index_.end();) {
    if (idx->second.server == name) {
      idx = tool_index_.erase(idx);
    } else {
      ++idx;
    }
  }
  return client;
}

void McpRegistry::record_failure(const McpServerConfig &config, const Error &error) {
  ServerStatus status;
  status.name = config.name;
  status.transport = config.transport;
  status.description = config.description;
  status.state = ClientState::Closed;
  status.error = error.message;

  std::lock_guard<std::mutex> lock(mutex_);
  failures_[config.name] = std::move(status);
}

// ============================================================
// Lookup and dispatch
// ============================================================

Result<QualifiedToolName> McpRegistry::resolve(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (name.find(kQualifiedSeparator) != std::string::npos) {
    auto it = tool_index_.find(name);
    if (it != tool_index_.end()) {
      return Result<QualifiedToolName>::success(it->second);
    }

    auto qualified = QualifiedToolName::parse(name);
    if (qualified && clients_.count(qualified->server) == 0) {
      return Result<QualifiedToolName>::failure(
          Error::not_found("Server '" + qualified->server + "' not found").with_server(qualified->server).with_tool(qualified->tool));
    }
    auto error = Error::not_found("Tool '" + name + "' not found");
    if (qualified) error.with_server(qualified->server).with_tool(qualified->tool);
    return Result<QualifiedToolName>::failure(error);
  }

  std::vector<QualifiedToolName> matches;
  for (const auto &[key, qualified] : tool_index_) {
    if (qualified.tool == name) {
      matches.push_back(qualified);
    }
  }

  if (matches.empty()) {
    return Result<QualifiedToolName>::failure(Error::not_found("Tool '" + name + "' not found").with_tool(name));
  }

  if (matches.size() > 1) {
    std::vector<std::string> servers;
    for (const auto &m : matches) {
      servers.push_back(m.server);
    }
    auto message = "Tool '" + name + "' is provided by multiple servers: " + join(servers, ", ") + ". Use <server>" +
                   kQualifiedSeparator + name + " to choose one";
    return Result<QualifiedToolName>::failure(Error::ambiguous(std::move(message), std::move(servers)).with_tool(name));
  }

  return Result<QualifiedToolName>::success(matches.front());
}

Result<ToolDescriptor> McpRegistry::get_tool(const std::string &name) const {
  auto resolved = resolve(name);
  if (resolved.failed()) return Result<ToolDescriptor>::failure(*resolved.error);

  std::shared_ptr<McpClient> client;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(resolved.value->server);
    if (it != clients_.end()) client = it->second;
  }

  if (client) {
    for (auto &tool : client->tools()) {
      if (tool.name == resolved.value->tool) {
        return Result<ToolDescriptor>::success(std::move(tool));
      }
    }
  }
  return Result<ToolDescriptor>::failure(
      Error::not_found("Tool '" + name + "' not found").with_server(resolved.value->server).with_tool(resolved.value->tool));
}

std::future<Result<ToolResult>> McpRegistry::call_tool(const std::string &name, const json &arguments) {
  auto resolved = resolve(name);
  if (resolved.failed()) {
    auto error = *resolved.error;
    return std::async(std::launch::deferred, [error]() {
      return Result<ToolResult>::failure(error);
    });
  }

  const auto &target = *resolved.value;
  std::shared_ptr<McpClient> client;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(target.server);
    if (it != clients_.end()) client = it->second;
  }

  if (!client) {
    // Removed between resolve() and here
    auto error = Error::not_found("Server '" + target.server + "' not found").with_server(target.server).with_tool(target.tool);
    return std::async(std::launch::deferred, [error]() {
      return Result<ToolResult>::failure(error);
    });
  }

  return client->call_tool(target.tool, arguments);
}

std::vector<ToolDescriptor> McpRegistry::list_tools() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ToolDescriptor> result;
  for (const auto &[name, client] : clients_) {
    auto tools = client->tools();
    result.insert(result.end(), tools.begin(), tools.end());
  }
  return result;
}

std::vector<ServerStatus> McpRegistry::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ServerStatus> result;

  for (const auto &[name, client] : clients_) {
    ServerStatus s;
    s.name = name;
    s.transport = client->config().transport;
    s.description = client->config().description;
    s.tool_count = client->tools().size();
    s.state = client->state();
    s.connected = client->is_ready();
    if (auto error = client->last_error()) {
      s.error = error->message;
    }
    result.push_back(std::move(s));
  }

  for (const auto &[name, failed] : failures_) {
    if (clients_.count(name) == 0) {
      result.push_back(failed);
    }
  }
  return result;
}

size_t McpRegistry::server_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.size();
}

size_t McpRegistry::tool_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tool_index_.size();
}

}  // namespace mcpterm::mcp
