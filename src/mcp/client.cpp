#include "mcp/client.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "core/version.hpp"

namespace mcpterm::mcp {

// ============================================================
// ClientState helpers
// ============================================================

std::string to_string(ClientState state) {
  switch (state) {
    case ClientState::Disconnected:
      return "Disconnected";
    case ClientState::Handshaking:
      return "Handshaking";
    case ClientState::Ready:
      return "Ready";
    case ClientState::Closed:
      return "Closed";
  }
  return "Unknown";
}

// ============================================================
// McpClient
// ============================================================

McpClient::McpClient(const McpServerConfig &config) : config_(config) {
  config_error_ = config.validate();
  if (config_error_) {
    config_error_->with_server(config.name);
    return;
  }

  // Create transport based on server type
  switch (config.transport) {
    case TransportKind::Local:
      transport_ = std::make_unique<StdioTransport>(config.command, config.args, config.env, config.cwd);
      break;
    case TransportKind::Http:
      transport_ = std::make_unique<HttpTransport>(config.url, config.headers, config.timeout);
      break;
  }
}

McpClient::McpClient(const McpServerConfig &config, std::unique_ptr<Transport> transport)
    : config_(config), transport_(std::move(transport)) {
  config_error_ = config.validate();
  if (config_error_) {
    config_error_->with_server(config.name);
  } else if (!transport_) {
    config_error_ = Error::configuration("No transport supplied").with_server(config.name);
  }
}

McpClient::~McpClient() {
  disconnect();
}

std::future<Status> McpClient::connect() {
  if (config_error_) {
    state_ = ClientState::Closed;
    auto error = *config_error_;
    return std::async(std::launch::deferred, [error]() {
      return Status::failure(error);
    });
  }

  auto expected = ClientState::Disconnected;
  if (!state_.compare_exchange_strong(expected, ClientState::Handshaking)) {
    auto error = Error::usage("Session is " + to_string(expected) + "; create a new session to reconnect").with_server(config_.name);
    return std::async(std::launch::deferred, [error]() {
      return Status::failure(error);
    });
  }

  auto self = shared_from_this();
  return std::async(std::launch::async, [self]() -> Status {
    return self->handshake();
  });
}

void McpClient::disconnect() {
  auto previous = state_.exchange(ClientState::Closed);
  release_transport();
  if (previous == ClientState::Ready || previous == ClientState::Handshaking) {
    spdlog::info("[MCP] Session '{}' closed", config_.name);
  }
}

Status McpClient::handshake() {
  auto connected = transport_->connect().get();
  if (connected.failed()) {
    auto error = fail(*connected.error);
    spdlog::error("[MCP] Failed to connect transport for server '{}': {}", config_.name, error.message);
    return Status::failure(error);
  }

  // Set notification handler
  transport_->set_notification_handler([name = config_.name](const std::string &method, const json &params) {
    spdlog::debug("[MCP] Notification from '{}': {} {}", name, method, params.dump(-1, ' ', false, json::error_handler_t::replace));
  });

  if (auto status = initialize(); status.failed()) {
    spdlog::error("[MCP] Initialize handshake failed for server '{}': {}", config_.name, status.error->message);
    return status;
  }

  if (auto status = load_tools(); status.failed()) {
    spdlog::error("[MCP] tools/list failed for server '{}': {}", config_.name, status.error->message);
    return status;
  }

  // disconnect() may have raced with the handshake
  auto expected = ClientState::Handshaking;
  if (!state_.compare_exchange_strong(expected, ClientState::Ready)) {
    return Status::failure(fail(Error::transport("Session closed during handshake")));
  }

  spdlog::info("[MCP] Server '{}' is ready", config_.name);
  return Status::success();
}

Status McpClient::initialize() {
  json params{{"protocolVersion", kProtocolVersion},
              {"capabilities", json{{"tools", json::object()}}},
              {"clientInfo", json{{"name", kClientName}, {"version", kClientVersion}}}};

  auto resp = request("initialize", params);
  if (resp.failed()) return Status::failure(*resp.error);

  try {
    // Parse server capabilities
    const auto &result = resp.value->result.value_or(json::object());
    std::lock_guard<std::mutex> lock(mutex_);
    if (result.contains("capabilities") && result["capabilities"].is_object()) {
      auto &caps = result["capabilities"];
      capabilities_.supports_tools = caps.contains("tools");
      capabilities_.supports_resources = caps.contains("resources");
      capabilities_.supports_prompts = caps.contains("prompts");
      capabilities_.supports_logging = caps.contains("logging");
    }

    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
      auto &info = result["serverInfo"];
      server_info_.name = info.value("name", "unknown");
      server_info_.version = info.value("version", "unknown");
      spdlog::info("[MCP] Server '{}' info: {} v{}", config_.name, server_info_.name, server_info_.version);
    }
  } catch (const json::exception &e) {
    return Status::failure(fail(Error::protocol(std::string("Invalid initialize result: ") + e.what())));
  }

  // Send initialized notification
  JsonRpcNotification notif;
  notif.method = "notifications/initialized";
  transport_->send_notification(notif);

  return Status::success();
}

Status McpClient::load_tools() {
  auto resp = request("tools/list", json::object());
  if (resp.failed()) return Status::failure(*resp.error);

  std::vector<ToolDescriptor> tools;
  try {
    const auto &result = resp.value->result;
    if (result && result->is_object() && result->contains("tools") && (*result)["tools"].is_array()) {
      for (const auto &tool_json : (*result)["tools"]) {
        auto tool = ToolDescriptor::from_json(tool_json, config_.name);
        if (tool.name.empty()) {
          spdlog::warn("[MCP] Server '{}' advertised a tool without a name", config_.name);
          continue;
        }
        tools.push_back(std::move(tool));
      }
    }
  } catch (const json::exception &e) {
    return Status::failure(fail(Error::protocol(std::string("Invalid tools/list result: ") + e.what())));
  }

  spdlog::info("[MCP] Server '{}' provides {} tools", config_.name, tools.size());

  std::lock_guard<std::mutex> lock(mutex_);
  tools_ = std::move(tools);
  return Status::success();
}

Result<JsonRpcResponse> McpClient::request(const std::string &method, const json &params) {
  std::lock_guard<std::mutex> lock(call_mutex_);

  auto resp = transport_->send(method, params).get();
  if (resp.failed()) {
    // The channel is unusable after any transport failure
    return Result<JsonRpcResponse>::failure(fail(*resp.error));
  }

  if (!resp.value->ok()) {
    auto error = Error::protocol(method + " failed: " + resp.value->error_message()).with_server(config_.name);
    if (state_ == ClientState::Handshaking) {
      error = fail(std::move(error));
    } else {
      std::lock_guard<std::mutex> info_lock(mutex_);
      last_error_ = error;
    }
    return Result<JsonRpcResponse>::failure(error);
  }

  return resp;
}

Error McpClient::fail(Error error) {
  error.with_server(config_.name);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = error;
  }

  auto previous = state_.exchange(ClientState::Closed);
  if (previous != ClientState::Closed) {
    spdlog::warn("[MCP] Session '{}' closed after error: {}", config_.name, error.message);
  }
  release_transport();
  return error;
}

void McpClient::release_transport() {
  if (!transport_) return;
  try {
    transport_->disconnect();
  } catch (const std::exception &e) {
    spdlog::warn("[MCP] Error while disconnecting server '{}': {}", config_.name, e.what());
  }
}

std::vector<ToolDescriptor> McpClient::tools() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tools_;
}

std::future<Result<ToolResult>> McpClient::call_tool(const std::string &name, const json &arguments) {
  if (state_ != ClientState::Ready) {
    auto error = Error::usage("Server '" + config_.name + "' is not ready (" + to_string(state_.load()) + ")")
                     .with_server(config_.name)
                     .with_tool(name);
    return std::async(std::launch::deferred, [error]() {
      return Result<ToolResult>::failure(error);
    });
  }

  auto self = shared_from_this();
  return std::async(std::launch::async, [self, name, arguments]() -> Result<ToolResult> {
    spdlog::debug("[MCP] Calling '{}' on server '{}'", name, self->config_.name);

    auto resp = self->request("tools/call", json{{"name", name}, {"arguments", arguments}});
    if (resp.failed()) {
      auto error = *resp.error;
      error.with_tool(name);
      return Result<ToolResult>::failure(error);
    }

    try {
      return Result<ToolResult>::success(ToolResult::from_json(resp.value->result.value_or(json::object())));
    } catch (const json::exception &e) {
      return Result<ToolResult>::failure(
          Error::protocol(std::string("Invalid tools/call result: ") + e.what()).with_server(self->config_.name).with_tool(name));
    }
  });
}

ServerCapabilities McpClient::capabilities() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capabilities_;
}

ServerInfo McpClient::server_info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return server_info_;
}

std::optional<Error> McpClient::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

}  // namespace mcpterm::mcp
