#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace mcpterm {

namespace fs = std::filesystem;

std::string to_string(TransportKind kind) {
  switch (kind) {
    case TransportKind::Local:
      return "stdio";
    case TransportKind::Http:
      return "http";
  }
  return "unknown";
}

std::optional<TransportKind> parse_transport_kind(const std::string &value) {
  if (value == "stdio" || value == "local") return TransportKind::Local;
  if (value == "http" || value == "sse" || value == "remote") return TransportKind::Http;
  return std::nullopt;
}

// ============================================================
// McpServerConfig
// ============================================================

std::optional<Error> McpServerConfig::validate() const {
  if (name.empty()) {
    return Error::configuration("server name must not be empty");
  }
  if (name.find(kQualifiedSeparator) != std::string::npos) {
    return Error::configuration("server name must not contain ':'").with_server(name);
  }
  if (transport == TransportKind::Local && command.empty()) {
    return Error::configuration("stdio servers require a command").with_server(name);
  }
  if (transport == TransportKind::Http && url.empty()) {
    return Error::configuration("HTTP servers require a URL").with_server(name);
  }
  if (timeout.count() <= 0) {
    return Error::configuration("timeout must be positive").with_server(name);
  }
  return std::nullopt;
}

json McpServerConfig::to_json() const {
  json j;
  j["name"] = name;
  j["transport"] = to_string(transport);
  if (!description.empty()) j["description"] = description;
  j["timeout"] = timeout.count();
  j["enabled"] = enabled;

  if (transport == TransportKind::Local) {
    j["command"] = command;
    if (!args.empty()) j["args"] = args;
    if (!env.empty()) j["env"] = env;
    if (!cwd.empty()) j["cwd"] = cwd;
  } else {
    j["url"] = url;
    if (!headers.empty()) j["headers"] = headers;
  }
  return j;
}

McpServerConfig McpServerConfig::from_json(const json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("server entry must be an object");
  }
  if (!j.contains("name") || !j["name"].is_string()) {
    throw std::invalid_argument("server entry requires a string 'name'");
  }

  McpServerConfig config;
  config.name = j["name"].get<std::string>();

  std::string transport = j.value("transport", "stdio");
  auto kind = parse_transport_kind(transport);
  if (!kind) {
    throw std::invalid_argument("unknown transport '" + transport + "' for server '" + config.name + "'");
  }
  config.transport = *kind;

  config.command = j.value("command", "");
  config.args = j.value("args", std::vector<std::string>{});
  config.env = j.value("env", std::map<std::string, std::string>{});
  config.cwd = j.value("cwd", "");
  config.url = j.value("url", "");
  config.headers = j.value("headers", std::map<std::string, std::string>{});
  config.description = j.value("description", "");
  config.timeout = std::chrono::seconds(j.value("timeout", 30));
  config.enabled = j.value("enabled", true);
  return config;
}

// ============================================================
// Config
// ============================================================

std::optional<McpServerConfig> Config::get_server(const std::string &name) const {
  for (const auto &server : servers) {
    if (server.name == name) return server;
  }
  return std::nullopt;
}

Config Config::load(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::debug("[Config] No config file at {}", path.string());
    return config;
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::exception &e) {
    spdlog::warn("[Config] Failed to load config from {}: {}", path.string(), e.what());
    return config;
  }

  if (!j.is_object()) {
    spdlog::warn("[Config] Ignoring config {}: top level is not an object", path.string());
    return config;
  }

  config.log_level = j.value("log_level", config.log_level);

  if (j.contains("servers") && j["servers"].is_array()) {
    for (const auto &entry : j["servers"]) {
      try {
        auto server = McpServerConfig::from_json(entry);
        if (auto error = server.validate()) {
          spdlog::warn("[Config] Skipping server '{}': {}", server.name, error->message);
          continue;
        }
        config.servers.push_back(std::move(server));
      } catch (const std::exception &e) {
        spdlog::warn("[Config] Invalid server config: {}", e.what());
      }
    }
  }

  return config;
}

Config Config::load_default() {
  return load(config_paths::config_file());
}

void Config::save(const fs::path &path) const {
  json j;
  j["log_level"] = log_level;
  j["servers"] = json::array();
  for (const auto &server : servers) {
    j["servers"].push_back(server.to_json());
  }

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to save config to " + path.string());
  }
  file << j.dump(2) << "\n";
}

// ============================================================
// config_paths
// ============================================================

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME"); home && *home) {
    return home;
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return fs::path(xdg) / "mcp-terminal";
  }
  return home_dir() / ".config" / "mcp-terminal";
}

fs::path config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace mcpterm
