#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace mcpterm {

using json = nlohmann::json;

// How a server is reached
enum class TransportKind { Local, Http };

std::string to_string(TransportKind kind);

// Accepts "stdio"/"local" and "http"/"sse"/"remote"
std::optional<TransportKind> parse_transport_kind(const std::string &value);

// Separator between server and tool in a qualified tool name
inline constexpr char kQualifiedSeparator = ':';

// MCP server configuration
struct McpServerConfig {
  std::string name;
  TransportKind transport = TransportKind::Local;

  // Local process
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;  // Overrides on top of the inherited environment
  std::string cwd;

  // HTTP
  std::string url;
  std::map<std::string, std::string> headers;

  std::string description;
  std::chrono::seconds timeout{30};
  bool enabled = true;

  // Configuration error when a required field for the transport kind is missing
  std::optional<Error> validate() const;

  json to_json() const;
  static McpServerConfig from_json(const json &j);  // throws std::invalid_argument
};

// Application configuration
struct Config {
  std::string log_level = "info";
  std::vector<McpServerConfig> servers;

  std::optional<McpServerConfig> get_server(const std::string &name) const;

  // Load from file; missing or corrupt files yield defaults
  static Config load(const std::filesystem::path &path);
  static Config load_default();

  // Throws std::runtime_error when the file cannot be written
  void save(const std::filesystem::path &path) const;
};

namespace config_paths {

std::filesystem::path home_dir();

// $XDG_CONFIG_HOME/mcp-terminal or ~/.config/mcp-terminal
std::filesystem::path config_dir();

std::filesystem::path config_file();

}  // namespace config_paths

}  // namespace mcpterm
