#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace mcpterm::mcp {

using json = nlohmann::json;

// "<server>:<tool>": the registry's primary key
struct QualifiedToolName {
  std::string server;
  std::string tool;

  std::string to_string() const;

  // Splits on the first separator; nullopt for bare names or empty halves
  static std::optional<QualifiedToolName> parse(const std::string &name);

  bool operator==(const QualifiedToolName &other) const {
    return server == other.server && tool == other.tool;
  }
};

// One property of a tool's input schema
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "integer", "number", "boolean", "object", "array"
  std::string description;
  bool required = false;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;
};

// Tool definition as advertised by tools/list
struct ToolDescriptor {
  std::string name;  // Underlying name, unique only within its server
  std::string description;
  json input_schema;  // JSON Schema
  std::string server_name;

  QualifiedToolName qualified_name() const {
    return {server_name, name};
  }

  std::vector<ParameterSchema> parameters() const;

  // One line per parameter, or "No parameters"
  std::string parameter_info() const;

  static ToolDescriptor from_json(const json &j, const std::string &server_name);
};

// Convert a textual argument to JSON according to the parameter type
Result<json> parse_argument(const ParameterSchema &param, const std::string &text);

enum class ContentType { Text, Resource, Other };

struct ContentItem {
  ContentType type = ContentType::Other;
  std::string type_name;  // As sent by the server
  std::string text;       // Text items
  std::string uri;        // Resource items
  json raw;

  static ContentItem from_json(const json &j);
};

// Normalized tools/call result
struct ToolResult {
  std::vector<ContentItem> content;
  bool is_error = false;  // The tool ran and reported failure
  json raw;

  // Text items joined by newlines
  std::string text() const;

  static ToolResult from_json(const json &result);
};

}  // namespace mcpterm::mcp
