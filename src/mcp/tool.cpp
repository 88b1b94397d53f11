#include "mcp/tool.hpp"

#include <algorithm>
#include <cctype>

#include "core/config.hpp"

namespace mcpterm::mcp {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

}  // namespace

// ============================================================
// QualifiedToolName
// ============================================================

std::string QualifiedToolName::to_string() const {
  return server + kQualifiedSeparator + tool;
}

std::optional<QualifiedToolName> QualifiedToolName::parse(const std::string &name) {
  auto pos = name.find(kQualifiedSeparator);
  if (pos == std::string::npos || pos == 0 || pos + 1 == name.size()) {
    return std::nullopt;
  }
  return QualifiedToolName{name.substr(0, pos), name.substr(pos + 1)};
}

// ============================================================
// ToolDescriptor
// ============================================================

std::vector<ParameterSchema> ToolDescriptor::parameters() const {
  std::vector<ParameterSchema> params;

  if (!input_schema.is_object() || !input_schema.contains("properties") || !input_schema["properties"].is_object()) {
    return params;
  }

  auto &props = input_schema["properties"];
  auto required_fields = input_schema.value("required", json::array());

  for (auto it = props.begin(); it != props.end(); ++it) {
    ParameterSchema param;
    param.name = it.key();
    if (it.value().is_object()) {
      auto type = it.value().value("type", json("string"));
      param.type = type.is_string() ? type.get<std::string>() : "string";
      param.description = it.value().value("description", "");

      if (it.value().contains("default")) {
        param.default_value = it.value()["default"];
      }

      if (it.value().contains("enum") && it.value()["enum"].is_array()) {
        std::vector<std::string> enum_vals;
        for (const auto &v : it.value()["enum"]) {
          enum_vals.push_back(v.is_string() ? v.get<std::string>() : v.dump());
        }
        param.enum_values = std::move(enum_vals);
      }
    } else {
      param.type = "string";
    }

    if (required_fields.is_array()) {
      param.required = std::any_of(required_fields.begin(), required_fields.end(), [&](const json &r) {
        return r.is_string() && r.get<std::string>() == param.name;
      });
    }

    params.push_back(std::move(param));
  }

  return params;
}

std::string ToolDescriptor::parameter_info() const {
  auto params = parameters();
  if (params.empty()) return "No parameters";

  std::string out;
  for (const auto &p : params) {
    if (!out.empty()) out += "\n";
    out += "--" + p.name + " (" + p.type + ") " + (p.required ? "(required)" : "(optional)");
    if (!p.description.empty()) out += ": " + p.description;
    if (p.enum_values) {
      std::string vals;
      for (const auto &v : *p.enum_values) {
        if (!vals.empty()) vals += ", ";
        vals += v;
      }
      out += " [" + vals + "]";
    }
    if (p.default_value) {
      out += " (default: " + p.default_value->dump() + ")";
    }
  }
  return out;
}

ToolDescriptor ToolDescriptor::from_json(const json &j, const std::string &server_name) {
  ToolDescriptor tool;
  tool.server_name = server_name;
  tool.name = j.value("name", "");

  auto desc = j.value("description", json());
  tool.description = desc.is_string() && !desc.get<std::string>().empty() ? desc.get<std::string>() : "No description";

  if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
    tool.input_schema = j["inputSchema"];
  } else {
    tool.input_schema = json{{"type", "object"}, {"properties", json::object()}};
  }
  return tool;
}

// ============================================================
// Argument coercion
// ============================================================

Result<json> parse_argument(const ParameterSchema &param, const std::string &text) {
  if (param.type == "integer") {
    try {
      size_t pos = 0;
      long long v = std::stoll(text, &pos);
      if (pos == text.size()) return Result<json>::success(v);
    } catch (const std::exception &) {
    }
    return Result<json>::failure(Error::usage("Invalid integer value for '" + param.name + "': " + text));
  }

  if (param.type == "number") {
    try {
      size_t pos = 0;
      double v = std::stod(text, &pos);
      if (pos == text.size()) return Result<json>::success(v);
    } catch (const std::exception &) {
    }
    return Result<json>::failure(Error::usage("Invalid number value for '" + param.name + "': " + text));
  }

  if (param.type == "boolean") {
    auto v = to_lower(text);
    return Result<json>::success(v == "true" || v == "yes" || v == "y" || v == "1");
  }

  if (param.type == "object" || param.type == "array") {
    try {
      auto v = json::parse(text);
      bool matches = param.type == "object" ? v.is_object() : v.is_array();
      if (matches) return Result<json>::success(std::move(v));
    } catch (const json::parse_error &) {
    }
    return Result<json>::failure(Error::usage("Invalid JSON " + param.type + " for '" + param.name + "': " + text));
  }

  return Result<json>::success(text);
}

// ============================================================
// Tool results
// ============================================================

ContentItem ContentItem::from_json(const json &j) {
  ContentItem item;
  item.raw = j;
  if (!j.is_object()) {
    item.type_name = "unknown";
    return item;
  }

  item.type_name = j.value("type", "unknown");
  if (item.type_name == "text") {
    item.type = ContentType::Text;
    item.text = j.value("text", "");
  } else if (item.type_name == "resource") {
    item.type = ContentType::Resource;
    if (j.contains("resource") && j["resource"].is_object()) {
      item.uri = j["resource"].value("uri", "");
      item.text = j["resource"].value("text", "");
    } else {
      item.uri = j.value("uri", "");
    }
  }
  return item;
}

std::string ToolResult::text() const {
  std::string out;
  for (const auto &item : content) {
    if (item.type != ContentType::Text) continue;
    if (!out.empty()) out += "\n";
    out += item.text;
  }
  return out;
}

ToolResult ToolResult::from_json(const json &result) {
  ToolResult r;
  r.raw = result;
  if (!result.is_object()) return r;

  r.is_error = result.contains("isError") && result["isError"].is_boolean() && result["isError"].get<bool>();
  if (result.contains("content") && result["content"].is_array()) {
    for (const auto &c : result["content"]) {
      r.content.push_back(ContentItem::from_json(c));
    }
  }
  return r;
}

}  // namespace mcpterm::mcp
