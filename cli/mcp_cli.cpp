#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/version.hpp"
#include "mcp/registry.hpp"

using namespace mcpterm;
using namespace mcpterm::mcp;

namespace {

void print_usage() {
  std::cerr << "Usage: mcpterm [--config PATH] [-v] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  servers                            List configured servers\n"
            << "  status                             Connect to all servers and show their status\n"
            << "  tools                              List tools from all connected servers\n"
            << "  tool-help <name>                   Show a tool's parameters\n"
            << "  call <name> [--server S] [k=v ...] Call a tool\n";
}

int fail(const Error &error) {
  std::cerr << "Error: " << error.describe() << "\n";
  return 1;
}

void print_servers(const Config &config) {
  if (config.servers.empty()) {
    std::cout << "No servers configured. Add entries to " << config_paths::config_file().string() << "\n";
    return;
  }

  for (const auto &s : config.servers) {
    std::string details;
    if (s.transport == TransportKind::Local) {
      details = s.command;
      for (const auto &arg : s.args) {
        details += " " + arg;
      }
    } else {
      details = s.url;
    }

    std::cout << s.name << "  [" << to_string(s.transport) << "]" << (s.enabled ? "" : " (disabled)") << "\n"
              << "    " << details << "\n";
    if (!s.description.empty()) {
      std::cout << "    " << s.description << "\n";
    }
  }
}

void print_status(const McpRegistry &registry) {
  for (const auto &s : registry.status()) {
    std::cout << (s.connected ? "[ok]   " : "[fail] ") << s.name << "  (" << to_string(s.transport) << ", " << s.tool_count
              << " tools, " << to_string(s.state) << ")";
    if (!s.error.empty()) {
      std::cout << "  " << s.error;
    }
    std::cout << "\n";
  }
}

void print_tools(const McpRegistry &registry) {
  auto tools = registry.list_tools();
  if (tools.empty()) {
    std::cout << "No tools available\n";
    return;
  }

  for (const auto &tool : tools) {
    std::cout << tool.qualified_name().to_string() << "\n    " << tool.description << "\n";
  }
  std::cout << "\nUse 'mcpterm tool-help <name>' to see tool usage\n";
}

void print_result(const ToolResult &result) {
  if (result.content.empty()) {
    std::cout << "Tool executed but returned no content\n";
    return;
  }

  for (const auto &item : result.content) {
    switch (item.type) {
      case ContentType::Text:
        std::cout << item.text << "\n";
        break;
      case ContentType::Resource:
        std::cout << "Resource: " << item.uri << "\n";
        break;
      case ContentType::Other:
        std::cout << item.raw.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        break;
    }
  }
}

// key=value pairs, typed by the tool's input schema
Result<json> build_arguments(const ToolDescriptor &tool, const std::vector<std::string> &pairs) {
  auto params = tool.parameters();
  json arguments = json::object();

  for (const auto &pair : pairs) {
    auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
      return Result<json>::failure(Error::usage("Expected key=value, got '" + pair + "'").with_tool(tool.name));
    }
    std::string key = pair.substr(0, eq);
    if (key.rfind("--", 0) == 0) key = key.substr(2);
    std::string value = pair.substr(eq + 1);

    ParameterSchema schema;
    schema.name = key;
    schema.type = "string";
    for (const auto &p : params) {
      if (p.name == key) {
        schema = p;
        break;
      }
    }

    auto parsed = parse_argument(schema, value);
    if (parsed.failed()) {
      auto error = *parsed.error;
      return Result<json>::failure(error.with_server(tool.server_name).with_tool(tool.name));
    }
    arguments[key] = *parsed.value;
  }

  for (const auto &p : params) {
    if (p.required && !arguments.contains(p.name)) {
      return Result<json>::failure(
          Error::usage("Missing required parameter '" + p.name + "'\n" + tool.parameter_info()).with_server(tool.server_name).with_tool(tool.name));
    }
  }
  return Result<json>::success(arguments);
}

}  // namespace

int main(int argc, char *argv[]) {
  // ===== Arguments =====
  std::string config_path;
  bool verbose = false;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else if (arg == "--version") {
      std::cout << kClientName << " " << kClientVersion << "\n";
      return 0;
    } else {
      args.push_back(std::move(arg));
    }
  }

  if (args.empty()) {
    print_usage();
    return 1;
  }

  // ===== Logging =====
  auto logger = spdlog::stderr_color_mt("mcpterm");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::warn);

  // ===== Configuration =====
  Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

  std::string level = config.log_level;
  if (const char *env_level = std::getenv("MCPTERM_LOG_LEVEL")) {
    level = env_level;
  }
  spdlog::set_level(verbose ? spdlog::level::debug : parse_log_level(level));

  const std::string &command = args[0];

  if (command == "servers") {
    print_servers(config);
    return 0;
  }

  if (command != "status" && command != "tools" && command != "tool-help" && command != "call") {
    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
  }

  // ===== Connect =====
  McpRegistry registry;
  registry.add_servers(config.servers);

  int rc = 0;
  if (command == "status") {
    print_status(registry);
  } else if (command == "tools") {
    print_tools(registry);
  } else if (command == "tool-help") {
    if (args.size() < 2) {
      print_usage();
      rc = 1;
    } else if (auto tool = registry.get_tool(args[1]); tool.failed()) {
      rc = fail(*tool.error);
    } else {
      std::cout << tool.value->qualified_name().to_string() << "\n"
                << tool.value->description << "\n\n"
                << "Parameters:\n"
                << tool.value->parameter_info() << "\n";
    }
  } else if (command == "call") {
    std::string name;
    std::string server;
    std::vector<std::string> pairs;
    for (size_t i = 1; i < args.size(); ++i) {
      if (args[i] == "--server" && i + 1 < args.size()) {
        server = args[++i];
      } else if (name.empty()) {
        name = args[i];
      } else {
        pairs.push_back(args[i]);
      }
    }

    if (name.empty()) {
      print_usage();
      rc = 1;
    } else {
      if (!server.empty() && name.find(kQualifiedSeparator) == std::string::npos) {
        name = QualifiedToolName{server, name}.to_string();
      }

      auto tool = registry.get_tool(name);
      if (tool.failed()) {
        rc = fail(*tool.error);
      } else if (auto arguments = build_arguments(*tool.value, pairs); arguments.failed()) {
        rc = fail(*arguments.error);
      } else {
        auto result = registry.call_tool(name, *arguments.value).get();
        if (result.failed()) {
          rc = fail(*result.error);
        } else {
          print_result(*result.value);
          rc = result.value->is_error ? 1 : 0;
        }
      }
    }
  }

  // ===== Shutdown =====
  registry.close();
  return rc;
}
