#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcpterm {

// Error categories surfaced by the MCP core
enum class ErrorKind {
  Transport,      // spawn failure, pipe closed, malformed JSON, HTTP status, timeout
  Protocol,       // server answered with a JSON-RPC error object
  NotFound,       // unknown tool name
  Ambiguous,      // bare tool name exposed by several servers
  Configuration,  // missing required field for the transport kind
  Usage           // operation invalid in the current state
};

std::string to_string(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::Transport;
  std::string message;
  std::string server;                   // Server involved, if known
  std::string tool;                     // Tool involved, if known
  std::vector<std::string> candidates;  // Ambiguous: servers exposing the tool

  // "<kind> [server:tool]: message (candidates: a, b)"
  std::string describe() const;

  Error& with_server(std::string name) {
    if (server.empty()) server = std::move(name);
    return *this;
  }
  Error& with_tool(std::string name) {
    if (tool.empty()) tool = std::move(name);
    return *this;
  }

  static Error transport(std::string message) {
    return Error{ErrorKind::Transport, std::move(message), {}, {}, {}};
  }
  static Error protocol(std::string message) {
    return Error{ErrorKind::Protocol, std::move(message), {}, {}, {}};
  }
  static Error not_found(std::string message) {
    return Error{ErrorKind::NotFound, std::move(message), {}, {}, {}};
  }
  static Error ambiguous(std::string message, std::vector<std::string> servers) {
    return Error{ErrorKind::Ambiguous, std::move(message), {}, {}, std::move(servers)};
  }
  static Error configuration(std::string message) {
    return Error{ErrorKind::Configuration, std::move(message), {}, {}, {}};
  }
  static Error usage(std::string message) {
    return Error{ErrorKind::Usage, std::move(message), {}, {}, {}};
  }
};

// Result type for operations that produce a value or fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value() && !error.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(Error e) {
    Result r;
    r.error = std::move(e);
    return r;
  }
};

// Result of an operation without a value
struct Status {
  std::optional<Error> error;

  bool ok() const {
    return !error.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Status success() {
    return {};
  }

  static Status failure(Error e) {
    Status s;
    s.error = std::move(e);
    return s;
  }
};

}  // namespace mcpterm
