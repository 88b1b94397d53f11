#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/types.hpp"

namespace mcpterm::mcp {

using json = nlohmann::json;

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string method;
  json params = json::object();
  std::string id;

  json to_json() const;
};

struct JsonRpcResponse {
  json id;  // As echoed by the server; may be a string, a number or null
  std::optional<json> result;
  std::optional<json> error;

  bool ok() const {
    return !error.has_value();
  }

  std::string error_message() const;

  // Id rendered as a string ("" for null), so "7" and 7 compare equal
  std::string id_string() const;

  // True for objects carrying an id together with a result or an error
  static bool is_response(const json &j);

  static JsonRpcResponse from_json(const json &j);
};

struct JsonRpcNotification {
  std::string method;
  json params = json::object();

  json to_json() const;
};

using ResponseFuture = std::future<Result<JsonRpcResponse>>;

// Issues request ids and matches responses back to their callers.
// Ids are decimal strings drawn from one process-wide counter starting at 1,
// so they strictly increase and are never reused by any session.
class RequestCorrelator {
 public:
  RequestCorrelator() = default;
  RequestCorrelator(const RequestCorrelator &) = delete;
  RequestCorrelator &operator=(const RequestCorrelator &) = delete;

  std::string next_id();

  // Register a pending request; the future resolves via resolve/fail
  ResponseFuture track(const std::string &id);

  // Deliver a response to the request with the same id.
  // Returns false for unmatched ids, which are dropped as noise.
  bool resolve(JsonRpcResponse response);

  // Deliver a response to a specific pending request regardless of the echoed id
  bool complete(const std::string &id, JsonRpcResponse response);

  bool fail(const std::string &id, const Error &error);
  void fail_all(const Error &error);

  bool is_pending(const std::string &id) const;
  size_t pending() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::promise<Result<JsonRpcResponse>>> pending_;
};

}  // namespace mcpterm::mcp
