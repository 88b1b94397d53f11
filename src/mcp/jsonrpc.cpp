#include "mcp/jsonrpc.hpp"

namespace mcpterm::mcp {

// ============================================================
// JSON-RPC 2.0 serialization
// ============================================================

json JsonRpcRequest::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  j["id"] = id;
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

std::string JsonRpcResponse::error_message() const {
  if (!error.has_value()) return "";
  auto &err = error.value();
  if (err.is_object() && err.contains("message") && err["message"].is_string()) {
    return err["message"].get<std::string>();
  }
  if (err.is_string()) return err.get<std::string>();
  return err.dump();
}

std::string JsonRpcResponse::id_string() const {
  if (id.is_string()) return id.get<std::string>();
  if (id.is_null()) return "";
  return id.dump();
}

bool JsonRpcResponse::is_response(const json &j) {
  return j.is_object() && j.contains("id") && (j.contains("result") || j.contains("error"));
}

JsonRpcResponse JsonRpcResponse::from_json(const json &j) {
  JsonRpcResponse resp;
  if (j.contains("id")) {
    resp.id = j["id"];
  }
  if (j.contains("result")) {
    resp.result = j["result"];
  }
  if (j.contains("error") && !j["error"].is_null()) {
    resp.error = j["error"];
  }
  return resp;
}

json JsonRpcNotification::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

// ============================================================
// RequestCorrelator
// ============================================================

std::string RequestCorrelator::next_id() {
  // Shared by every session in the process
  static std::atomic<int64_t> counter{1};
  return std::to_string(counter.fetch_add(1));
}

ResponseFuture RequestCorrelator::track(const std::string &id) {
  std::promise<Result<JsonRpcResponse>> promise;
  auto future = promise.get_future();

  std::lock_guard<std::mutex> lock(mutex_);
  pending_[id] = std::move(promise);
  return future;
}

bool RequestCorrelator::resolve(JsonRpcResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(response.id_string());
  if (it == pending_.end()) return false;

  it->second.set_value(Result<JsonRpcResponse>::success(std::move(response)));
  pending_.erase(it);
  return true;
}

bool RequestCorrelator::complete(const std::string &id, JsonRpcResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end()) return false;

  it->second.set_value(Result<JsonRpcResponse>::success(std::move(response)));
  pending_.erase(it);
  return true;
}

bool RequestCorrelator::fail(const std::string &id, const Error &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end()) return false;

  it->second.set_value(Result<JsonRpcResponse>::failure(error));
  pending_.erase(it);
  return true;
}

void RequestCorrelator::fail_all(const Error &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[id, promise] : pending_) {
    promise.set_value(Result<JsonRpcResponse>::failure(error));
  }
  pending_.clear();
}

bool RequestCorrelator::is_pending(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count(id) > 0;
}

size_t RequestCorrelator::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

}  // namespace mcpterm::mcp
