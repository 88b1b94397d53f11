#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "mcp/client.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/tool.hpp"
#include "mcp/transport.hpp"

using namespace mcpterm;
using namespace mcpterm::mcp;

// ============================================================
// JsonRpcTest: JSON-RPC 消息序列化
// ============================================================

TEST(JsonRpcTest, RequestSerialization) {
  JsonRpcRequest req;
  req.method = "initialize";
  req.id = "42";
  req.params = json{{"protocolVersion", "2024-11-05"}};

  auto j = req.to_json();

  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["method"], "initialize");
  EXPECT_EQ(j["id"], "42");
  EXPECT_EQ(j["params"]["protocolVersion"], "2024-11-05");
}

TEST(JsonRpcTest, RequestSerializationEmptyParams) {
  JsonRpcRequest req;
  req.method = "tools/list";
  req.id = "1";

  auto j = req.to_json();

  EXPECT_EQ(j["method"], "tools/list");
  // 空 params 不应被序列化
  EXPECT_FALSE(j.contains("params"));
}

TEST(JsonRpcTest, ResponseFromJson) {
  json j = {
      {"jsonrpc", "2.0"},
      {"id", "10"},
      {"result", {{"capabilities", {{"tools", json::object()}}}}},
  };

  auto resp = JsonRpcResponse::from_json(j);

  EXPECT_EQ(resp.id_string(), "10");
  EXPECT_TRUE(resp.ok());
  ASSERT_TRUE(resp.result.has_value());
  EXPECT_TRUE(resp.result->contains("capabilities"));
}

TEST(JsonRpcTest, NumericIdMatchesStringId) {
  auto resp = JsonRpcResponse::from_json(json{{"jsonrpc", "2.0"}, {"id", 7}, {"result", json::object()}});
  EXPECT_EQ(resp.id_string(), "7");

  auto null_id = JsonRpcResponse::from_json(json{{"jsonrpc", "2.0"}, {"id", nullptr}, {"result", "ok"}});
  EXPECT_EQ(null_id.id_string(), "");
  EXPECT_TRUE(null_id.ok());
}

TEST(JsonRpcTest, ResponseErrorMessage) {
  json j = {
      {"jsonrpc", "2.0"},
      {"id", "5"},
      {"error", {{"code", -32601}, {"message", "Method not found"}}},
  };

  auto resp = JsonRpcResponse::from_json(j);

  EXPECT_FALSE(resp.ok());
  EXPECT_EQ(resp.error_message(), "Method not found");
}

TEST(JsonRpcTest, ResponseErrorMessageWithoutMessageField) {
  auto resp = JsonRpcResponse::from_json(json{{"jsonrpc", "2.0"}, {"id", "6"}, {"error", {{"code", -32000}}}});

  EXPECT_FALSE(resp.ok());
  // 应包含序列化后的 JSON
  EXPECT_NE(resp.error_message().find("-32000"), std::string::npos);
}

TEST(JsonRpcTest, NullErrorIsNotAnError) {
  auto resp = JsonRpcResponse::from_json(json{{"jsonrpc", "2.0"}, {"id", "8"}, {"result", json::object()}, {"error", nullptr}});
  EXPECT_TRUE(resp.ok());
  EXPECT_EQ(resp.error_message(), "");
}

TEST(JsonRpcTest, IsResponse) {
  EXPECT_TRUE(JsonRpcResponse::is_response(json{{"id", "1"}, {"result", json::object()}}));
  EXPECT_TRUE(JsonRpcResponse::is_response(json{{"id", nullptr}, {"error", {{"message", "x"}}}}));
  EXPECT_FALSE(JsonRpcResponse::is_response(json{{"method", "notifications/progress"}}));
  EXPECT_FALSE(JsonRpcResponse::is_response(json{{"id", "1"}}));
  EXPECT_FALSE(JsonRpcResponse::is_response(json::array()));
}

TEST(JsonRpcTest, NotificationSerialization) {
  JsonRpcNotification notif;
  notif.method = "notifications/initialized";

  auto j = notif.to_json();

  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["method"], "notifications/initialized");
  // 通知消息不应包含 id 字段
  EXPECT_FALSE(j.contains("id"));
  EXPECT_FALSE(j.contains("params"));
}

// ============================================================
// RequestCorrelatorTest: 请求 id 分配与响应匹配
// ============================================================

TEST(RequestCorrelatorTest, IdsStrictlyIncrease) {
  RequestCorrelator correlator;
  auto first = std::stoll(correlator.next_id());
  auto second = std::stoll(correlator.next_id());
  auto third = std::stoll(correlator.next_id());
  EXPECT_GE(first, 1);
  EXPECT_LT(first, second);
  EXPECT_LT(second, third);
}

TEST(RequestCorrelatorTest, IdsAreNeverSharedBetweenSessions) {
  // 每个会话各自持有一个 correlator，但 id 在进程内全局唯一
  RequestCorrelator session_a;
  RequestCorrelator session_b;

  std::set<std::string> seen;
  for (int i = 0; i < 50; ++i) {
    EXPECT_TRUE(seen.insert(session_a.next_id()).second);
    EXPECT_TRUE(seen.insert(session_b.next_id()).second);
  }

  auto a = std::stoll(session_a.next_id());
  auto b = std::stoll(session_b.next_id());
  EXPECT_LT(a, b);
}

TEST(RequestCorrelatorTest, IdsAreUniqueAcrossThreads) {
  RequestCorrelator correlator;
  std::vector<std::vector<std::string>> ids(4);
  std::vector<std::thread> threads;
  for (size_t t = 0; t < ids.size(); ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 250; ++i) ids[t].push_back(correlator.next_id());
    });
  }
  for (auto &th : threads) th.join();

  std::set<std::string> all;
  for (const auto &v : ids) all.insert(v.begin(), v.end());
  EXPECT_EQ(all.size(), 1000u);
}

TEST(RequestCorrelatorTest, ResolveMatchesById) {
  RequestCorrelator correlator;
  auto first = correlator.track("1");
  auto second = correlator.track("2");
  EXPECT_EQ(correlator.pending(), 2u);

  EXPECT_TRUE(correlator.resolve(JsonRpcResponse::from_json(json{{"id", "2"}, {"result", "second"}})));
  EXPECT_TRUE(correlator.resolve(JsonRpcResponse::from_json(json{{"id", 1}, {"result", "first"}})));

  auto r1 = first.get();
  auto r2 = second.get();
  ASSERT_TRUE(r1.ok());
  ASSERT_TRUE(r2.ok());
  EXPECT_EQ(*r1.value->result, "first");
  EXPECT_EQ(*r2.value->result, "second");
  EXPECT_EQ(correlator.pending(), 0u);
}

TEST(RequestCorrelatorTest, UnmatchedIdIsDiscarded) {
  RequestCorrelator correlator;
  auto future = correlator.track("1");

  EXPECT_FALSE(correlator.resolve(JsonRpcResponse::from_json(json{{"id", "99"}, {"result", "noise"}})));
  EXPECT_TRUE(correlator.is_pending("1"));
  EXPECT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::timeout);

  correlator.fail("1", Error::transport("gone"));
  auto result = future.get();
  ASSERT_TRUE(result.failed());
  EXPECT_EQ(result.error->message, "gone");
}

TEST(RequestCorrelatorTest, FailAllResolvesEveryPending) {
  RequestCorrelator correlator;
  auto a = correlator.track("1");
  auto b = correlator.track("2");

  correlator.fail_all(Error::transport("Transport closed"));

  EXPECT_TRUE(a.get().failed());
  auto rb = b.get();
  ASSERT_TRUE(rb.failed());
  EXPECT_EQ(rb.error->kind, ErrorKind::Transport);
  EXPECT_EQ(correlator.pending(), 0u);
}

TEST(RequestCorrelatorTest, CompleteIgnoresEchoedId) {
  RequestCorrelator correlator;
  auto future = correlator.track("4");

  EXPECT_TRUE(correlator.complete("4", JsonRpcResponse::from_json(json{{"id", "something-else"}, {"result", 1}})));
  EXPECT_FALSE(correlator.complete("4", JsonRpcResponse{}));
  EXPECT_TRUE(future.get().ok());
}

// ============================================================
// State helpers
// ============================================================

TEST(TransportStateTest, ToString) {
  EXPECT_EQ(to_string(TransportState::Disconnected), "Disconnected");
  EXPECT_EQ(to_string(TransportState::Connecting), "Connecting");
  EXPECT_EQ(to_string(TransportState::Connected), "Connected");
  EXPECT_EQ(to_string(TransportState::Failed), "Failed");
}

TEST(ClientStateTest, ToString) {
  EXPECT_EQ(to_string(ClientState::Disconnected), "Disconnected");
  EXPECT_EQ(to_string(ClientState::Handshaking), "Handshaking");
  EXPECT_EQ(to_string(ClientState::Ready), "Ready");
  EXPECT_EQ(to_string(ClientState::Closed), "Closed");
}

// ============================================================
// QualifiedToolNameTest
// ============================================================

TEST(QualifiedToolNameTest, FormatAndParse) {
  QualifiedToolName name{"serverA", "search"};
  EXPECT_EQ(name.to_string(), "serverA:search");

  auto parsed = QualifiedToolName::parse("serverA:search");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, name);

  // Only the first separator splits
  auto nested = QualifiedToolName::parse("srv:ns:tool");
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->server, "srv");
  EXPECT_EQ(nested->tool, "ns:tool");

  EXPECT_FALSE(QualifiedToolName::parse("search").has_value());
  EXPECT_FALSE(QualifiedToolName::parse(":search").has_value());
  EXPECT_FALSE(QualifiedToolName::parse("srv:").has_value());
}

// ============================================================
// ToolDescriptorTest: 工具描述与参数转换
// ============================================================

TEST(ToolDescriptorTest, ParameterConversion) {
  auto tool = ToolDescriptor::from_json(json{{"name", "read_file"},
                                             {"description", "Read a file from disk"},
                                             {"inputSchema",
                                              {{"type", "object"},
                                               {"properties",
                                                {{"path", {{"type", "string"}, {"description", "File path to read"}}},
                                                 {"encoding",
                                                  {{"type", "string"},
                                                   {"description", "File encoding"},
                                                   {"default", "utf-8"},
                                                   {"enum", json::array({"utf-8", "ascii", "latin1"})}}}}},
                                               {"required", json::array({"path"})}}}},
                                        "test-server");

  EXPECT_EQ(tool.server_name, "test-server");
  EXPECT_EQ(tool.qualified_name().to_string(), "test-server:read_file");

  auto params = tool.parameters();
  ASSERT_EQ(params.size(), 2u);

  const ParameterSchema *path_param = nullptr;
  const ParameterSchema *encoding_param = nullptr;
  for (const auto &p : params) {
    if (p.name == "path") path_param = &p;
    if (p.name == "encoding") encoding_param = &p;
  }

  ASSERT_NE(path_param, nullptr);
  EXPECT_EQ(path_param->type, "string");
  EXPECT_EQ(path_param->description, "File path to read");
  EXPECT_TRUE(path_param->required);
  EXPECT_FALSE(path_param->default_value.has_value());
  EXPECT_FALSE(path_param->enum_values.has_value());

  ASSERT_NE(encoding_param, nullptr);
  EXPECT_FALSE(encoding_param->required);
  ASSERT_TRUE(encoding_param->default_value.has_value());
  EXPECT_EQ(encoding_param->default_value.value(), "utf-8");
  ASSERT_TRUE(encoding_param->enum_values.has_value());
  ASSERT_EQ(encoding_param->enum_values->size(), 3u);
  EXPECT_EQ((*encoding_param->enum_values)[2], "latin1");
}

TEST(ToolDescriptorTest, DefaultsForMissingFields) {
  auto tool = ToolDescriptor::from_json(json{{"name", "noop"}}, "srv");

  EXPECT_EQ(tool.description, "No description");
  EXPECT_EQ(tool.input_schema, (json{{"type", "object"}, {"properties", json::object()}}));
  EXPECT_TRUE(tool.parameters().empty());
  EXPECT_EQ(tool.parameter_info(), "No parameters");
}

TEST(ToolDescriptorTest, ParameterInfo) {
  auto tool = ToolDescriptor::from_json(
      json{{"name", "add"},
           {"inputSchema",
            {{"type", "object"},
             {"properties", {{"a", {{"type", "integer"}, {"description", "First"}}}, {"b", {{"type", "integer"}}}}},
             {"required", json::array({"a"})}}}},
      "calc");

  EXPECT_EQ(tool.parameter_info(), "--a (integer) (required): First\n--b (integer) (optional)");
}

// ============================================================
// ParseArgumentTest: 命令行参数类型转换
// ============================================================

namespace {

ParameterSchema param(const std::string &type) {
  ParameterSchema p;
  p.name = "value";
  p.type = type;
  return p;
}

}  // namespace

TEST(ParseArgumentTest, Integer) {
  auto ok = parse_argument(param("integer"), "42");
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(*ok.value, 42);

  auto bad = parse_argument(param("integer"), "4.2");
  ASSERT_TRUE(bad.failed());
  EXPECT_EQ(bad.error->kind, ErrorKind::Usage);
  EXPECT_NE(bad.error->message.find("value"), std::string::npos);

  EXPECT_TRUE(parse_argument(param("integer"), "abc").failed());
}

TEST(ParseArgumentTest, Number) {
  auto ok = parse_argument(param("number"), "2.5");
  ASSERT_TRUE(ok.ok());
  EXPECT_DOUBLE_EQ(ok.value->get<double>(), 2.5);

  EXPECT_TRUE(parse_argument(param("number"), "2.5x").failed());
}

TEST(ParseArgumentTest, Boolean) {
  for (const char *text : {"true", "YES", "y", "1"}) {
    auto r = parse_argument(param("boolean"), text);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(*r.value, true) << text;
  }
  for (const char *text : {"false", "no", "0", "off"}) {
    auto r = parse_argument(param("boolean"), text);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(*r.value, false) << text;
  }
}

TEST(ParseArgumentTest, ObjectAndArray) {
  auto obj = parse_argument(param("object"), R"({"k": 1})");
  ASSERT_TRUE(obj.ok());
  EXPECT_EQ((*obj.value)["k"], 1);

  auto arr = parse_argument(param("array"), "[1, 2, 3]");
  ASSERT_TRUE(arr.ok());
  EXPECT_EQ(arr.value->size(), 3u);

  EXPECT_TRUE(parse_argument(param("object"), "[1]").failed());
  EXPECT_TRUE(parse_argument(param("array"), "{not json").failed());
}

TEST(ParseArgumentTest, StringIsVerbatim) {
  auto r = parse_argument(param("string"), "  hello world ");
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(*r.value, "  hello world ");
}

// ============================================================
// ToolResultTest: tools/call 结果归一化
// ============================================================

TEST(ToolResultTest, NormalizesContentItems) {
  auto result = ToolResult::from_json(json{{"content",
                                            json::array({
                                                {{"type", "text"}, {"text", "pong"}},
                                                {{"type", "resource"}, {"resource", {{"uri", "file:///tmp/a.txt"}, {"text", "A"}}}},
                                                {{"type", "image"}, {"data", "aGk="}, {"mimeType", "image/png"}},
                                                {{"type", "text"}, {"text", "second"}},
                                            })}});

  ASSERT_EQ(result.content.size(), 4u);
  EXPECT_FALSE(result.is_error);

  EXPECT_EQ(result.content[0].type, ContentType::Text);
  EXPECT_EQ(result.content[0].text, "pong");

  EXPECT_EQ(result.content[1].type, ContentType::Resource);
  EXPECT_EQ(result.content[1].uri, "file:///tmp/a.txt");

  EXPECT_EQ(result.content[2].type, ContentType::Other);
  EXPECT_EQ(result.content[2].type_name, "image");
  EXPECT_EQ(result.content[2].raw["mimeType"], "image/png");

  EXPECT_EQ(result.text(), "pong\nsecond");
}

TEST(ToolResultTest, ErrorFlagAndEmptyContent) {
  auto failed = ToolResult::from_json(json{{"isError", true}, {"content", json::array({{{"type", "text"}, {"text", "bad input"}}})}});
  EXPECT_TRUE(failed.is_error);
  EXPECT_EQ(failed.text(), "bad input");

  auto empty = ToolResult::from_json(json::object());
  EXPECT_TRUE(empty.content.empty());
  EXPECT_EQ(empty.text(), "");
}

// ============================================================
// McpClientTest: 会话状态
// ============================================================

TEST(McpClientTest, InvalidConfigFailsBeforeIo) {
  McpServerConfig config;
  config.name = "broken";
  config.transport = TransportKind::Local;  // No command

  auto client = std::make_shared<McpClient>(config);
  auto status = client->connect().get();

  ASSERT_TRUE(status.failed());
  EXPECT_EQ(status.error->kind, ErrorKind::Configuration);
  EXPECT_EQ(status.error->server, "broken");
  EXPECT_EQ(client->state(), ClientState::Closed);
}

TEST(McpClientTest, CallToolBeforeReadyIsUsageError) {
  McpServerConfig config;
  config.name = "idle";
  config.command = "/bin/cat";

  auto client = std::make_shared<McpClient>(config);
  EXPECT_EQ(client->state(), ClientState::Disconnected);

  auto result = client->call_tool("anything", json::object()).get();
  ASSERT_TRUE(result.failed());
  EXPECT_EQ(result.error->kind, ErrorKind::Usage);
  EXPECT_EQ(result.error->server, "idle");
  EXPECT_EQ(result.error->tool, "anything");
}
