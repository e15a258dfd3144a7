#include <gtest/gtest.h>

#include "builtin_tools.hpp"
#include "dispatcher.hpp"
#include "test_util.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace deskbridge;
using nlohmann::json;

class DispatcherTest : public ::testing::Test {
 protected:
  DispatcherTest() : sessions_(MakeMemorySessionStore(), [this] { return now_.load(); }, 1000) {
    config_.issue_session_on_initialize = true;
    config_.request_timeout_ms = 3000;

    MailboxOptions mo;
    mo.layout = layout_;
    mo.poll_interval_ms = 10;
    mo.parse_retry_initial_ms = 5;
    bridge_ = std::make_unique<MailboxBridge>(mo);

    services_.config = &config_;
    services_.registry = &registry_;
    services_.sessions = &sessions_;
    services_.bridge = bridge_.get();
    services_.translator = &translator_;
    services_.probe = &probe_;
    services_.local_syntax = PathSyntax::kGuest;
    services_.peer_syntax = PathSyntax::kHost;
    RegisterBuiltinTools(services_, &registry_);
    RegisterTestTools();
    dispatcher_ = std::make_unique<Dispatcher>(services_);
  }

  ~DispatcherTest() override {
    if (desktop_) desktop_->Stop();
  }

  void RegisterTestTools() {
    std::string err;
    ToolDefinition read_file;
    read_file.name = "read_file";
    read_file.parameter_schema = {
        {"type", "object"},
        {"properties", {{"path", {{"type", "string"}}}, {"files", {{"type", "array"}, {"items", {{"type", "string"}}}}}}},
    };
    read_file.invoke = MailboxInvoke{"read_file", 0, {"path", "files"}, false};
    read_file.origin = "test";
    ASSERT_TRUE(registry_.RegisterTool(read_file, &err)) << err;

    ToolDefinition slow;
    slow.name = "slow";
    slow.parameter_schema = {{"type", "object"}};
    slow.invoke = MailboxInvoke{"slow", 50, {}, false};
    ASSERT_TRUE(registry_.RegisterTool(slow, &err)) << err;

    ToolDefinition boom;
    boom.name = "boom";
    boom.parameter_schema = {{"type", "object"}};
    boom.invoke = LocalInvoke{[](const json&) -> ToolResult { throw std::runtime_error("kaboom"); }};
    ASSERT_TRUE(registry_.RegisterTool(boom, &err)) << err;

    ToolDefinition block;
    block.name = "block";
    block.parameter_schema = {{"type", "object"}};
    block.invoke = LocalInvoke{[this](const json&) {
      entered_ = true;
      test::WaitFor([this] { return release_.load(); }, 5000);
      ToolResult r;
      r.result = {{"released", true}};
      return r;
    }};
    ASSERT_TRUE(registry_.RegisterTool(block, &err)) << err;
  }

  // Answers every request like the desktop side would, echoing what it got.
  void StartDesktop() {
    ResponderOptions ro;
    ro.layout = layout_;
    ro.watcher_interval_ms = 10;
    desktop_ = std::make_unique<MailboxResponder>(ro, [this](const std::string& action, const json& params) {
      std::lock_guard<std::mutex> lock(mu_);
      last_action_ = action;
      last_params_ = params;
      return json{{"action", action}, {"params", params}};
    });
    desktop_->Start();
  }

  json Send(const json& envelope, ClientContext* ctx = nullptr) {
    auto out = dispatcher_->HandleRaw(envelope.dump(), ctx ? ctx : &ctx_);
    if (!out) return nullptr;
    return json::parse(*out);
  }

  json Request(int id, const std::string& method, json params = json::object(), ClientContext* ctx = nullptr) {
    return Send({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}}, ctx);
  }

  json CallTool(int id, const std::string& name, json arguments, ClientContext* ctx = nullptr) {
    return Request(id, "tools/call", {{"name", name}, {"arguments", std::move(arguments)}}, ctx);
  }

  json Initialize(ClientContext* ctx = nullptr) {
    return Request(1, "initialize", {{"protocolVersion", "2024-11-05"}, {"clientInfo", {{"name", "test-client"}}}},
                   ctx);
  }

  static json ToolPayload(const json& response) {
    return json::parse(response["result"]["content"][0]["text"].get<std::string>());
  }

  test::TempDir dir_;
  MailboxLayout layout_{dir_.path(), "desktop"};
  std::atomic<int64_t> now_{1000000};
  GatewayConfig config_;
  ToolRegistry registry_;
  SessionAuthority sessions_;
  std::unique_ptr<MailboxBridge> bridge_;
  PathTranslator translator_;
  test::FakeProbe probe_;
  GatewayServices services_;
  std::unique_ptr<Dispatcher> dispatcher_;
  ClientContext ctx_;

  std::atomic<bool> entered_{false};
  std::atomic<bool> release_{false};
  std::mutex mu_;
  std::string last_action_;
  json last_params_;
  std::unique_ptr<MailboxResponder> desktop_;
};

TEST_F(DispatcherTest, UnknownToolIsToolNotFound) {
  auto r = CallTool(7, "foo_bar", json::object());
  EXPECT_EQ(r["jsonrpc"], "2.0");
  EXPECT_EQ(r["id"], 7);
  EXPECT_FALSE(r.contains("result"));
  EXPECT_EQ(r["error"]["code"], -32001);
  EXPECT_EQ(r["error"]["data"]["name"], "foo_bar");
  EXPECT_EQ(r["error"]["data"]["kind"], "ToolNotFound");
}

TEST_F(DispatcherTest, UnknownMethodIsMethodNotFound) {
  auto r = Request(2, "sampling/createMessage");
  EXPECT_EQ(r["id"], 2);
  EXPECT_EQ(r["error"]["code"], -32601);
}

TEST_F(DispatcherTest, UnparseableInputIsParseErrorWithNullId) {
  auto out = dispatcher_->HandleRaw("{\"jsonrpc\": \"2.0\", \"id\": 4, ", &ctx_);
  ASSERT_TRUE(out.has_value());
  auto r = json::parse(*out);
  EXPECT_TRUE(r["id"].is_null());
  EXPECT_EQ(r["error"]["code"], -32700);
}

TEST_F(DispatcherTest, MalformedEnvelopesAreInvalidRequests) {
  auto r = Send(json::array({1, 2}));
  EXPECT_TRUE(r["id"].is_null());
  EXPECT_EQ(r["error"]["code"], -32600);

  r = Send({{"jsonrpc", "2.0"}, {"id", 3}});
  EXPECT_EQ(r["id"], 3);
  EXPECT_EQ(r["error"]["code"], -32600);

  r = Send({{"jsonrpc", "2.0"}, {"id", {{"nested", true}}}, {"method", "ping"}});
  EXPECT_EQ(r["error"]["code"], -32600);
}

TEST_F(DispatcherTest, NotificationsAndHeartbeatRepliesGetNoResponse) {
  EXPECT_TRUE(Send({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).is_null());
  EXPECT_TRUE(Send({{"jsonrpc", "2.0"}, {"id", "hb-1"}, {"result", json::object()}}).is_null());
}

TEST_F(DispatcherTest, PingAndEmptyCatalogs) {
  EXPECT_EQ(Request(5, "ping")["result"], json::object());
  EXPECT_EQ(Request(6, "resources/list")["result"]["resources"], json::array());
  EXPECT_EQ(Request(7, "prompts/list")["result"]["prompts"], json::array());
}

TEST_F(DispatcherTest, InitializeNegotiatesAndIssuesSession) {
  auto r = Initialize();
  const auto& result = r["result"];
  EXPECT_EQ(result["protocolVersion"], "2024-11-05");
  EXPECT_EQ(result["serverInfo"]["name"], kServerName);
  EXPECT_TRUE(result["capabilities"].contains("tools"));
  const auto& session = result["_meta"]["session"];
  ASSERT_TRUE(session["sessionId"].is_string());
  EXPECT_FALSE(session["sessionToken"].get<std::string>().empty());
  EXPECT_EQ(session["expiresAt"], now_.load() + 1000);
  EXPECT_EQ(ctx_.client_name(), "test-client");
  ASSERT_TRUE(ctx_.session().has_value());
  EXPECT_EQ(ctx_.session()->id, session["sessionId"]);

  ClientContext other;
  EXPECT_EQ(Request(1, "initialize", {{"protocolVersion", "2025-03-26"}}, &other)["result"]["protocolVersion"],
            "2025-03-26");
  EXPECT_EQ(Request(1, "initialize", {{"protocolVersion", "1999-01-01"}}, &other)["result"]["protocolVersion"],
            kDefaultProtocolVersion);
}

TEST_F(DispatcherTest, InitializeWithoutSessionsWhenDisabled) {
  config_.issue_session_on_initialize = false;
  auto r = Initialize();
  EXPECT_FALSE(r["result"].contains("_meta"));
  EXPECT_FALSE(ctx_.session().has_value());
}

TEST_F(DispatcherTest, ToolsListKeepsRegistrationOrder) {
  auto tools = Request(2, "tools/list")["result"]["tools"];
  ASSERT_EQ(tools.size(), registry_.size());
  const std::vector<std::string> expected = {
      "bridge_status", "convert_path", "open_conversation", "switch_model", "execute_from_code",
      "restart_desktop", "read_file", "slow", "boom", "block"};
  for (size_t i = 0; i < expected.size(); i++) EXPECT_EQ(tools[i]["name"], expected[i]);
  EXPECT_EQ(tools[3]["inputSchema"]["required"], json::array({"model"}));
  EXPECT_TRUE(tools[0].contains("description"));
}

TEST_F(DispatcherTest, SchemaViolationsAreValidationErrors) {
  Initialize();
  auto r = CallTool(3, "switch_model", {{"model", 42}});
  EXPECT_EQ(r["error"]["code"], -32602);
  EXPECT_EQ(r["error"]["data"]["tool"], "switch_model");
  ASSERT_TRUE(r["error"]["data"]["errors"].is_array());
  EXPECT_EQ(r["error"]["data"]["errors"][0], "/model: expected string, got integer");

  r = CallTool(4, "switch_model", json::object());
  EXPECT_EQ(r["error"]["data"]["errors"][0], "/: missing required property \"model\"");

  r = Request(5, "tools/call", {{"name", "switch_model"}, {"arguments", json::array()}});
  EXPECT_EQ(r["error"]["code"], -32602);
  r = Request(6, "tools/call", {{"arguments", json::object()}});
  EXPECT_EQ(r["error"]["code"], -32602);
}

TEST_F(DispatcherTest, MailboxToolWithoutCredentialsIsRejected) {
  auto r = CallTool(3, "switch_model", {{"model", "opus"}});
  EXPECT_EQ(r["error"]["code"], -32010);
  EXPECT_EQ(r["error"]["data"]["kind"], "SessionInvalid");
  EXPECT_TRUE(std::filesystem::is_empty(layout_.outbox()));
}

TEST_F(DispatcherTest, ExpiredSessionIsRejected) {
  Initialize();
  now_ += 1000;
  auto r = CallTool(3, "switch_model", {{"model", "opus"}});
  EXPECT_EQ(r["error"]["code"], -32011);
}

TEST_F(DispatcherTest, WrongSecretIsRejected) {
  GatewayError err;
  auto token = sessions_.Issue("someone", &err);
  ASSERT_TRUE(token.has_value());
  auto r = Request(3, "tools/call",
                   {{"name", "switch_model"},
                    {"arguments", {{"model", "opus"}}},
                    {"_meta", {{"sessionId", token->id}, {"sessionToken", "not-the-secret"}}}});
  EXPECT_EQ(r["error"]["code"], -32010);
}

TEST_F(DispatcherTest, MailboxToolRoundTripsThroughTheDesktop) {
  StartDesktop();
  Initialize();
  auto r = CallTool(8, "switch_model", {{"model", "opus"}});
  ASSERT_TRUE(r.contains("result")) << r.dump();
  EXPECT_EQ(r["id"], 8);
  EXPECT_EQ(r["result"]["isError"], false);
  EXPECT_EQ(r["result"]["content"][0]["type"], "text");
  auto payload = ToolPayload(r);
  EXPECT_EQ(payload["action"], "switch_model");
  EXPECT_EQ(payload["params"], json({{"model", "opus"}}));
}

TEST_F(DispatcherTest, CredentialsMayTravelInMetaOrArguments) {
  StartDesktop();
  GatewayError err;
  auto token = sessions_.Issue("script", &err);
  ASSERT_TRUE(token.has_value());

  ClientContext fresh;
  auto r = Request(3, "tools/call",
                   {{"name", "open_conversation"},
                    {"arguments", {{"conversation_id", "c-1"}}},
                    {"_meta", {{"sessionId", token->id}, {"sessionToken", token->secret}}}},
                   &fresh);
  ASSERT_TRUE(r.contains("result")) << r.dump();

  r = CallTool(4, "open_conversation",
               {{"conversation_id", "c-2"}, {"session_id", token->id}, {"session_token", token->secret}}, &fresh);
  ASSERT_TRUE(r.contains("result")) << r.dump();
  std::lock_guard<std::mutex> lock(mu_);
  EXPECT_EQ(last_params_, json({{"conversation_id", "c-2"}}));
}

TEST_F(DispatcherTest, ForwardedActionsUseTheirOwnName) {
  StartDesktop();
  Initialize();
  auto r = CallTool(3, "execute_from_code", {{"action", "add_mcp_server"}, {"params", {{"name", "fs"}}}});
  ASSERT_TRUE(r.contains("result")) << r.dump();
  std::lock_guard<std::mutex> lock(mu_);
  EXPECT_EQ(last_action_, "add_mcp_server");
  EXPECT_EQ(last_params_, json({{"name", "fs"}}));
}

TEST_F(DispatcherTest, PathArgumentsAreTranslatedForThePeer) {
  StartDesktop();
  Initialize();
  auto r = CallTool(3, "read_file",
                    {{"path", "/mnt/c/Users/a/f.txt"}, {"files", {"/mnt/d/x", "E:\\already\\host"}}});
  ASSERT_TRUE(r.contains("result")) << r.dump();
  std::lock_guard<std::mutex> lock(mu_);
  EXPECT_EQ(last_params_["path"], "C:\\Users\\a\\f.txt");
  EXPECT_EQ(last_params_["files"][0], "D:\\x");
  EXPECT_EQ(last_params_["files"][1], "E:\\already\\host");
}

TEST_F(DispatcherTest, UntranslatablePathArgumentFailsBeforeSending) {
  Initialize();
  auto r = CallTool(3, "read_file", {{"path", "notes/relative.txt"}});
  EXPECT_EQ(r["error"]["code"], -32021);
  EXPECT_EQ(r["error"]["data"]["argument"], "path");
  EXPECT_TRUE(std::filesystem::is_empty(layout_.outbox()));
}

TEST_F(DispatcherTest, RequiresDesktopWhenConfigured) {
  config_.require_desktop_running = true;
  config_.desktop_process_name = "Claude.exe";
  Initialize();
  auto r = CallTool(3, "switch_model", {{"model", "opus"}});
  EXPECT_EQ(r["error"]["code"], -32000);
  EXPECT_EQ(r["error"]["data"]["process"], "Claude.exe");
  EXPECT_TRUE(std::filesystem::is_empty(layout_.outbox()));

  probe_.SetName("Claude.exe", ProbeResult::kRunning);
  StartDesktop();
  r = CallTool(4, "switch_model", {{"model", "opus"}});
  EXPECT_TRUE(r.contains("result")) << r.dump();
}

TEST_F(DispatcherTest, UnansweredToolTimesOut) {
  Initialize();
  auto r = CallTool(3, "slow", json::object());
  EXPECT_EQ(r["error"]["code"], -32002);
  EXPECT_EQ(r["error"]["data"]["tool"], "slow");
  EXPECT_EQ(r["error"]["data"]["timeout_ms"], 50);
  EXPECT_TRUE(r["error"]["data"]["id"].is_string());
}

TEST_F(DispatcherTest, LocalToolsNeedNoSession) {
  ClientContext fresh;
  auto r = CallTool(3, "convert_path", {{"path", "C:\\Users\\a\\f.txt"}, {"direction", "to_guest"}}, &fresh);
  ASSERT_TRUE(r.contains("result")) << r.dump();
  EXPECT_EQ(ToolPayload(r)["translated"], "/mnt/c/Users/a/f.txt");

  r = CallTool(4, "convert_path", {{"path", "relative"}, {"direction", "to_guest"}}, &fresh);
  EXPECT_EQ(r["error"]["code"], -32021);

  r = CallTool(5, "bridge_status", json::object(), &fresh);
  ASSERT_TRUE(r.contains("result"));
  auto status = ToolPayload(r);
  EXPECT_EQ(status["mailbox"]["channel"], "desktop");
  EXPECT_EQ(status["peer_path_syntax"], "host");
}

TEST_F(DispatcherTest, ThrowingLocalToolIsExecutionError) {
  auto r = CallTool(3, "boom", json::object());
  EXPECT_EQ(r["error"]["code"], -32000);
  EXPECT_EQ(r["error"]["message"], "kaboom");
  EXPECT_EQ(r["error"]["data"]["tool"], "boom");
}

TEST_F(DispatcherTest, DuplicateInFlightIdIsDropped) {
  std::optional<std::string> first;
  std::thread t([&] {
    first = dispatcher_->HandleRaw(
        json{{"jsonrpc", "2.0"}, {"id", 11}, {"method", "tools/call"}, {"params", {{"name", "block"}}}}.dump(), &ctx_);
  });
  ASSERT_TRUE(test::WaitFor([&] { return entered_.load(); }, 5000));
  EXPECT_TRUE(Request(11, "ping").is_null());
  // Another id on the same connection is unaffected.
  EXPECT_EQ(Request(12, "ping")["result"], json::object());
  release_ = true;
  t.join();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(ToolPayload(json::parse(*first))["released"], true);
  // Once answered the id may be reused.
  EXPECT_EQ(Request(11, "ping")["id"], 11);
}

TEST_F(DispatcherTest, UnserializableResponseBecomesInternalError) {
  auto out = json::parse(SerializeEnvelope(MakeResult(5, {{"text", std::string("bad \xff\xfe bytes")}})));
  EXPECT_EQ(out["id"], 5);
  EXPECT_EQ(out["error"]["code"], -32603);

  out = json::parse(SerializeEnvelope(MakeResult(std::string("\xc3\x28"), json::object())));
  EXPECT_TRUE(out["id"].is_null());
  EXPECT_EQ(out["error"]["code"], -32603);
}

TEST_F(DispatcherTest, InboundHandlerRunsLocalToolsOnly) {
  auto handler = dispatcher_->InboundHandler();
  auto result = handler("convert_path", {{"path", "/mnt/c/x"}, {"direction", "to_host"}});
  EXPECT_EQ(result["translated"], "C:\\x");
  EXPECT_THROW(handler("switch_model", {{"model", "m"}}), std::runtime_error);
  try {
    handler("nope", json::object());
    FAIL() << "expected an exception";
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "Unknown action type: nope");
  }
}
