#include <gtest/gtest.h>

#include "desktop_actions.hpp"
#include "fs_util.hpp"
#include "test_util.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

using namespace deskbridge;
using nlohmann::json;

namespace {

// Records calls; a successful Terminate marks the process as exited.
class FakeControl : public ProcessControl {
 public:
  explicit FakeControl(test::FakeProbe* probe) : probe_(probe) {}

  bool Terminate(const std::string& name, std::string* err) override {
    calls.push_back("terminate " + name);
    if (!terminate_ok) {
      if (err) *err = "access denied";
      return false;
    }
    if (process_exits) probe_->SetName(name, ProbeResult::kNotRunning);
    return true;
  }

  bool Launch(const std::string& executable, std::string* err) override {
    calls.push_back("launch " + executable);
    if (!launch_ok) {
      if (err) *err = "not executable";
      return false;
    }
    return true;
  }

  std::vector<std::string> calls;
  bool terminate_ok = true;
  bool launch_ok = true;
  bool process_exits = true;

 private:
  test::FakeProbe* probe_;
};

constexpr const char* kExe = "C:\\Users\\u\\AppData\\Local\\AnthropicClaude\\Claude.exe";

}  // namespace

class DesktopActionsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_path_ = dir_ / "claude_desktop_config.json";
    test::WriteText(config_path_, json{{"defaultModel", "sonnet"},
                                       {"mcpServers", {{"fs", {{"command", "npx"}}}}},
                                       {"autoStart", {{"servers", json::array({"fs"})}}}}
                                      .dump());
  }

  json Config() { return json::parse(test::ReadText(config_path_)); }

  test::TempDir dir_;
  std::filesystem::path config_path_;
  test::FakeProbe probe_;
};

TEST_F(DesktopActionsTest, SwitchModelBacksUpAndSignalsReload) {
  DesktopActions actions(config_path_, "Claude.exe", &probe_);
  auto r = actions.Execute("switch_model", {{"model", "opus"}});
  EXPECT_EQ(r["model"], "opus");
  EXPECT_EQ(r["previous"], "sonnet");
  EXPECT_EQ(Config()["defaultModel"], "opus");
  EXPECT_TRUE(std::filesystem::exists(actions.reload_signal_path()));

  const std::string backup = r["backup"];
  EXPECT_EQ(backup.rfind(config_path_.string() + ".backup.", 0), 0u);
  EXPECT_EQ(json::parse(test::ReadText(backup))["defaultModel"], "sonnet");
}

TEST_F(DesktopActionsTest, AddMcpServerAddsOrReplaces) {
  DesktopActions actions(config_path_, "", nullptr);
  auto r = actions.Execute("add_mcp_server", {{"name", "git"}, {"config", {{"command", "git-mcp"}}}});
  EXPECT_EQ(r["replaced"], false);
  EXPECT_EQ(Config()["mcpServers"]["git"]["command"], "git-mcp");

  r = actions.Execute("add_mcp_server", {{"name", "fs"}, {"config", {{"command", "fs2"}}}});
  EXPECT_EQ(r["replaced"], true);
  EXPECT_EQ(Config()["mcpServers"]["fs"]["command"], "fs2");

  EXPECT_THROW(actions.Execute("add_mcp_server", {{"name", "bad"}, {"config", "nope"}}), DesktopActionError);
}

TEST_F(DesktopActionsTest, UpdateMcpConfigRegistersAutoStartOnce) {
  DesktopActions actions(config_path_, "", nullptr);
  json server = {{"command", "search"}, {"autoStart", true}};
  auto r = actions.Execute("update_mcp_config", {{"serverName", "search"}, {"config", server}});
  EXPECT_EQ(r["autoStart"], true);
  actions.Execute("update_mcp_config", {{"serverName", "search"}, {"config", server}});

  auto config = Config();
  EXPECT_EQ(config["mcpServers"]["search"], server);
  EXPECT_EQ(config["autoStart"]["servers"], json::array({"fs", "search"}));

  r = actions.Execute("update_mcp_config", {{"serverName", "quiet"}, {"config", {{"command", "q"}}}});
  EXPECT_EQ(r["autoStart"], false);
  EXPECT_EQ(Config()["autoStart"]["servers"].size(), 2u);
}

TEST_F(DesktopActionsTest, RemoveMcpServerAlsoLeavesAutoStart) {
  DesktopActions actions(config_path_, "", nullptr);
  actions.Execute("remove_mcp_server", {{"name", "fs"}});
  auto config = Config();
  EXPECT_FALSE(config["mcpServers"].contains("fs"));
  EXPECT_EQ(config["autoStart"]["servers"], json::array());

  EXPECT_THROW(actions.Execute("remove_mcp_server", {{"name", "fs"}}), DesktopActionError);
}

TEST_F(DesktopActionsTest, OpenConversationWritesSignal) {
  DesktopActions actions(config_path_, "", nullptr);
  auto r = actions.Execute("open_conversation", {{"conversation_id", "conv-42"}});
  EXPECT_EQ(r["conversation_id"], "conv-42");
  EXPECT_EQ(test::ReadText(r["signal"].get<std::string>()), "conv-42");
}

TEST_F(DesktopActionsTest, UnknownActionAndMissingParameters) {
  DesktopActions actions(config_path_, "", nullptr);
  try {
    actions.Execute("format_disk", json::object());
    FAIL() << "expected DesktopActionError";
  } catch (const DesktopActionError& e) {
    EXPECT_STREQ(e.what(), "Unknown action type: format_disk");
  }
  EXPECT_THROW(actions.Execute("switch_model", json::object()), DesktopActionError);
  EXPECT_EQ(Config()["defaultModel"], "sonnet");
}

TEST_F(DesktopActionsTest, MissingConfigFails) {
  DesktopActions actions(dir_ / "absent.json", "", nullptr);
  EXPECT_THROW(actions.Execute("switch_model", {{"model", "opus"}}), DesktopActionError);
  EXPECT_FALSE(std::filesystem::exists(actions.reload_signal_path()));
}

TEST_F(DesktopActionsTest, StatusReportsProbe) {
  probe_.SetName("Claude.exe", ProbeResult::kRunning);
  DesktopActions actions(config_path_, "Claude.exe", &probe_);
  auto r = actions.Execute("desktop_status", json::object());
  EXPECT_EQ(r["probe"], ProbeResultName(ProbeResult::kRunning));
  EXPECT_EQ(r["config_present"], true);
}

TEST_F(DesktopActionsTest, ServesAsMailboxHandler) {
  DesktopActions actions(config_path_, "", nullptr);
  MailboxLayout layout{dir_ / "mailbox", "desktop"};
  ResponderOptions ro;
  ro.layout = layout;
  MailboxResponder responder(ro, actions.AsHandler());

  MailboxItem request;
  request.id = "req-1";
  request.action = "switch_model";
  request.params = {{"model", "haiku"}};
  request.timestamp = NowMs();
  std::string err;
  ASSERT_TRUE(WriteJsonAtomic(layout.RequestPath("req-1"), request.ToJson(), &err)) << err;
  ASSERT_TRUE(responder.ProcessRequestFile(layout.RequestPath("req-1")));

  auto response = ReadJsonFile(layout.ResponsePath("req-1"));
  ASSERT_TRUE(response.has_value());
  EXPECT_EQ((*response)["status"], "completed");
  EXPECT_EQ((*response)["result"]["model"], "haiku");
  EXPECT_EQ(Config()["defaultModel"], "haiku");
}

TEST_F(DesktopActionsTest, RestartStopsRunningAppThenLaunches) {
  probe_.SetName("Claude.exe", ProbeResult::kRunning);
  FakeControl control(&probe_);
  DesktopActions actions(config_path_, "Claude.exe", &probe_, &control, kExe);

  auto r = actions.Execute("restart_desktop", json::object());
  EXPECT_EQ(r["was_running"], true);
  EXPECT_EQ(r["launched"], true);
  EXPECT_EQ(r["executable"], kExe);
  EXPECT_EQ(control.calls, (std::vector<std::string>{"terminate Claude.exe", std::string("launch ") + kExe}));
}

TEST_F(DesktopActionsTest, RestartLaunchesWhenNotRunning) {
  FakeControl control(&probe_);
  DesktopActions actions(config_path_, "Claude.exe", &probe_, &control, kExe);

  // The name older senders use.
  auto r = actions.Execute("restart_claude", json::object());
  EXPECT_EQ(r["was_running"], false);
  EXPECT_EQ(control.calls, (std::vector<std::string>{std::string("launch ") + kExe}));
}

TEST_F(DesktopActionsTest, RestartFailuresAreActionErrors) {
  probe_.SetName("Claude.exe", ProbeResult::kRunning);
  FakeControl control(&probe_);
  DesktopActions actions(config_path_, "Claude.exe", &probe_, &control, kExe);
  actions.set_exit_timeout_ms(100);

  control.terminate_ok = false;
  EXPECT_THROW(actions.Execute("restart_desktop", json::object()), DesktopActionError);

  control.terminate_ok = true;
  control.process_exits = false;
  try {
    actions.Execute("restart_desktop", json::object());
    FAIL() << "expected DesktopActionError";
  } catch (const DesktopActionError& e) {
    EXPECT_NE(std::string(e.what()).find("still running"), std::string::npos);
  }

  probe_.SetName("Claude.exe", ProbeResult::kNotRunning);
  control.launch_ok = false;
  EXPECT_THROW(actions.Execute("restart_desktop", json::object()), DesktopActionError);
  // Launch is never attempted while the old process is still up.
  EXPECT_EQ(control.calls.back(), std::string("launch ") + kExe);
  EXPECT_EQ(std::count(control.calls.begin(), control.calls.end(), std::string("launch ") + kExe), 1);
}

TEST_F(DesktopActionsTest, RestartNeedsControlAndExecutable) {
  FakeControl control(&probe_);
  DesktopActions no_control(config_path_, "Claude.exe", &probe_);
  EXPECT_THROW(no_control.Execute("restart_desktop", json::object()), DesktopActionError);
  DesktopActions no_exe(config_path_, "Claude.exe", &probe_, &control);
  EXPECT_THROW(no_exe.Execute("restart_desktop", json::object()), DesktopActionError);
  EXPECT_TRUE(control.calls.empty());
}
