#include "desktop_actions.hpp"

#include "fs_util.hpp"
#include "log.hpp"

#include <chrono>
#include <system_error>
#include <thread>
#include <utility>

namespace deskbridge {

namespace {

std::string RequireString(const nlohmann::json& params, const char* key) {
  if (!params.is_object() || !params.contains(key) || !params[key].is_string() ||
      params[key].get<std::string>().empty()) {
    throw DesktopActionError(std::string("missing parameter: ") + key);
  }
  return params[key].get<std::string>();
}

const nlohmann::json& RequireObject(const nlohmann::json& params, const char* key) {
  if (!params.is_object() || !params.contains(key) || !params[key].is_object()) {
    throw DesktopActionError(std::string("parameter must be an object: ") + key);
  }
  return params[key];
}

}  // namespace

DesktopActions::DesktopActions(std::filesystem::path config_path, std::string process_name, const ProcessProbe* probe,
                               ProcessControl* control, std::string executable)
    : config_path_(std::move(config_path)),
      process_name_(std::move(process_name)),
      probe_(probe),
      control_(control),
      executable_(std::move(executable)) {}

std::filesystem::path DesktopActions::reload_signal_path() const { return config_path_.parent_path() / "reload_config"; }

ActionHandler DesktopActions::AsHandler() {
  return [this](const std::string& action, const nlohmann::json& params) { return Execute(action, params); };
}

nlohmann::json DesktopActions::Execute(const std::string& action, const nlohmann::json& params) {
  std::lock_guard<std::mutex> lock(mu_);
  if (action == "open_conversation") return OpenConversation(params);
  if (action == "switch_model") return SwitchModel(params);
  if (action == "add_mcp_server") return AddMcpServer(params);
  if (action == "update_mcp_config") return UpdateMcpConfig(params);
  if (action == "remove_mcp_server") return RemoveMcpServer(params);
  if (action == "desktop_status") return DesktopStatus();
  // restart_claude is the name older senders use.
  if (action == "restart_desktop" || action == "restart_claude") return RestartDesktop();
  LogInfo("desktop") << "Unknown action type: " << action;
  throw DesktopActionError("Unknown action type: " + action);
}

nlohmann::json DesktopActions::ReadConfig() const {
  std::error_code ec;
  if (!std::filesystem::exists(config_path_, ec)) {
    throw DesktopActionError("desktop config file not found: " + config_path_.string());
  }
  auto config = ReadJsonFile(config_path_);
  if (!config || !config->is_object()) {
    throw DesktopActionError("desktop config file is not a JSON object: " + config_path_.string());
  }
  return *config;
}

std::string DesktopActions::BackupConfig() const {
  const auto backup = config_path_.string() + ".backup." + std::to_string(NowMs());
  std::error_code ec;
  std::filesystem::copy_file(config_path_, backup, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) throw DesktopActionError("backup of " + config_path_.string() + " failed: " + ec.message());
  LogInfo("desktop") << "created backup at " << backup;
  return backup;
}

void DesktopActions::WriteConfig(const nlohmann::json& config) const {
  std::string err;
  if (!WriteJsonAtomic(config_path_, config, &err)) throw DesktopActionError(err);
}

void DesktopActions::SignalReload() const {
  std::string err;
  if (!WriteFileAtomic(reload_signal_path(), std::to_string(NowMs()), &err)) {
    throw DesktopActionError("reload signal: " + err);
  }
}

nlohmann::json DesktopActions::OpenConversation(const nlohmann::json& params) {
  const auto conversation_id = RequireString(params, "conversation_id");
  std::string err;
  const auto signal = config_path_.parent_path() / "open_conversation";
  if (!WriteFileAtomic(signal, conversation_id, &err)) throw DesktopActionError(err);
  LogInfo("desktop") << "open conversation " << conversation_id;
  return {{"conversation_id", conversation_id}, {"signal", signal.string()}};
}

nlohmann::json DesktopActions::SwitchModel(const nlohmann::json& params) {
  const auto model = RequireString(params, "model");
  auto config = ReadConfig();
  const auto backup = BackupConfig();
  const auto previous = config.value("defaultModel", std::string());
  config["defaultModel"] = model;
  WriteConfig(config);
  SignalReload();
  LogInfo("desktop") << "default model " << previous << " -> " << model;
  return {{"model", model}, {"previous", previous}, {"backup", backup}};
}

nlohmann::json DesktopActions::AddMcpServer(const nlohmann::json& params) {
  const auto name = RequireString(params, "name");
  const auto& server = RequireObject(params, "config");
  auto config = ReadConfig();
  const auto backup = BackupConfig();
  if (!config.contains("mcpServers") || !config["mcpServers"].is_object()) config["mcpServers"] = nlohmann::json::object();
  const bool replaced = config["mcpServers"].contains(name);
  config["mcpServers"][name] = server;
  WriteConfig(config);
  SignalReload();
  LogInfo("desktop") << (replaced ? "replaced" : "added") << " MCP server " << name;
  return {{"name", name}, {"replaced", replaced}, {"backup", backup}};
}

nlohmann::json DesktopActions::UpdateMcpConfig(const nlohmann::json& params) {
  const auto name = RequireString(params, "serverName");
  const auto& server = RequireObject(params, "config");
  auto config = ReadConfig();
  const auto backup = BackupConfig();
  if (!config.contains("mcpServers") || !config["mcpServers"].is_object()) config["mcpServers"] = nlohmann::json::object();
  config["mcpServers"][name] = server;

  bool auto_start = false;
  if (server.contains("autoStart") && server["autoStart"].is_boolean()) auto_start = server["autoStart"].get<bool>();
  if (auto_start) {
    if (!config.contains("autoStart") || !config["autoStart"].is_object()) {
      config["autoStart"] = {{"servers", nlohmann::json::array()}};
    }
    auto& servers = config["autoStart"]["servers"];
    if (!servers.is_array()) servers = nlohmann::json::array();
    bool present = false;
    for (const auto& s : servers) present = present || (s.is_string() && s.get<std::string>() == name);
    if (!present) servers.push_back(name);
  }
  WriteConfig(config);
  SignalReload();
  LogInfo("desktop") << "updated MCP config for " << name;
  return {{"serverName", name}, {"autoStart", auto_start}, {"backup", backup}};
}

nlohmann::json DesktopActions::RemoveMcpServer(const nlohmann::json& params) {
  const auto name = RequireString(params, "name");
  auto config = ReadConfig();
  if (!config.contains("mcpServers") || !config["mcpServers"].is_object() || !config["mcpServers"].contains(name)) {
    throw DesktopActionError("MCP server not configured: " + name);
  }
  const auto backup = BackupConfig();
  config["mcpServers"].erase(name);
  if (config.contains("autoStart") && config["autoStart"].is_object() && config["autoStart"].contains("servers") &&
      config["autoStart"]["servers"].is_array()) {
    auto& servers = config["autoStart"]["servers"];
    nlohmann::json kept = nlohmann::json::array();
    for (const auto& s : servers) {
      if (!(s.is_string() && s.get<std::string>() == name)) kept.push_back(s);
    }
    servers = kept;
  }
  WriteConfig(config);
  SignalReload();
  LogInfo("desktop") << "removed MCP server " << name;
  return {{"name", name}, {"backup", backup}};
}

nlohmann::json DesktopActions::DesktopStatus() const {
  ProbeResult r = ProbeResult::kUnknown;
  if (probe_ && !process_name_.empty()) r = probe_->ProbeName(process_name_);
  std::error_code ec;
  return {{"process", process_name_},
          {"probe", ProbeResultName(r)},
          {"config_path", config_path_.string()},
          {"config_present", std::filesystem::exists(config_path_, ec)}};
}

nlohmann::json DesktopActions::RestartDesktop() {
  if (!control_) throw DesktopActionError("process control is not available");
  if (executable_.empty()) throw DesktopActionError("desktop executable is not configured");
  if (!probe_ || process_name_.empty()) throw DesktopActionError("desktop process name is not configured");

  const bool was_running = probe_->ProbeName(process_name_) == ProbeResult::kRunning;
  if (was_running) {
    std::string err;
    if (!control_->Terminate(process_name_, &err)) throw DesktopActionError("stop " + process_name_ + ": " + err);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(exit_timeout_ms_);
    while (probe_->ProbeName(process_name_) == ProbeResult::kRunning) {
      if (std::chrono::steady_clock::now() >= deadline) {
        throw DesktopActionError(process_name_ + " still running after " + std::to_string(exit_timeout_ms_) + "ms");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }
  std::string err;
  if (!control_->Launch(executable_, &err)) throw DesktopActionError("start " + executable_ + ": " + err);
  LogInfo("desktop") << "restarted " << process_name_ << " was_running=" << was_running;
  return {{"process", process_name_}, {"was_running", was_running}, {"launched", true}, {"executable", executable_}};
}

}  // namespace deskbridge
