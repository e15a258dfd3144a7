#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace deskbridge {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static HttpListenConfig ParseListen(const std::string& url, int default_port) {
  HttpListenConfig ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    s = s.substr(7);
  } else if (StartsWith(s, "tcp://")) {
    s = s.substr(6);
  }
  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) s = s.substr(0, slash_pos);

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static void ReadString(const nlohmann::json& j, const char* key, std::string* out) {
  if (j.contains(key) && j[key].is_string()) *out = j[key].get<std::string>();
}

static void ReadInt(const nlohmann::json& j, const char* key, int* out) {
  if (j.contains(key) && j[key].is_number_integer()) *out = j[key].get<int>();
}

static void ReadBool(const nlohmann::json& j, const char* key, bool* out) {
  if (j.contains(key) && j[key].is_boolean()) *out = j[key].get<bool>();
}

static void EnvInt(const char* name, int* out) {
  if (auto v = GetEnvStr(name); !v.empty()) {
    int n = std::atoi(v.c_str());
    if (n > 0) *out = n;
  }
}

static void EnvBool(const char* name, bool* out) {
  if (auto v = GetEnvStr(name); !v.empty()) {
    bool b = false;
    if (TryParseBool(v, &b)) *out = b;
  }
}

}  // namespace

std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  for (auto& v : out) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  }
  std::vector<std::string> filtered;
  for (auto& v : out) {
    if (!v.empty()) filtered.push_back(std::move(v));
  }
  return filtered;
}

GatewayConfig DefaultConfig() {
  return GatewayConfig{};
}

void ResolveDefaultPaths(GatewayConfig* cfg) {
  if (!cfg) return;
  if (cfg->state_dir.empty()) {
    auto home = GetEnvStr("HOME");
    if (home.empty()) home = ".";
    cfg->state_dir = (std::filesystem::path(home) / ".deskbridge").string();
  }
  const std::filesystem::path root(cfg->state_dir);
  if (cfg->mailbox_root.empty()) cfg->mailbox_root = (root / "mailbox").string();
  if (cfg->plugins_dir.empty()) cfg->plugins_dir = (root / "plugins").string();
  if (cfg->session_store_path.empty()) cfg->session_store_path = (root / "sessions.json").string();
  if (cfg->lock_dir.empty()) cfg->lock_dir = (root / "locks").string();
  if (cfg->log_file.empty()) cfg->log_file = (root / "logs" / "gateway.log").string();
  if (cfg->desktop_config_path.empty()) cfg->desktop_config_path = (root / "desktop_config.json").string();
}

bool ApplyConfigFile(const std::string& path, GatewayConfig* cfg, std::string* err) {
  if (!cfg) return false;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open config file: " + path;
    return false;
  }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "config file is not a JSON object: " + path;
    return false;
  }

  ReadString(j, "transport", &cfg->transport);
  if (j.contains("listen") && j["listen"].is_string()) {
    cfg->listen = ParseListen(j["listen"].get<std::string>(), cfg->listen.port);
  }
  ReadInt(j, "port", &cfg->listen.port);
  ReadInt(j, "heartbeat_interval_ms", &cfg->heartbeat_interval_ms);
  ReadString(j, "state_dir", &cfg->state_dir);
  ReadString(j, "mailbox_root", &cfg->mailbox_root);
  ReadString(j, "outbound_channel", &cfg->outbound_channel);
  ReadString(j, "inbound_channel", &cfg->inbound_channel);
  ReadInt(j, "poll_interval_ms", &cfg->poll_interval_ms);
  ReadInt(j, "request_timeout_ms", &cfg->request_timeout_ms);
  ReadInt(j, "watcher_interval_ms", &cfg->watcher_interval_ms);
  ReadBool(j, "archive_consumed", &cfg->archive_consumed);
  ReadString(j, "plugins_dir", &cfg->plugins_dir);
  if (j.contains("extra_plugin_dirs") && j["extra_plugin_dirs"].is_array()) {
    cfg->extra_plugin_dirs.clear();
    for (const auto& d : j["extra_plugin_dirs"]) {
      if (d.is_string()) cfg->extra_plugin_dirs.push_back(d.get<std::string>());
    }
  }
  ReadString(j, "session_store_path", &cfg->session_store_path);
  if (j.contains("session_ttl_ms") && j["session_ttl_ms"].is_number_integer()) {
    cfg->session_ttl_ms = j["session_ttl_ms"].get<int64_t>();
  }
  ReadBool(j, "issue_session_on_initialize", &cfg->issue_session_on_initialize);
  ReadString(j, "lock_dir", &cfg->lock_dir);
  ReadString(j, "log_file", &cfg->log_file);
  ReadString(j, "log_level", &cfg->log_level);
  ReadString(j, "desktop_process_name", &cfg->desktop_process_name);
  ReadBool(j, "require_desktop_running", &cfg->require_desktop_running);
  ReadString(j, "desktop_config_path", &cfg->desktop_config_path);
  ReadString(j, "desktop_executable", &cfg->desktop_executable);
  ReadString(j, "local_path_syntax", &cfg->local_path_syntax);
  ReadString(j, "peer_path_syntax", &cfg->peer_path_syntax);
  ReadString(j, "guest_distro", &cfg->guest_distro);
  return true;
}

void ApplyConfigEnv(GatewayConfig* cfg) {
  if (!cfg) return;
  if (auto t = GetEnvStr("DESKBRIDGE_TRANSPORT"); !t.empty()) cfg->transport = ToLower(t);
  if (auto listen = GetEnvStr("DESKBRIDGE_LISTEN"); !listen.empty()) cfg->listen = ParseListen(listen, cfg->listen.port);
  EnvInt("DESKBRIDGE_PORT", &cfg->listen.port);
  EnvInt("DESKBRIDGE_HEARTBEAT_MS", &cfg->heartbeat_interval_ms);
  if (auto dir = GetEnvStr("DESKBRIDGE_STATE_DIR"); !dir.empty()) cfg->state_dir = dir;
  if (auto dir = GetEnvStr("DESKBRIDGE_MAILBOX_ROOT"); !dir.empty()) cfg->mailbox_root = dir;
  if (auto ch = GetEnvStr("DESKBRIDGE_OUTBOUND_CHANNEL"); !ch.empty()) cfg->outbound_channel = ch;
  if (const char* ch = std::getenv("DESKBRIDGE_INBOUND_CHANNEL")) cfg->inbound_channel = ch;
  EnvInt("DESKBRIDGE_POLL_INTERVAL_MS", &cfg->poll_interval_ms);
  EnvInt("DESKBRIDGE_REQUEST_TIMEOUT_MS", &cfg->request_timeout_ms);
  EnvInt("DESKBRIDGE_WATCHER_INTERVAL_MS", &cfg->watcher_interval_ms);
  EnvBool("DESKBRIDGE_ARCHIVE_CONSUMED", &cfg->archive_consumed);
  if (auto dir = GetEnvStr("DESKBRIDGE_PLUGINS_DIR"); !dir.empty()) cfg->plugins_dir = dir;
  if (auto dirs = GetEnvStr("DESKBRIDGE_EXTRA_PLUGIN_DIRS"); !dirs.empty()) cfg->extra_plugin_dirs = SplitCsv(dirs);
  if (auto p = GetEnvStr("DESKBRIDGE_SESSION_STORE"); !p.empty()) cfg->session_store_path = p;
  EnvBool("DESKBRIDGE_ISSUE_SESSION_ON_INITIALIZE", &cfg->issue_session_on_initialize);
  if (auto dir = GetEnvStr("DESKBRIDGE_LOCK_DIR"); !dir.empty()) cfg->lock_dir = dir;
  if (auto f = GetEnvStr("DESKBRIDGE_LOG_FILE"); !f.empty()) cfg->log_file = f;
  if (auto lvl = GetEnvStr("DESKBRIDGE_LOG_LEVEL"); !lvl.empty()) cfg->log_level = ToLower(lvl);
  if (auto name = GetEnvStr("DESKBRIDGE_DESKTOP_PROCESS"); !name.empty()) cfg->desktop_process_name = name;
  EnvBool("DESKBRIDGE_REQUIRE_DESKTOP_RUNNING", &cfg->require_desktop_running);
  if (auto p = GetEnvStr("DESKBRIDGE_DESKTOP_CONFIG"); !p.empty()) cfg->desktop_config_path = p;
  if (auto p = GetEnvStr("DESKBRIDGE_DESKTOP_EXECUTABLE"); !p.empty()) cfg->desktop_executable = p;
  if (auto s = GetEnvStr("DESKBRIDGE_LOCAL_PATH_SYNTAX"); !s.empty()) cfg->local_path_syntax = ToLower(s);
  if (auto s = GetEnvStr("DESKBRIDGE_PEER_PATH_SYNTAX"); !s.empty()) cfg->peer_path_syntax = ToLower(s);
  if (auto d = GetEnvStr("DESKBRIDGE_GUEST_DISTRO"); !d.empty()) cfg->guest_distro = d;
  if (cfg->guest_distro.empty()) {
    // Set by WSL inside every guest shell.
    if (auto d = GetEnvStr("WSL_DISTRO_NAME"); !d.empty()) cfg->guest_distro = d;
  }
}

GatewayConfig LoadConfig(const std::string& explicit_file, std::string* err) {
  GatewayConfig cfg = DefaultConfig();
  std::string file = explicit_file;
  if (file.empty()) file = GetEnvStr("DESKBRIDGE_CONFIG");
  if (!file.empty()) {
    std::string ferr;
    if (!ApplyConfigFile(file, &cfg, &ferr) && err) *err = ferr;
  }
  ApplyConfigEnv(&cfg);
  ResolveDefaultPaths(&cfg);
  return cfg;
}

}  // namespace deskbridge
