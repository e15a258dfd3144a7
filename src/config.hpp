#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace deskbridge {

struct HttpListenConfig {
  std::string host = "127.0.0.1";
  int port = 4323;
};

struct GatewayConfig {
  // stdio | socket | http
  std::string transport = "stdio";
  HttpListenConfig listen;
  int heartbeat_interval_ms = 30000;

  std::string state_dir;
  std::string mailbox_root;
  std::string outbound_channel = "desktop";
  std::string inbound_channel = "gateway";
  int poll_interval_ms = 500;
  int request_timeout_ms = 30000;
  int watcher_interval_ms = 250;
  bool archive_consumed = false;

  std::string plugins_dir;
  std::vector<std::string> extra_plugin_dirs;

  std::string session_store_path;
  int64_t session_ttl_ms = 24LL * 60 * 60 * 1000;
  bool issue_session_on_initialize = true;

  std::string lock_dir;
  std::string log_file;
  std::string log_level = "info";

  std::string desktop_process_name;
  bool require_desktop_running = false;
  std::string desktop_config_path;
  // Started by restart_desktop. Host or guest syntax.
  std::string desktop_executable;

  // auto | host | guest
  std::string local_path_syntax = "auto";
  std::string peer_path_syntax = "host";
  std::string guest_distro;
};

// Fills every path left empty with a location under state_dir (which itself
// defaults to $HOME/.deskbridge).
void ResolveDefaultPaths(GatewayConfig* cfg);

GatewayConfig DefaultConfig();
bool ApplyConfigFile(const std::string& path, GatewayConfig* cfg, std::string* err);
void ApplyConfigEnv(GatewayConfig* cfg);

// Defaults, then DESKBRIDGE_CONFIG (or explicit_file), then DESKBRIDGE_* env.
GatewayConfig LoadConfig(const std::string& explicit_file, std::string* err);

bool TryParseBool(const std::string& s, bool* out);
std::vector<std::string> SplitCsv(const std::string& s);
std::string ToLower(std::string s);

}  // namespace deskbridge
