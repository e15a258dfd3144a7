#pragma once

#include "mailbox.hpp"
#include "process_probe.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>

namespace deskbridge {

class DesktopActionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Actions run next to the desktop application by `deskbridge respond`. Each
// config edit first copies the config to `<config>.backup.<ms>` and then
// touches `reload_config` beside it so the application picks the change up.
class DesktopActions {
 public:
  // `control` and `executable` are needed only by restart_desktop.
  DesktopActions(std::filesystem::path config_path, std::string process_name, const ProcessProbe* probe,
                 ProcessControl* control = nullptr, std::string executable = {});

  // Throws DesktopActionError on failure, including an unknown action.
  nlohmann::json Execute(const std::string& action, const nlohmann::json& params);

  ActionHandler AsHandler();

  const std::filesystem::path& config_path() const { return config_path_; }
  std::filesystem::path reload_signal_path() const;

  // How long restart_desktop waits for the old process to exit.
  void set_exit_timeout_ms(int ms) { exit_timeout_ms_ = ms; }

 private:
  nlohmann::json ReadConfig() const;
  std::string BackupConfig() const;
  void WriteConfig(const nlohmann::json& config) const;
  void SignalReload() const;

  nlohmann::json OpenConversation(const nlohmann::json& params);
  nlohmann::json SwitchModel(const nlohmann::json& params);
  nlohmann::json AddMcpServer(const nlohmann::json& params);
  nlohmann::json UpdateMcpConfig(const nlohmann::json& params);
  nlohmann::json RemoveMcpServer(const nlohmann::json& params);
  nlohmann::json DesktopStatus() const;
  nlohmann::json RestartDesktop();

  std::filesystem::path config_path_;
  std::string process_name_;
  const ProcessProbe* probe_;
  ProcessControl* control_;
  std::string executable_;
  int exit_timeout_ms_ = 5000;
  std::mutex mu_;
};

}  // namespace deskbridge
