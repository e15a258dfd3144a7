#pragma once

#include "errors.hpp"
#include "watcher.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace deskbridge {

enum class MailboxStatus { kPending, kInProgress, kCompleted, kFailed };

const char* MailboxStatusName(MailboxStatus s);
bool ParseMailboxStatus(const std::string& s, MailboxStatus* out);
int StatusRank(MailboxStatus s);
bool IsTerminal(MailboxStatus s);

struct MailboxItem {
  std::string id;
  std::string action;
  nlohmann::json params = nlohmann::json::object();
  MailboxStatus status = MailboxStatus::kPending;
  int64_t timestamp = 0;
  std::string source;
  std::optional<int64_t> completed_at;
  nlohmann::json result;
  std::optional<std::string> error;

  nlohmann::json ToJson() const;
  static std::optional<MailboxItem> FromJson(const nlohmann::json& j, std::string* err);
};

// <root>/<channel>/{outbox,inbox,archive}
struct MailboxLayout {
  std::filesystem::path root;
  std::string channel;

  std::filesystem::path channel_dir() const { return root / channel; }
  std::filesystem::path outbox() const { return channel_dir() / "outbox"; }
  std::filesystem::path inbox() const { return channel_dir() / "inbox"; }
  std::filesystem::path archive() const { return channel_dir() / "archive"; }
  std::filesystem::path RequestPath(const std::string& id) const { return outbox() / (id + ".json"); }
  std::filesystem::path ResponsePath(const std::string& id) const { return inbox() / (id + ".json"); }

  bool EnsureDirs(std::string* err) const;
};

// Rewrites the item at `path` with status `to` and the completion fields of
// `update`. Refused when the stored status ranks the same or higher, so a
// status never moves backwards.
bool AdvanceStatus(const std::filesystem::path& path, MailboxStatus to, const MailboxItem* update, std::string* err);

struct MailboxOptions {
  MailboxLayout layout;
  std::string source = "gateway";
  std::string id_prefix = "req";
  int poll_interval_ms = 500;
  int parse_retry_initial_ms = 20;
  int default_timeout_ms = 30000;
  int watcher_interval_ms = 250;
  bool archive_consumed = false;
};

// Sender side of a channel: publishes requests to the outbox and waits for
// the matching response in the inbox.
class MailboxBridge {
 public:
  explicit MailboxBridge(MailboxOptions opts);
  ~MailboxBridge();
  MailboxBridge(const MailboxBridge&) = delete;
  MailboxBridge& operator=(const MailboxBridge&) = delete;

  // Returns the id of the published pending request.
  std::optional<std::string> Send(const std::string& action, const nlohmann::json& params, GatewayError* err);

  // Waits for a terminal response to `id`. timeout_ms <= 0 uses the default.
  // On success the response (and its request) are consumed.
  std::optional<MailboxItem> AwaitResponse(const std::string& id, int timeout_ms, GatewayError* err);

  // Send + AwaitResponse. A failed response becomes kExecutionError.
  std::optional<MailboxItem> Call(const std::string& action, const nlohmann::json& params, int timeout_ms,
                                  GatewayError* err);

  // Startup cleanup of files left by a previous lifetime.
  void Reconcile();

  void StartReaper();
  void StopReaper();
  // Reaper callback: disposes of one inbox file nobody is waiting for.
  bool ReapFile(const std::filesystem::path& file);

  size_t InFlightCount() const;
  size_t AbandonedCount() const;
  bool IsAbandoned(const std::string& id) const;
  int reaper_restarts() const;

  const MailboxOptions& options() const { return opts_; }

 private:
  void Abandon(const std::string& id, int64_t now_ms);
  void Consume(const std::string& id);
  void PruneAbandoned(int64_t now_ms);

  MailboxOptions opts_;
  mutable std::mutex mu_;
  std::set<std::string> in_flight_;
  std::map<std::string, int64_t> abandoned_;
  std::unique_ptr<Watcher> reaper_;
};

// Runs one action and returns its result; throwing marks the item failed.
using ActionHandler = std::function<nlohmann::json(const std::string& action, const nlohmann::json& params)>;

struct ResponderOptions {
  MailboxLayout layout;
  std::string source = "desktop";
  int watcher_interval_ms = 250;
  // How often ids whose request file is gone are dropped from the seen set.
  int seen_prune_interval_ms = 5000;
};

// Responder side of a channel: claims pending requests from the outbox, runs
// them, and publishes the responses to the inbox.
class MailboxResponder {
 public:
  MailboxResponder(ResponderOptions opts, ActionHandler handler);
  ~MailboxResponder();
  MailboxResponder(const MailboxResponder&) = delete;
  MailboxResponder& operator=(const MailboxResponder&) = delete;

  // Answers requests a crash left in_progress and finalizes requests that
  // already have a response.
  void Reconcile();

  void Start();
  void Stop();

  // Watcher callback. Returns false (refused) for a file that cannot be
  // parsed yet.
  bool ProcessRequestFile(const std::filesystem::path& file);

  size_t processed_count() const { return processed_.load(); }
  size_t seen_count() const;

 private:
  bool Respond(const MailboxItem& request, MailboxStatus status, nlohmann::json result,
               std::optional<std::string> error);
  void PruneSeenLocked(int64_t now_ms);

  ResponderOptions opts_;
  ActionHandler handler_;
  mutable std::mutex mu_;
  std::set<std::string> seen_;
  int64_t last_prune_ms_ = 0;
  std::atomic<size_t> processed_{0};
  std::unique_ptr<Watcher> watcher_;
};

}  // namespace deskbridge
