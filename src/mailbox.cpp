#include "mailbox.hpp"

#include "fs_util.hpp"
#include "log.hpp"
#include "session_authority.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace deskbridge {

namespace {

// Abandoned ids are remembered this long for late responses.
constexpr int64_t kAbandonedRetentionMs = 60LL * 60 * 1000;

void SleepMs(int64_t ms) {
  if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

bool RemoveIfExists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::remove(p, ec);
}

std::optional<MailboxItem> ReadItem(const std::filesystem::path& path, std::string* err) {
  auto j = ReadJsonFile(path);
  if (!j) {
    if (err) *err = "unreadable or malformed JSON";
    return std::nullopt;
  }
  return MailboxItem::FromJson(*j, err);
}

std::vector<std::filesystem::path> ListItems(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) return out;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.empty() || name[0] == '.' || it->path().extension() != ".json") continue;
    out.push_back(it->path());
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace

const char* MailboxStatusName(MailboxStatus s) {
  switch (s) {
    case MailboxStatus::kPending:
      return "pending";
    case MailboxStatus::kInProgress:
      return "in_progress";
    case MailboxStatus::kCompleted:
      return "completed";
    case MailboxStatus::kFailed:
      return "failed";
  }
  return "pending";
}

bool ParseMailboxStatus(const std::string& s, MailboxStatus* out) {
  if (s == "pending") {
    *out = MailboxStatus::kPending;
  } else if (s == "in_progress") {
    *out = MailboxStatus::kInProgress;
  } else if (s == "completed") {
    *out = MailboxStatus::kCompleted;
  } else if (s == "failed") {
    *out = MailboxStatus::kFailed;
  } else {
    return false;
  }
  return true;
}

int StatusRank(MailboxStatus s) {
  switch (s) {
    case MailboxStatus::kPending:
      return 0;
    case MailboxStatus::kInProgress:
      return 1;
    case MailboxStatus::kCompleted:
    case MailboxStatus::kFailed:
      return 2;
  }
  return 0;
}

bool IsTerminal(MailboxStatus s) { return StatusRank(s) == 2; }

nlohmann::json MailboxItem::ToJson() const {
  nlohmann::json j = {
      {"id", id},
      {"action", action},
      {"params", params.is_null() ? nlohmann::json::object() : params},
      {"status", MailboxStatusName(status)},
      {"timestamp", timestamp},
      {"source", source},
  };
  if (completed_at) j["completed_at"] = *completed_at;
  if (!result.is_null()) j["result"] = result;
  if (error) j["error"] = *error;
  return j;
}

std::optional<MailboxItem> MailboxItem::FromJson(const nlohmann::json& j, std::string* err) {
  auto fail = [&](const std::string& msg) -> std::optional<MailboxItem> {
    if (err) *err = msg;
    return std::nullopt;
  };
  if (!j.is_object()) return fail("item is not an object");
  if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) return fail("missing id");
  if (!j.contains("status") || !j["status"].is_string()) return fail("missing status");

  MailboxItem item;
  item.id = j["id"].get<std::string>();
  if (!ParseMailboxStatus(j["status"].get<std::string>(), &item.status)) {
    return fail("unknown status " + j["status"].get<std::string>());
  }
  // Older desktop-side writers name the action "type".
  const char* action_key = j.contains("action") ? "action" : "type";
  if (j.contains(action_key)) {
    if (!j[action_key].is_string()) return fail(std::string(action_key) + " is not a string");
    item.action = j[action_key].get<std::string>();
  }
  if (j.contains("params") && !j["params"].is_null()) item.params = j["params"];
  if (j.contains("timestamp") && j["timestamp"].is_number()) item.timestamp = j["timestamp"].get<int64_t>();
  if (j.contains("source") && j["source"].is_string()) item.source = j["source"].get<std::string>();
  if (j.contains("completed_at") && j["completed_at"].is_number()) item.completed_at = j["completed_at"].get<int64_t>();
  if (j.contains("result")) item.result = j["result"];
  if (j.contains("error") && !j["error"].is_null()) {
    item.error = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
  }
  return item;
}

bool MailboxLayout::EnsureDirs(std::string* err) const {
  std::error_code ec;
  for (const auto& d : {outbox(), inbox()}) {
    std::filesystem::create_directories(d, ec);
    if (ec) {
      if (err) *err = "create " + d.string() + ": " + ec.message();
      return false;
    }
  }
  return true;
}

bool AdvanceStatus(const std::filesystem::path& path, MailboxStatus to, const MailboxItem* update, std::string* err) {
  auto current = ReadItem(path, err);
  if (!current) return false;
  if (StatusRank(to) <= StatusRank(current->status)) {
    if (err) *err = std::string("status would move from ") + MailboxStatusName(current->status) + " to " +
                    MailboxStatusName(to);
    return false;
  }
  current->status = to;
  if (update) {
    if (update->completed_at) current->completed_at = update->completed_at;
    if (!update->result.is_null()) current->result = update->result;
    if (update->error) current->error = update->error;
  }
  return WriteJsonAtomic(path, current->ToJson(), err);
}

// ---- MailboxBridge ----------------------------------------------------------

MailboxBridge::MailboxBridge(MailboxOptions opts) : opts_(std::move(opts)) {
  if (opts_.poll_interval_ms <= 0) opts_.poll_interval_ms = 500;
  if (opts_.parse_retry_initial_ms <= 0) opts_.parse_retry_initial_ms = 20;
  if (opts_.default_timeout_ms <= 0) opts_.default_timeout_ms = 30000;
  std::string err;
  if (!opts_.layout.EnsureDirs(&err)) LogWarn("mailbox") << err;
}

MailboxBridge::~MailboxBridge() { StopReaper(); }

std::optional<std::string> MailboxBridge::Send(const std::string& action, const nlohmann::json& params,
                                               GatewayError* err) {
  MailboxItem item;
  item.id = NewId(opts_.id_prefix);
  item.action = action;
  item.params = params.is_null() ? nlohmann::json::object() : params;
  item.status = MailboxStatus::kPending;
  item.timestamp = NowMs();
  item.source = opts_.source;

  {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_.insert(item.id);
  }
  std::string werr;
  if (!opts_.layout.EnsureDirs(&werr) || !WriteJsonAtomic(opts_.layout.RequestPath(item.id), item.ToJson(), &werr)) {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_.erase(item.id);
    Fail(err, ErrorCode::kExecutionError, "failed to publish request: " + werr, {{"action", action}});
    return std::nullopt;
  }
  LogDebug("mailbox") << "sent id=" << item.id << " action=" << action;
  return item.id;
}

std::optional<MailboxItem> MailboxBridge::AwaitResponse(const std::string& id, int timeout_ms, GatewayError* err) {
  if (timeout_ms <= 0) timeout_ms = opts_.default_timeout_ms;
  const auto response_path = opts_.layout.ResponsePath(id);
  const int64_t start = NowMs();
  const int64_t deadline = start + timeout_ms;
  int64_t retry_ms = opts_.parse_retry_initial_ms;

  for (;;) {
    int64_t wait_ms = opts_.poll_interval_ms;
    std::error_code ec;
    if (std::filesystem::exists(response_path, ec)) {
      std::string perr;
      auto item = ReadItem(response_path, &perr);
      if (item && item->id == id && IsTerminal(item->status)) {
        Consume(id);
        LogDebug("mailbox") << "response id=" << id << " status=" << MailboxStatusName(item->status) << " after "
            << (NowMs() - start) << "ms";
        return item;
      }
      // Half-visible or not yet terminal; look again soon.
      wait_ms = std::min<int64_t>(retry_ms, opts_.poll_interval_ms);
      retry_ms = std::min<int64_t>(retry_ms * 2, opts_.poll_interval_ms);
    } else {
      retry_ms = opts_.parse_retry_initial_ms;
    }

    const int64_t now = NowMs();
    if (now >= deadline) break;
    SleepMs(std::min(wait_ms, deadline - now));
  }

  const int64_t now = NowMs();
  Abandon(id, now);
  // Withdraw the request unless the responder already claimed it.
  const auto request_path = opts_.layout.RequestPath(id);
  std::string rerr;
  auto request = ReadItem(request_path, &rerr);
  if (request && request->status == MailboxStatus::kPending) RemoveIfExists(request_path);
  // A response that landed while we were giving up is late as well.
  if (RemoveIfExists(response_path)) {
    std::lock_guard<std::mutex> lock(mu_);
    abandoned_.erase(id);
  }
  const int64_t elapsed = now - start;
  LogWarn("mailbox") << "timeout id=" << id << " after " << elapsed << "ms";
  Fail(err, ErrorCode::kTimeoutError, "no response within " + std::to_string(timeout_ms) + "ms",
       {{"id", id}, {"elapsed_ms", elapsed}, {"timeout_ms", timeout_ms}});
  return std::nullopt;
}

std::optional<MailboxItem> MailboxBridge::Call(const std::string& action, const nlohmann::json& params, int timeout_ms,
                                               GatewayError* err) {
  const int64_t start = NowMs();
  auto id = Send(action, params, err);
  if (!id) return std::nullopt;
  auto item = AwaitResponse(*id, timeout_ms, err);
  if (!item) return std::nullopt;
  if (item->status == MailboxStatus::kFailed) {
    Fail(err, ErrorCode::kExecutionError, item->error.value_or("action failed"),
         {{"id", *id}, {"elapsed_ms", NowMs() - start}, {"action", action}});
    return std::nullopt;
  }
  return item;
}

void MailboxBridge::Abandon(const std::string& id, int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  in_flight_.erase(id);
  abandoned_[id] = now_ms;
  PruneAbandoned(now_ms);
}

void MailboxBridge::PruneAbandoned(int64_t now_ms) {
  for (auto it = abandoned_.begin(); it != abandoned_.end();) {
    if (now_ms - it->second > kAbandonedRetentionMs) {
      it = abandoned_.erase(it);
    } else {
      ++it;
    }
  }
}

void MailboxBridge::Consume(const std::string& id) {
  const auto response_path = opts_.layout.ResponsePath(id);
  if (opts_.archive_consumed) {
    std::error_code ec;
    std::filesystem::create_directories(opts_.layout.archive(), ec);
    std::filesystem::rename(response_path, opts_.layout.archive() / response_path.filename(), ec);
    if (ec) {
      LogWarn("mailbox") << "archive " << id << ": " << ec.message();
      RemoveIfExists(response_path);
    }
  } else {
    RemoveIfExists(response_path);
  }
  RemoveIfExists(opts_.layout.RequestPath(id));
  std::lock_guard<std::mutex> lock(mu_);
  in_flight_.erase(id);
}

bool MailboxBridge::ReapFile(const std::filesystem::path& file) {
  const std::string id = file.stem().string();
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (in_flight_.count(id)) return true;  // its waiter consumes it
    auto it = abandoned_.find(id);
    if (it != abandoned_.end()) {
      abandoned_.erase(it);
      RemoveIfExists(file);
      RemoveIfExists(opts_.layout.RequestPath(id));
      LogInfo("mailbox") << "discarded late response id=" << id;
      return true;
    }
  }
  GatewayError stale;
  Fail(&stale, ErrorCode::kStaleMailboxItem, "response without a waiter", {{"id", id}, {"file", file.string()}});
  LogWarn("mailbox") << ErrorKindName(stale.code) << ": " << stale.message << " id=" << id;
  RemoveIfExists(file);
  return true;
}

void MailboxBridge::Reconcile() {
  size_t withdrawn = 0, abandoned = 0, cleared = 0, reaped = 0;
  const int64_t now = NowMs();
  for (const auto& path : ListItems(opts_.layout.outbox())) {
    std::string perr;
    auto item = ReadItem(path, &perr);
    if (!item) {
      LogWarn("mailbox") << "reconcile: skipping " << path.filename().string() << ": " << perr;
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (in_flight_.count(item->id)) continue;
    }
    switch (item->status) {
      case MailboxStatus::kPending:
        RemoveIfExists(path);
        ++withdrawn;
        break;
      case MailboxStatus::kInProgress: {
        std::lock_guard<std::mutex> lock(mu_);
        abandoned_[item->id] = now;
        ++abandoned;
        break;
      }
      case MailboxStatus::kCompleted:
      case MailboxStatus::kFailed:
        RemoveIfExists(path);
        ++cleared;
        break;
    }
  }
  for (const auto& path : ListItems(opts_.layout.inbox())) {
    const std::string id = path.stem().string();
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (in_flight_.count(id)) continue;
      abandoned_.erase(id);
    }
    RemoveIfExists(path);
    RemoveIfExists(opts_.layout.RequestPath(id));
    ++reaped;
  }
  LogInfo("mailbox") << "reconciled channel " << opts_.layout.channel << ": withdrawn=" << withdrawn << " abandoned="
      << abandoned << " cleared=" << cleared << " reaped=" << reaped;
}

void MailboxBridge::StartReaper() {
  if (reaper_) return;
  WatcherOptions wo;
  wo.dir = opts_.layout.inbox().string();
  wo.interval_ms = opts_.watcher_interval_ms;
  wo.name = "reaper";
  reaper_ = std::make_unique<Watcher>(wo, [this](const std::filesystem::path& f) { return ReapFile(f); });
  reaper_->Start();
}

void MailboxBridge::StopReaper() {
  if (!reaper_) return;
  reaper_->Stop();
  reaper_.reset();
}

size_t MailboxBridge::InFlightCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return in_flight_.size();
}

size_t MailboxBridge::AbandonedCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return abandoned_.size();
}

bool MailboxBridge::IsAbandoned(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return abandoned_.count(id) > 0;
}

int MailboxBridge::reaper_restarts() const { return reaper_ ? reaper_->restarts() : 0; }

// ---- MailboxResponder -------------------------------------------------------

MailboxResponder::MailboxResponder(ResponderOptions opts, ActionHandler handler)
    : opts_(std::move(opts)), handler_(std::move(handler)) {
  std::string err;
  if (!opts_.layout.EnsureDirs(&err)) LogWarn("responder") << err;
}

MailboxResponder::~MailboxResponder() { Stop(); }

void MailboxResponder::Start() {
  if (watcher_) return;
  WatcherOptions wo;
  wo.dir = opts_.layout.outbox().string();
  wo.interval_ms = opts_.watcher_interval_ms;
  wo.name = "responder";
  watcher_ = std::make_unique<Watcher>(wo, [this](const std::filesystem::path& f) { return ProcessRequestFile(f); });
  watcher_->Start();
}

void MailboxResponder::Stop() {
  if (!watcher_) return;
  watcher_->Stop();
  watcher_.reset();
}

bool MailboxResponder::Respond(const MailboxItem& request, MailboxStatus status, nlohmann::json result,
                               std::optional<std::string> error) {
  MailboxItem response;
  response.id = request.id;
  response.action = request.action;
  response.params = request.params;
  response.status = status;
  response.timestamp = NowMs();
  response.source = opts_.source;
  response.completed_at = response.timestamp;
  response.result = std::move(result);
  response.error = std::move(error);

  // The request is finalized before the response becomes visible. Once the
  // response exists the sender may consume both files at any moment.
  std::string err;
  const auto request_path = opts_.layout.RequestPath(request.id);
  std::error_code ec;
  if (std::filesystem::exists(request_path, ec) && !AdvanceStatus(request_path, status, &response, &err)) {
    LogDebug("responder") << "finalize request id=" << request.id << ": " << err;
  }
  if (!WriteJsonAtomic(opts_.layout.ResponsePath(request.id), response.ToJson(), &err)) {
    LogError("responder") << "publish response id=" << request.id << ": " << err;
    return false;
  }
  return true;
}

bool MailboxResponder::ProcessRequestFile(const std::filesystem::path& file) {
  std::string perr;
  auto request = ReadItem(file, &perr);
  if (!request) {
    LogWarn("responder") << "refusing " << file.filename().string() << ": " << perr;
    return false;
  }
  if (request->id != file.stem().string()) {
    LogWarn("responder") << "refusing " << file.filename().string() << ": id " << request->id
        << " does not match the file name";
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    PruneSeenLocked(NowMs());
    if (!seen_.insert(request->id).second) return true;
  }
  if (request->status != MailboxStatus::kPending) return true;
  std::error_code ec;
  if (std::filesystem::exists(opts_.layout.ResponsePath(request->id), ec)) return true;

  std::string err;
  if (!AdvanceStatus(file, MailboxStatus::kInProgress, nullptr, &err)) {
    // Withdrawn or claimed between the read and the claim.
    LogDebug("responder") << "claim id=" << request->id << ": " << err;
    return true;
  }
  LogInfo("responder") << "running id=" << request->id << " action=" << request->action;

  nlohmann::json result;
  std::optional<std::string> error;
  MailboxStatus status = MailboxStatus::kCompleted;
  try {
    result = handler_(request->action, request->params);
  } catch (const std::exception& e) {
    status = MailboxStatus::kFailed;
    error = e.what();
    LogWarn("responder") << "action " << request->action << " failed: " << e.what();
  }
  Respond(*request, status, std::move(result), std::move(error));
  processed_.fetch_add(1);
  return true;
}

void MailboxResponder::PruneSeenLocked(int64_t now_ms) {
  if (now_ms - last_prune_ms_ < opts_.seen_prune_interval_ms) return;
  last_prune_ms_ = now_ms;
  size_t dropped = 0;
  for (auto it = seen_.begin(); it != seen_.end();) {
    std::error_code ec;
    if (!std::filesystem::exists(opts_.layout.RequestPath(*it), ec)) {
      it = seen_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  if (dropped > 0) LogDebug("responder") << "forgot " << dropped << " finished ids";
}

size_t MailboxResponder::seen_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return seen_.size();
}

void MailboxResponder::Reconcile() {
  size_t interrupted = 0, finalized = 0, republished = 0;
  for (const auto& path : ListItems(opts_.layout.outbox())) {
    std::string perr;
    auto item = ReadItem(path, &perr);
    if (!item) continue;
    const auto response_path = opts_.layout.ResponsePath(item->id);
    std::error_code ec;
    const bool answered = std::filesystem::exists(response_path, ec);

    if (answered && !IsTerminal(item->status)) {
      std::string rerr;
      auto response = ReadItem(response_path, &rerr);
      const MailboxStatus final_status =
          response && IsTerminal(response->status) ? response->status : MailboxStatus::kFailed;
      std::string err;
      if (!AdvanceStatus(path, final_status, response ? &*response : nullptr, &err)) {
        LogWarn("responder") << "reconcile " << item->id << ": " << err;
      }
      ++finalized;
    } else if (!answered && item->status == MailboxStatus::kInProgress) {
      Respond(*item, MailboxStatus::kFailed, nullptr, std::string("interrupted before completion"));
      ++interrupted;
    } else if (!answered && IsTerminal(item->status)) {
      // Finalized but stopped before the response was published.
      Respond(*item, item->status, item->result, item->error);
      ++republished;
    } else if (item->status == MailboxStatus::kPending) {
      continue;  // left for the watcher
    }
    std::lock_guard<std::mutex> lock(mu_);
    seen_.insert(item->id);
  }
  LogInfo("responder") << "reconciled channel " << opts_.layout.channel << ": interrupted=" << interrupted
      << " finalized=" << finalized << " republished=" << republished;
}

}  // namespace deskbridge
