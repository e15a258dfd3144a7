#include "watcher.hpp"

#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace deskbridge {

const char* WatcherStateName(WatcherState s) {
  switch (s) {
    case WatcherState::kIdle:
      return "idle";
    case WatcherState::kScanning:
      return "scanning";
    case WatcherState::kDispatching:
      return "dispatching";
  }
  return "idle";
}

namespace {

bool HasSuffix(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Returns the watcher to idle when a scan ends, remembering where it was.
class StateGuard {
 public:
  StateGuard(std::atomic<WatcherState>* state, std::atomic<WatcherState>* last) : state_(state), last_(last) {}
  ~StateGuard() {
    last_->store(state_->load());
    state_->store(WatcherState::kIdle);
  }

 private:
  std::atomic<WatcherState>* state_;
  std::atomic<WatcherState>* last_;
};

}  // namespace

Watcher::Watcher(WatcherOptions opts, FileCallback cb) : opts_(std::move(opts)), cb_(std::move(cb)) {
  if (opts_.interval_ms <= 0) opts_.interval_ms = 250;
  if (opts_.restart_backoff_ms <= 0) opts_.restart_backoff_ms = 100;
  if (opts_.max_backoff_ms < opts_.restart_backoff_ms) opts_.max_backoff_ms = opts_.restart_backoff_ms;
}

Watcher::~Watcher() { Stop(); }

void Watcher::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stop_ = false;
  }
  thread_ = std::thread([this] { Run(); });
}

void Watcher::Stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    stop_ = true;
  }
  stop_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_.store(false);
}

void Watcher::Reset() {
  std::lock_guard<std::mutex> lock(scan_mu_);
  entries_.clear();
}

size_t Watcher::ScanOnce() {
  std::lock_guard<std::mutex> lock(scan_mu_);
  StateGuard guard(&state_, &last_scan_state_);
  state_.store(WatcherState::kScanning);

  std::error_code ec;
  if (!std::filesystem::is_directory(opts_.dir, ec)) {
    entries_.clear();
    return 0;
  }

  std::map<std::string, std::pair<uintmax_t, std::filesystem::file_time_type>> present;
  for (std::filesystem::directory_iterator it(opts_.dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.empty() || name[0] == '.') continue;
    if (!HasSuffix(name, opts_.suffix)) continue;
    std::error_code fec;
    if (!it->is_regular_file(fec)) continue;
    auto size = it->file_size(fec);
    if (fec) continue;  // vanished between listing and stat
    auto mtime = it->last_write_time(fec);
    if (fec) continue;
    present.emplace(name, std::make_pair(size, mtime));
  }
  if (ec) throw std::runtime_error("listing " + opts_.dir + ": " + ec.message());

  // A name that disappeared ends its lifetime.
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (present.find(it->first) == present.end()) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }

  std::vector<std::string> ready;
  for (const auto& [name, stat] : present) {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
      Entry e;
      e.size = stat.first;
      e.mtime = stat.second;
      e.checked_once = true;
      entries_.emplace(name, e);
      continue;
    }
    Entry& e = it->second;
    if (e.size != stat.first || e.mtime != stat.second) {
      e.size = stat.first;
      e.mtime = stat.second;
      // Changed content: a refused file gets another chance, an accepted
      // one keeps its single event.
      if (e.disposition == Disposition::kRefused) e.disposition = Disposition::kPending;
      continue;
    }
    if (e.disposition == Disposition::kPending) ready.push_back(name);
  }

  if (ready.empty()) return 0;
  state_.store(WatcherState::kDispatching);
  size_t dispatched = 0;
  for (const auto& name : ready) {
    const auto path = std::filesystem::path(opts_.dir) / name;
    const bool accepted = cb_(path);
    auto it = entries_.find(name);
    if (it != entries_.end()) it->second.disposition = accepted ? Disposition::kAccepted : Disposition::kRefused;
    ++dispatched;
  }
  return dispatched;
}

bool Watcher::SleepFor(int ms) {
  std::unique_lock<std::mutex> lock(stop_mu_);
  return !stop_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stop_; });
}

void Watcher::Run() {
  int backoff = opts_.restart_backoff_ms;
  Reset();
  LogDebug(opts_.name) << "watching " << opts_.dir;
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(stop_mu_);
      if (stop_) break;
    }
    try {
      ScanOnce();
      backoff = opts_.restart_backoff_ms;
    } catch (const std::exception& e) {
      restarts_.fetch_add(1);
      const WatcherState failed_in = last_scan_state_.load();
      failed_state_.store(failed_in);
      LogError(opts_.name) << "scan failed while " << WatcherStateName(failed_in) << ": " << e.what()
          << "; restarting in " << backoff << "ms";
      if (!SleepFor(backoff)) break;
      backoff = std::min(backoff * 2, opts_.max_backoff_ms);
      Reset();
      continue;
    }
    if (!SleepFor(opts_.interval_ms)) break;
  }
  LogDebug(opts_.name) << "stopped watching " << opts_.dir;
}

}  // namespace deskbridge
