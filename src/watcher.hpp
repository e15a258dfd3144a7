#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace deskbridge {

struct WatcherOptions {
  std::string dir;
  std::string suffix = ".json";
  int interval_ms = 250;
  int restart_backoff_ms = 100;
  int max_backoff_ms = 5000;
  std::string name = "watcher";
};

enum class WatcherState { kIdle, kScanning, kDispatching };

const char* WatcherStateName(WatcherState s);

// Returns true when the file was accepted. A refused file is offered again
// after its size or mtime changes.
using FileCallback = std::function<bool(const std::filesystem::path& file)>;

// Polls one directory and hands each stable file to the callback once per
// lifetime of its name. A file is stable when its size and mtime are the same
// on two successive scans. Hidden files and files without the suffix are
// ignored.
class Watcher {
 public:
  Watcher(WatcherOptions opts, FileCallback cb);
  ~Watcher();
  Watcher(const Watcher&) = delete;
  Watcher& operator=(const Watcher&) = delete;

  void Start();
  void Stop();
  bool running() const { return running_.load(); }

  // Runs one scan on the calling thread and returns the number of files
  // dispatched. Exceptions from listing or from the callback propagate.
  size_t ScanOnce();

  // Forgets everything seen, so the next scan is a full reconciliation.
  void Reset();

  WatcherState state() const { return state_.load(); }
  int restarts() const { return restarts_.load(); }
  // State the most recent crashed scan was in; idle if none crashed.
  WatcherState failed_state() const { return failed_state_.load(); }
  const WatcherOptions& options() const { return opts_; }

 private:
  enum class Disposition { kPending, kAccepted, kRefused };
  struct Entry {
    uintmax_t size = 0;
    std::filesystem::file_time_type mtime;
    Disposition disposition = Disposition::kPending;
    bool checked_once = false;
  };

  void Run();
  bool SleepFor(int ms);

  WatcherOptions opts_;
  FileCallback cb_;

  std::mutex scan_mu_;
  std::map<std::string, Entry> entries_;

  std::atomic<WatcherState> state_{WatcherState::kIdle};
  std::atomic<WatcherState> last_scan_state_{WatcherState::kIdle};
  std::atomic<WatcherState> failed_state_{WatcherState::kIdle};
  std::atomic<int> restarts_{0};
  std::atomic<bool> running_{false};

  std::mutex stop_mu_;
  std::condition_variable stop_cv_;
  bool stop_ = false;
  std::thread thread_;
};

}  // namespace deskbridge
