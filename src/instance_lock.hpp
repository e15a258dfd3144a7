#pragma once

#include "errors.hpp"
#include "process_probe.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace deskbridge {

struct LockRecord {
  long pid = 0;
  int64_t timestamp = 0;
  std::string resource;
};

std::optional<LockRecord> ReadLockRecord(const std::filesystem::path& path);

// Guards one shared resource (a transport channel) so that at most one
// gateway process owns it. Liveness of an existing owner is decided by the
// probe, never by the age of the record.
class InstanceLock {
 public:
  InstanceLock(std::filesystem::path lock_dir, const ProcessProbe* probe, long self_pid = 0);
  ~InstanceLock();
  InstanceLock(const InstanceLock&) = delete;
  InstanceLock& operator=(const InstanceLock&) = delete;

  bool Acquire(const std::string& resource, GatewayError* err);
  void Release();

  bool held() const { return held_; }
  const std::string& resource() const { return resource_; }
  std::filesystem::path PathFor(const std::string& resource) const;

  std::optional<LockRecord> CurrentOwner(const std::string& resource) const;

 private:
  bool ReclaimStale(const std::filesystem::path& path, const LockRecord& stale);

  std::filesystem::path lock_dir_;
  const ProcessProbe* probe_;
  long self_pid_;
  bool held_ = false;
  std::string resource_;
};

}  // namespace deskbridge
