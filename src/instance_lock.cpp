#include "instance_lock.hpp"

#include "fs_util.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <utility>

#include <unistd.h>

namespace deskbridge {
namespace {

constexpr int kMaxAttempts = 5;

static std::string SanitizeResource(const std::string& resource) {
  std::string out;
  for (char c : resource) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    out.push_back(ok ? c : '_');
  }
  if (out.empty()) out = "default";
  return out;
}

static bool SameOwner(const LockRecord& a, const LockRecord& b) {
  return a.pid == b.pid && a.timestamp == b.timestamp;
}

}  // namespace

std::optional<LockRecord> ReadLockRecord(const std::filesystem::path& path) {
  auto j = ReadJsonFile(path);
  if (!j || !j->is_object()) return std::nullopt;
  if (!j->contains("pid") || !(*j)["pid"].is_number_integer()) return std::nullopt;
  LockRecord r;
  r.pid = (*j)["pid"].get<long>();
  if (j->contains("timestamp") && (*j)["timestamp"].is_number_integer()) r.timestamp = (*j)["timestamp"].get<int64_t>();
  if (j->contains("resource") && (*j)["resource"].is_string()) r.resource = (*j)["resource"].get<std::string>();
  return r;
}

InstanceLock::InstanceLock(std::filesystem::path lock_dir, const ProcessProbe* probe, long self_pid)
    : lock_dir_(std::move(lock_dir)), probe_(probe), self_pid_(self_pid > 0 ? self_pid : static_cast<long>(::getpid())) {}

InstanceLock::~InstanceLock() {
  Release();
}

std::filesystem::path InstanceLock::PathFor(const std::string& resource) const {
  return lock_dir_ / (SanitizeResource(resource) + ".lock");
}

std::optional<LockRecord> InstanceLock::CurrentOwner(const std::string& resource) const {
  return ReadLockRecord(PathFor(resource));
}

bool InstanceLock::Acquire(const std::string& resource, GatewayError* err) {
  if (held_) {
    if (resource == resource_) return true;
    return Fail(err, ErrorCode::kLockConflict, "lock already held for another resource: " + resource_);
  }
  const auto path = PathFor(resource);
  nlohmann::json rec;
  rec["pid"] = self_pid_;
  rec["timestamp"] = NowMs();
  rec["resource"] = resource;
  const std::string content = rec.dump();

  for (int attempt = 0; attempt < kMaxAttempts; attempt++) {
    bool exists = false;
    std::string io_err;
    if (CreateFileExclusive(path, content, &exists, &io_err)) {
      held_ = true;
      resource_ = resource;
      LogInfo("lock") << "acquired resource=" << resource << " pid=" << self_pid_ << " path=" << path.string();
      return true;
    }
    if (!exists) {
      return Fail(err, ErrorCode::kInternalError, "cannot create lock record: " + io_err);
    }

    auto owner = ReadLockRecord(path);
    if (!owner) {
      // A record we cannot parse either vanished or is not ours to judge.
      std::this_thread::sleep_for(std::chrono::milliseconds(20 * (attempt + 1)));
      continue;
    }
    if (owner->pid == self_pid_) {
      // Left behind by an earlier incarnation with a recycled pid, or by us.
      held_ = true;
      resource_ = resource;
      std::string werr;
      if (!WriteFileAtomic(path, content, &werr)) LogWarn("lock") << "refresh failed: " << werr;
      return true;
    }
    const ProbeResult live = probe_ ? probe_->ProbePid(owner->pid) : ProbeResult::kUnknown;
    if (live != ProbeResult::kNotRunning) {
      return Fail(err, ErrorCode::kLockConflict,
                  "resource " + resource + " is owned by pid " + std::to_string(owner->pid),
                  {{"resource", resource}, {"owner_pid", owner->pid}, {"since", owner->timestamp},
                   {"probe", ProbeResultName(live)}});
    }
    LogWarn("lock") << "reclaiming stale lock resource=" << resource << " dead_pid=" << owner->pid;
    ReclaimStale(path, *owner);
  }
  auto owner = ReadLockRecord(path);
  nlohmann::json data = {{"resource", resource}};
  if (owner) data["owner_pid"] = owner->pid;
  return Fail(err, ErrorCode::kLockConflict, "could not acquire lock for " + resource, data);
}

bool InstanceLock::ReclaimStale(const std::filesystem::path& path, const LockRecord& stale) {
  // Move the record aside first. If a racing process already replaced the
  // stale record with its own, we moved a live lock and put it back.
  std::error_code ec;
  const std::filesystem::path aside = path.string() + ".stale." + std::to_string(self_pid_);
  std::filesystem::rename(path, aside, ec);
  if (ec) return false;
  auto moved = ReadLockRecord(aside);
  if (moved && !SameOwner(*moved, stale)) {
    std::error_code link_ec;
    std::filesystem::create_hard_link(aside, path, link_ec);
    std::filesystem::remove(aside, ec);
    return false;
  }
  std::filesystem::remove(aside, ec);
  return true;
}

void InstanceLock::Release() {
  if (!held_) return;
  held_ = false;
  const auto path = PathFor(resource_);
  auto owner = ReadLockRecord(path);
  if (owner && owner->pid == self_pid_) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    LogInfo("lock") << "released resource=" << resource_;
  } else {
    LogWarn("lock") << "not removing lock record we no longer own resource=" << resource_;
  }
}

}  // namespace deskbridge
