#include "session_authority.hpp"

#include "fs_util.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <random>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace deskbridge {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static bool ConstantTimeEquals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  unsigned char diff = 0;
  for (size_t i = 0; i < a.size(); i++) diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  return diff == 0;
}

static nlohmann::json TokenToJson(const SessionToken& t) {
  return {{"token", t.secret},
          {"boundClientId", t.bound_client_id},
          {"createdAt", t.issued_at_ms},
          {"expiresAt", t.expires_at_ms}};
}

static std::optional<SessionToken> TokenFromJson(const std::string& id, const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  if (!j.contains("token") || !j["token"].is_string()) return std::nullopt;
  if (!j.contains("expiresAt") || !j["expiresAt"].is_number_integer()) return std::nullopt;
  SessionToken t;
  t.id = id;
  t.secret = j["token"].get<std::string>();
  if (j.contains("boundClientId") && j["boundClientId"].is_string()) t.bound_client_id = j["boundClientId"].get<std::string>();
  if (j.contains("createdAt") && j["createdAt"].is_number_integer()) t.issued_at_ms = j["createdAt"].get<int64_t>();
  t.expires_at_ms = j["expiresAt"].get<int64_t>();
  return t;
}

// Exclusive flock on `<store>.lock` held for one read-modify-write cycle.
// Serializes writers across processes sharing the side-file.
class StoreLock {
 public:
  explicit StoreLock(const std::string& store_path) {
    const std::string lock_path = store_path + ".lock";
    std::error_code ec;
    const auto parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
      LogError("session") << "cannot open lock file path=" << lock_path << " err=" << std::strerror(errno);
      return;
    }
    int rc;
    do {
      rc = ::flock(fd_, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
      LogError("session") << "flock failed path=" << lock_path << " err=" << std::strerror(errno);
      ::close(fd_);
      fd_ = -1;
    }
  }
  ~StoreLock() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  StoreLock(const StoreLock&) = delete;
  StoreLock& operator=(const StoreLock&) = delete;

  bool held() const { return fd_ >= 0; }

 private:
  int fd_ = -1;
};

class FileSessionStore : public SessionStore {
 public:
  explicit FileSessionStore(std::string path) : path_(std::move(path)) {}

  std::optional<SessionToken> Load(const std::string& session_id) override {
    auto all = ReadAll();
    auto it = all.find(session_id);
    if (it == all.end()) return std::nullopt;
    return it->second;
  }

  bool Save(const SessionToken& token) override {
    StoreLock lock(path_);
    if (!lock.held()) return false;
    auto all = ReadAll();
    all[token.id] = token;
    return PersistAll(all);
  }

  bool Remove(const std::string& session_id) override {
    StoreLock lock(path_);
    if (!lock.held()) return false;
    auto all = ReadAll();
    if (all.erase(session_id) == 0) return false;
    return PersistAll(all);
  }

  std::vector<SessionToken> LoadAll() override {
    std::vector<SessionToken> out;
    for (auto& kv : ReadAll()) out.push_back(std::move(kv.second));
    return out;
  }

  int RemoveExpired(int64_t now_ms) override {
    StoreLock lock(path_);
    if (!lock.held()) return 0;
    auto all = ReadAll();
    int removed = 0;
    for (auto it = all.begin(); it != all.end();) {
      if (it->second.expires_at_ms <= now_ms) {
        it = all.erase(it);
        removed++;
      } else {
        ++it;
      }
    }
    if (removed > 0 && !PersistAll(all)) return 0;
    return removed;
  }

 private:
  std::string path_;

  std::unordered_map<std::string, SessionToken> ReadAll() const {
    std::unordered_map<std::string, SessionToken> out;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return out;
    auto j = ReadJsonFile(path_);
    if (!j) {
      LogWarn("session") << "session store is not valid JSON path=" << path_;
      return out;
    }
    if (!j->is_object() || !j->contains("sessions") || !(*j)["sessions"].is_object()) return out;
    for (auto it = (*j)["sessions"].begin(); it != (*j)["sessions"].end(); ++it) {
      if (it.key().empty()) continue;
      auto t = TokenFromJson(it.key(), it.value());
      if (t) out.emplace(it.key(), std::move(*t));
    }
    return out;
  }

  bool PersistAll(const std::unordered_map<std::string, SessionToken>& all) {
    nlohmann::json out;
    out["sessions"] = nlohmann::json::object();
    for (const auto& kv : all) out["sessions"][kv.first] = TokenToJson(kv.second);
    std::string err;
    if (!WriteJsonAtomic(path_, out, &err)) {
      LogError("session") << "persist failed: " << err;
      return false;
    }
    return true;
  }
};

class MemorySessionStore : public SessionStore {
 public:
  std::optional<SessionToken> Load(const std::string& session_id) override {
    auto it = map_.find(session_id);
    if (it == map_.end()) return std::nullopt;
    return it->second;
  }
  bool Save(const SessionToken& token) override {
    map_[token.id] = token;
    return true;
  }
  bool Remove(const std::string& session_id) override { return map_.erase(session_id) > 0; }
  std::vector<SessionToken> LoadAll() override {
    std::vector<SessionToken> out;
    for (const auto& kv : map_) out.push_back(kv.second);
    return out;
  }
  int RemoveExpired(int64_t now_ms) override {
    int removed = 0;
    for (auto it = map_.begin(); it != map_.end();) {
      if (it->second.expires_at_ms <= now_ms) {
        it = map_.erase(it);
        removed++;
      } else {
        ++it;
      }
    }
    return removed;
  }

 private:
  std::unordered_map<std::string, SessionToken> map_;
};

}  // namespace

std::unique_ptr<SessionStore> MakeFileSessionStore(std::string path) {
  return std::make_unique<FileSessionStore>(std::move(path));
}

std::unique_ptr<SessionStore> MakeMemorySessionStore() {
  return std::make_unique<MemorySessionStore>();
}

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + "-" + Hex(Rand64());
}

std::string RandomHex(size_t bytes) {
  static const char* kDigits = "0123456789abcdef";
  std::random_device rd;
  std::string out;
  out.reserve(bytes * 2);
  for (size_t i = 0; i < bytes; i++) {
    const auto b = static_cast<unsigned>(rd()) & 0xffu;
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0xf]);
  }
  return out;
}

SessionAuthority::SessionAuthority(std::unique_ptr<SessionStore> store, Clock clock, int64_t ttl_ms)
    : store_(std::move(store)), clock_(std::move(clock)), ttl_ms_(ttl_ms > 0 ? ttl_ms : kDefaultTtlMs) {
  if (!store_) store_ = MakeMemorySessionStore();
}

SessionAuthority::~SessionAuthority() {}

int64_t SessionAuthority::Now() const {
  return clock_ ? clock_() : NowMs();
}

std::optional<SessionToken> SessionAuthority::Issue(const std::string& client_id, GatewayError* err) {
  SessionToken t;
  t.id = NewId("sess");
  t.secret = RandomHex(32);
  t.bound_client_id = client_id;
  t.issued_at_ms = Now();
  t.expires_at_ms = t.issued_at_ms + ttl_ms_;
  std::lock_guard<std::mutex> lock(mu_);
  if (!store_->Save(t)) {
    Fail(err, ErrorCode::kInternalError, "failed to persist session");
    return std::nullopt;
  }
  LogInfo("session") << "issued id=" << t.id << " client=" << client_id << " expires_at=" << t.expires_at_ms;
  return t;
}

std::optional<SessionToken> SessionAuthority::Verify(const std::string& session_id,
                                                     const std::string& secret,
                                                     GatewayError* err) {
  if (session_id.empty() || secret.empty()) {
    Fail(err, ErrorCode::kSessionInvalid, "missing session credentials");
    return std::nullopt;
  }
  std::optional<SessionToken> t;
  {
    std::lock_guard<std::mutex> lock(mu_);
    t = store_->Load(session_id);
  }
  if (!t || !ConstantTimeEquals(t->secret, secret)) {
    Fail(err, ErrorCode::kSessionInvalid, "session verification failed", {{"session_id", session_id}});
    return std::nullopt;
  }
  const int64_t now = Now();
  if (now >= t->expires_at_ms) {
    Fail(err, ErrorCode::kSessionExpired, "session expired",
         {{"session_id", session_id}, {"expires_at", t->expires_at_ms}});
    return std::nullopt;
  }
  return t;
}

bool SessionAuthority::Revoke(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  const bool removed = store_->Remove(session_id);
  if (removed) LogInfo("session") << "revoked id=" << session_id;
  return removed;
}

int SessionAuthority::SweepExpired() {
  std::lock_guard<std::mutex> lock(mu_);
  const int n = store_->RemoveExpired(Now());
  if (n > 0) LogInfo("session") << "swept expired=" << n;
  return n;
}

}  // namespace deskbridge
