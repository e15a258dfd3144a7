#pragma once

#include "errors.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace deskbridge {

struct SessionToken {
  std::string id;
  std::string secret;
  std::string bound_client_id;
  int64_t issued_at_ms = 0;
  int64_t expires_at_ms = 0;
};

class SessionStore {
 public:
  virtual ~SessionStore() = default;
  virtual std::optional<SessionToken> Load(const std::string& session_id) = 0;
  virtual bool Save(const SessionToken& token) = 0;
  virtual bool Remove(const std::string& session_id) = 0;
  virtual std::vector<SessionToken> LoadAll() = 0;
  // Removes every record with expires_at_ms <= now_ms; returns the count.
  virtual int RemoveExpired(int64_t now_ms) = 0;
};

// Side-file store: {"sessions": {id: {token, boundClientId, createdAt, expiresAt}}}.
// Every call re-reads the file so separate processes share it.
std::unique_ptr<SessionStore> MakeFileSessionStore(std::string path);
std::unique_ptr<SessionStore> MakeMemorySessionStore();

using Clock = std::function<int64_t()>;

class SessionAuthority {
 public:
  static constexpr int64_t kDefaultTtlMs = 24LL * 60 * 60 * 1000;

  explicit SessionAuthority(std::unique_ptr<SessionStore> store, Clock clock = {}, int64_t ttl_ms = kDefaultTtlMs);
  ~SessionAuthority();

  std::optional<SessionToken> Issue(const std::string& client_id, GatewayError* err);
  // Fails with kSessionInvalid (unknown id, wrong secret) or kSessionExpired
  // (now >= expiresAt).
  std::optional<SessionToken> Verify(const std::string& session_id, const std::string& secret, GatewayError* err);
  bool Revoke(const std::string& session_id);
  int SweepExpired();

  int64_t Now() const;

 private:
  std::mutex mu_;
  std::unique_ptr<SessionStore> store_;
  Clock clock_;
  int64_t ttl_ms_;
};

std::string NewId(const std::string& prefix);
std::string RandomHex(size_t bytes);

}  // namespace deskbridge
