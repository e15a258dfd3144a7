#include "transport/socket_transport.hpp"

#include "fs_util.hpp"
#include "log.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <thread>
#include <utility>

namespace deskbridge {

namespace {

constexpr int kPollSliceMs = 200;
// Connections served at once. Further peers wait in the listen backlog.
constexpr size_t kMaxConnections = 64;

}  // namespace

struct SocketTransport::Connection {
  int fd = -1;
  std::string peer;
  std::mutex write_mu;
  std::atomic<int64_t> last_seen_ms{0};
  std::atomic<bool> closed{false};
  std::mutex cv_mu;
  std::condition_variable cv;
  ClientContext ctx;
  RequestRunner runner;

  bool Write(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mu);
    if (closed.load()) return false;
    std::string data = line + "\n";
    size_t off = 0;
    while (off < data.size()) {
      ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) return false;
      off += static_cast<size_t>(n);
    }
    return true;
  }

  void Close() {
    if (closed.exchange(true)) return;
    ::shutdown(fd, SHUT_RDWR);
    std::lock_guard<std::mutex> lock(cv_mu);
    cv.notify_all();
  }
};

SocketTransport::SocketTransport(Dispatcher* dispatcher, std::string host, int port, int heartbeat_interval_ms)
    : dispatcher_(dispatcher),
      host_(std::move(host)),
      port_(port),
      heartbeat_interval_ms_(heartbeat_interval_ms),
      workers_(kMaxConnections) {}

SocketTransport::~SocketTransport() {
  Shutdown();
  workers_.Drain();
  if (listen_fd_ >= 0) ::close(listen_fd_);
}

bool SocketTransport::Listen(std::string* err) {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    if (err) *err = std::string("socket: ") + std::strerror(errno);
    return false;
  }
  int one = 1;
  ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) <= 0) {
    if (err) *err = "invalid listen host: " + host_;
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }
  if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(listen_fd_, 16) < 0) {
    if (err) *err = host_ + ":" + std::to_string(port_) + ": " + std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) bound_port_ = ntohs(addr.sin_port);
  LogInfo("socket") << "listen host=" << host_ << " port=" << bound_port_;
  return true;
}

void SocketTransport::Shutdown() {
  stop_.store(true);
  std::lock_guard<std::mutex> lock(conns_mu_);
  for (auto& weak : conns_) {
    if (auto conn = weak.lock()) conn->Close();
  }
}

size_t SocketTransport::connection_count() const {
  std::lock_guard<std::mutex> lock(conns_mu_);
  size_t n = 0;
  for (const auto& weak : conns_) {
    auto conn = weak.lock();
    if (conn && !conn->closed.load()) ++n;
  }
  return n;
}

int SocketTransport::Run() {
  if (listen_fd_ < 0) {
    std::string err;
    if (!Listen(&err)) {
      LogError("socket") << err;
      return 1;
    }
  }
  while (!stop_.load()) {
    pollfd pfd{listen_fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, kPollSliceMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      LogError("socket") << "poll: " << std::strerror(errno);
      break;
    }
    if (rc == 0) continue;

    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &len);
    if (fd < 0) {
      if (errno != EINTR && errno != EAGAIN) LogWarn("socket") << "accept: " << std::strerror(errno);
      continue;
    }
    auto conn = std::make_shared<Connection>();
    conn->fd = fd;
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf));
    conn->peer = std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
    conn->last_seen_ms.store(NowMs());
    {
      std::lock_guard<std::mutex> lock(conns_mu_);
      conns_.erase(std::remove_if(conns_.begin(), conns_.end(),
                                  [](const std::weak_ptr<Connection>& w) { return w.expired(); }),
                   conns_.end());
      conns_.push_back(conn);
    }
    LogInfo("socket") << "connection from " << conn->peer;
    workers_.Submit([this, conn] { Serve(conn); });
  }
  Shutdown();
  workers_.Drain();
  LogInfo("socket") << "listener stopped";
  return 0;
}

void SocketTransport::Serve(std::shared_ptr<Connection> conn) {
  std::thread heartbeat;
  if (heartbeat_interval_ms_ > 0) heartbeat = std::thread([this, conn] { Heartbeat(conn); });

  std::string buffer;
  char chunk[4096];
  while (!conn->closed.load()) {
    pollfd pfd{conn->fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, kPollSliceMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (rc == 0) continue;
    ssize_t n = ::recv(conn->fd, chunk, sizeof(chunk), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    conn->last_seen_ms.store(NowMs());
    buffer.append(chunk, static_cast<size_t>(n));

    size_t pos;
    while ((pos = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, pos);
      buffer.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.find_first_not_of(" \t") == std::string::npos) continue;
      conn->runner.Submit([this, conn, raw = std::move(line)] {
        auto response = dispatcher_->HandleRaw(raw, &conn->ctx);
        if (response && !conn->Write(*response)) {
          LogDebug("socket") << "dropped response to closed connection " << conn->peer;
        }
      });
    }
  }

  conn->Close();
  if (heartbeat.joinable()) heartbeat.join();
  conn->runner.Drain();
  ::close(conn->fd);
  LogInfo("socket") << "connection closed " << conn->peer;
}

void SocketTransport::Heartbeat(std::shared_ptr<Connection> conn) {
  const int64_t interval = heartbeat_interval_ms_;
  int64_t next_ping = NowMs() + interval;
  uint64_t seq = 0;
  while (!conn->closed.load()) {
    const int64_t deadline = conn->last_seen_ms.load() + 2 * interval;
    const int64_t wake = std::min(next_ping, deadline);
    const int64_t wait_ms = std::max<int64_t>(wake - NowMs(), 1);
    {
      std::unique_lock<std::mutex> lock(conn->cv_mu);
      conn->cv.wait_for(lock, std::chrono::milliseconds(wait_ms), [&conn] { return conn->closed.load(); });
    }
    if (conn->closed.load()) break;

    const int64_t now = NowMs();
    if (now >= conn->last_seen_ms.load() + 2 * interval) {
      LogWarn("socket") << "peer " << conn->peer << " silent for " << (now - conn->last_seen_ms.load())
          << "ms, disconnecting";
      conn->Close();
      break;
    }
    if (now >= next_ping) {
      nlohmann::json ping = {{"jsonrpc", "2.0"}, {"id", "hb-" + std::to_string(++seq)}, {"method", "ping"}};
      if (!conn->Write(SerializeEnvelope(ping))) {
        conn->Close();
        break;
      }
      next_ping = now + interval;
    }
  }
}

}  // namespace deskbridge
