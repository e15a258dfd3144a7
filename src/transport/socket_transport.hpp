#pragma once

#include "dispatcher.hpp"
#include "transport/transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace deskbridge {

// TCP listener speaking newline-delimited JSON-RPC. Each connection gets its
// own ClientContext and a heartbeat: a ping request every interval, and a
// disconnect once the peer has been silent for two intervals.
class SocketTransport : public Transport {
 public:
  SocketTransport(Dispatcher* dispatcher, std::string host, int port, int heartbeat_interval_ms);
  ~SocketTransport() override;

  // Binds and listens. Port 0 picks a free port, see bound_port().
  bool Listen(std::string* err);
  int bound_port() const { return bound_port_; }

  int Run() override;
  void Shutdown() override;
  const char* name() const override { return "socket"; }

  size_t connection_count() const;

 private:
  struct Connection;

  void Serve(std::shared_ptr<Connection> conn);
  void Heartbeat(std::shared_ptr<Connection> conn);

  Dispatcher* dispatcher_;
  std::string host_;
  int port_;
  int heartbeat_interval_ms_;
  int listen_fd_ = -1;
  int bound_port_ = 0;
  std::atomic<bool> stop_{false};

  mutable std::mutex conns_mu_;
  std::vector<std::weak_ptr<Connection>> conns_;
  RequestRunner workers_;
};

}  // namespace deskbridge
