#pragma once

#include "dispatcher.hpp"
#include "transport/transport.hpp"

#include <httplib.h>

#include <string>

namespace deskbridge {

// POST /mcp carries one JSON-RPC document per request body; GET /health
// reports the bridge status. Every request gets a fresh ClientContext, so
// mailbox tools need credentials in _meta, in the arguments, or in the
// X-Deskbridge-Session-Id / X-Deskbridge-Session-Token headers.
class HttpTransport : public Transport {
 public:
  HttpTransport(Dispatcher* dispatcher, std::string host, int port);

  // Binds without serving yet. Port 0 picks a free port.
  bool Bind(std::string* err);
  int bound_port() const { return bound_port_; }

  int Run() override;
  void Shutdown() override;
  const char* name() const override { return "http"; }

 private:
  void InstallRoutes();

  Dispatcher* dispatcher_;
  std::string host_;
  int port_;
  int bound_port_ = -1;
  httplib::Server server_;
};

}  // namespace deskbridge
