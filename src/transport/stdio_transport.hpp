#pragma once

#include "dispatcher.hpp"
#include "transport/transport.hpp"

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>

namespace deskbridge {

// One JSON-RPC document per line, read from `in_fd` (stdin in production)
// and written to `out`. Responses may leave in a different order than their
// requests arrived; each line is written whole.
class StdioTransport : public Transport {
 public:
  StdioTransport(Dispatcher* dispatcher, int in_fd, std::ostream& out);

  // Returns at EOF or after Shutdown(), once in-flight requests are drained.
  int Run() override;
  void Shutdown() override;
  const char* name() const override { return "stdio"; }

 private:
  void Dispatch(std::string line);
  void WriteLine(const std::string& line);

  Dispatcher* dispatcher_;
  int in_fd_;
  std::ostream& out_;
  std::mutex write_mu_;
  std::atomic<bool> stop_{false};
  ClientContext ctx_;
  RequestRunner runner_;
};

}  // namespace deskbridge
