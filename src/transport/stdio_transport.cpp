#include "transport/stdio_transport.hpp"

#include "log.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace deskbridge {

namespace {

constexpr int kPollSliceMs = 200;

}  // namespace

StdioTransport::StdioTransport(Dispatcher* dispatcher, int in_fd, std::ostream& out)
    : dispatcher_(dispatcher), in_fd_(in_fd), out_(out) {}

void StdioTransport::WriteLine(const std::string& line) {
  std::lock_guard<std::mutex> lock(write_mu_);
  out_ << line << '\n';
  out_.flush();
}

void StdioTransport::Shutdown() { stop_.store(true); }

void StdioTransport::Dispatch(std::string line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  if (line.find_first_not_of(" \t") == std::string::npos) return;
  runner_.Submit([this, raw = std::move(line)] {
    auto response = dispatcher_->HandleRaw(raw, &ctx_);
    if (response) WriteLine(*response);
  });
}

int StdioTransport::Run() {
  LogInfo("stdio") << "serving on fd " << in_fd_;
  std::string buffer;
  char chunk[4096];
  bool eof = false;
  while (!stop_.load()) {
    pollfd pfd{in_fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, kPollSliceMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      LogError("stdio") << "poll: " << std::strerror(errno);
      break;
    }
    if (rc == 0) continue;
    ssize_t n = ::read(in_fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      LogError("stdio") << "read: " << std::strerror(errno);
      break;
    }
    if (n == 0) {
      eof = true;
      break;
    }
    buffer.append(chunk, static_cast<size_t>(n));
    size_t pos;
    while ((pos = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, pos);
      buffer.erase(0, pos + 1);
      Dispatch(std::move(line));
    }
  }
  // A final line without a trailing newline still counts.
  if (eof && !buffer.empty()) Dispatch(std::move(buffer));

  LogInfo("stdio") << (eof ? "input closed" : "shutdown requested") << ", draining " << runner_.active()
      << " request(s)";
  runner_.Drain();
  return 0;
}

}  // namespace deskbridge
