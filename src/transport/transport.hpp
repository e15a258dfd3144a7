#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace deskbridge {

class Transport {
 public:
  virtual ~Transport() = default;

  // Serves until the peer goes away or Shutdown() is called. Returns the
  // process exit code.
  virtual int Run() = 0;
  virtual void Shutdown() = 0;
  virtual const char* name() const = 0;
};

// Runs each request on its own thread so a long mailbox wait never blocks
// the reader. At most max_in_flight jobs run at once; Submit() blocks the
// caller until a slot frees up. Drain() waits for every submitted job.
class RequestRunner {
 public:
  static constexpr size_t kDefaultMaxInFlight = 16;

  explicit RequestRunner(size_t max_in_flight = kDefaultMaxInFlight);
  ~RequestRunner();
  RequestRunner(const RequestRunner&) = delete;
  RequestRunner& operator=(const RequestRunner&) = delete;

  void SetMaxInFlight(size_t max_in_flight);

  void Submit(std::function<void()> job);
  void Drain();
  size_t active() const;

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  size_t active_ = 0;
  size_t max_in_flight_;
};

}  // namespace deskbridge
