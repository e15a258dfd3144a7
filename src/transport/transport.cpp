#include "transport/transport.hpp"

#include "log.hpp"

#include <exception>
#include <thread>
#include <utility>

namespace deskbridge {

RequestRunner::RequestRunner(size_t max_in_flight)
    : max_in_flight_(max_in_flight > 0 ? max_in_flight : kDefaultMaxInFlight) {}

RequestRunner::~RequestRunner() { Drain(); }

void RequestRunner::SetMaxInFlight(size_t max_in_flight) {
  if (max_in_flight == 0) return;
  std::lock_guard<std::mutex> lock(mu_);
  max_in_flight_ = max_in_flight;
  cv_.notify_all();
}

void RequestRunner::Submit(std::function<void()> job) {
  {
    std::unique_lock<std::mutex> lock(mu_);
    if (active_ >= max_in_flight_) {
      LogDebug("transport") << "request limit " << max_in_flight_ << " reached, waiting";
      cv_.wait(lock, [this] { return active_ < max_in_flight_; });
    }
    ++active_;
  }
  std::thread([this, job = std::move(job)] {
    try {
      job();
    } catch (const std::exception& e) {
      LogError("transport") << "request worker failed: " << e.what();
    }
    std::lock_guard<std::mutex> lock(mu_);
    --active_;
    cv_.notify_all();
  }).detach();
}

void RequestRunner::Drain() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return active_ == 0; });
}

size_t RequestRunner::active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

}  // namespace deskbridge
