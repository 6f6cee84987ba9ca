#include "profile/sampling_timer.hpp"

#include <system_error>
#include <utility>

namespace benchlab::profile {

ThreadSamplingTimer::~ThreadSamplingTimer() {
  Stop();
}

bool ThreadSamplingTimer::Start(std::chrono::milliseconds initial_delay,
                                std::chrono::milliseconds period, Tick tick,
                                std::string& error) {
  if (worker_.joinable()) {
    error = "sampling timer is already running";
    return false;
  }
  if (initial_delay < std::chrono::milliseconds::zero()) {
    error = "sampling initial delay must not be negative";
    return false;
  }
  if (period <= std::chrono::milliseconds::zero()) {
    error = "sampling period must be greater than 0";
    return false;
  }
  if (!tick) {
    error = "sampling tick callback is empty";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = false;
  }

  const auto first_fire = std::chrono::steady_clock::now() + initial_delay;
  try {
    worker_ = std::thread(&ThreadSamplingTimer::Run, this, first_fire, period, std::move(tick));
  } catch (const std::system_error& e) {
    error = std::string("failed to create sampling thread: ") + e.what();
    return false;
  }

  error.clear();
  return true;
}

void ThreadSamplingTimer::Stop() {
  if (!worker_.joinable()) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  wake_.notify_all();
  worker_.join();
}

bool ThreadSamplingTimer::running() const {
  return worker_.joinable();
}

void ThreadSamplingTimer::Run(std::chrono::steady_clock::time_point first_fire,
                              std::chrono::milliseconds period, Tick tick) {
  // Deadlines advance from the start instant, not from tick completion, so a
  // slow tick does not shift every later sample.
  auto next_fire = first_fire;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      if (wake_.wait_until(lock, next_fire, [this] { return stop_requested_; })) {
        return;
      }
    }
    tick();
    next_fire += period;
  }
}

} // namespace benchlab::profile
