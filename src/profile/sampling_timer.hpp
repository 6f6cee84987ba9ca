#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace benchlab::profile {

// Periodic background timer used by sampling profilers.
//
// Contract:
// - `Start` arms the timer: `tick` runs first after `initial_delay`, then at a
//   fixed rate of one call per `period` measured from the start instant.
// - `tick` runs on a timer-owned thread, never concurrently with itself.
// - `Stop` blocks until no further tick can run. A tick already executing
//   completes; pending ones are dropped. Stopping an idle timer is a no-op.
// - `Start`/`Stop` are called from one owner thread.
class ISamplingTimer {
public:
  using Tick = std::function<void()>;

  virtual ~ISamplingTimer() = default;

  virtual bool Start(std::chrono::milliseconds initial_delay, std::chrono::milliseconds period,
                     Tick tick, std::string& error) = 0;
  virtual void Stop() = 0;
  virtual bool running() const = 0;
};

// One dedicated thread per armed period.
class ThreadSamplingTimer final : public ISamplingTimer {
public:
  ThreadSamplingTimer() = default;
  ~ThreadSamplingTimer() override;

  ThreadSamplingTimer(const ThreadSamplingTimer&) = delete;
  ThreadSamplingTimer& operator=(const ThreadSamplingTimer&) = delete;
  ThreadSamplingTimer(ThreadSamplingTimer&&) = delete;
  ThreadSamplingTimer& operator=(ThreadSamplingTimer&&) = delete;

  bool Start(std::chrono::milliseconds initial_delay, std::chrono::milliseconds period, Tick tick,
             std::string& error) override;
  void Stop() override;
  bool running() const override;

private:
  void Run(std::chrono::steady_clock::time_point first_fire, std::chrono::milliseconds period,
           Tick tick);

  std::thread worker_;
  std::mutex mu_;
  std::condition_variable wake_;
  bool stop_requested_ = false;
};

} // namespace benchlab::profile
