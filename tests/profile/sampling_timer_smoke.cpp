#include "../common/assertions.hpp"
#include "profile/sampling_timer.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using benchlab::tests::common::Fail;

int main() {
  {
    benchlab::profile::ThreadSamplingTimer timer;
    std::atomic<int> ticks{0};
    std::string error;
    if (!timer.Start(10ms, 100ms, [&ticks] { ticks.fetch_add(1); }, error)) {
      Fail("timer failed to start: " + error);
    }
    if (!timer.running()) {
      Fail("timer should report running after Start");
    }

    // Fires at 10, 110, 210, 310 ms.
    std::this_thread::sleep_for(350ms);
    timer.Stop();
    const int observed = ticks.load();
    if (observed < 3 || observed > 5) {
      Fail("expected about 4 ticks in 350 ms, got " + std::to_string(observed));
    }
    if (timer.running()) {
      Fail("timer should be idle after Stop");
    }

    std::this_thread::sleep_for(150ms);
    if (ticks.load() != observed) {
      Fail("tick ran after Stop returned");
    }

    // Stopping an idle timer is a no-op.
    timer.Stop();
  }

  {
    benchlab::profile::ThreadSamplingTimer timer;
    std::string error;
    if (timer.Start(0ms, 0ms, [] {}, error)) {
      Fail("zero period must be rejected");
    }
    benchlab::tests::common::AssertContains(error, "period");
    if (timer.Start(-1ms, 10ms, [] {}, error)) {
      Fail("negative initial delay must be rejected");
    }
    if (timer.Start(0ms, 10ms, {}, error)) {
      Fail("empty tick must be rejected");
    }
    if (timer.running()) {
      Fail("rejected Start must leave the timer idle");
    }
  }

  {
    // Restartable after Stop, and a second Start while armed is refused.
    benchlab::profile::ThreadSamplingTimer timer;
    std::atomic<int> ticks{0};
    std::string error;
    if (!timer.Start(0ms, 20ms, [&ticks] { ticks.fetch_add(1); }, error)) {
      Fail("first start failed: " + error);
    }
    if (timer.Start(0ms, 20ms, [] {}, error)) {
      Fail("second Start while running must fail");
    }
    timer.Stop();
    if (!timer.Start(0ms, 20ms, [&ticks] { ticks.fetch_add(1); }, error)) {
      Fail("restart after Stop failed: " + error);
    }
    std::this_thread::sleep_for(50ms);
    // Destructor stops the armed timer.
  }

  std::cout << "sampling_timer_smoke: ok\n";
  return 0;
}
