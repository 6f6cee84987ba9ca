#include "../common/assertions.hpp"
#include "profile/heap_probe.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

using benchlab::tests::common::Fail;

int main() {
#if defined(__linux__) && defined(__GLIBC__)
  std::vector<std::unique_ptr<char[]>> blocks;
  for (int i = 0; i < 64; ++i) {
    blocks.emplace_back(new char[4096]);
    blocks.back()[0] = static_cast<char>(i);
  }

  const std::optional<std::uint64_t> live = benchlab::profile::ProbeLiveHeapBytes();
  if (!live.has_value()) {
    Fail("glibc heap probe returned no value");
  }
  if (live.value() < 64U * 4096U) {
    Fail("live heap smaller than the blocks held by this test");
  }
#else
  // Unsupported allocators report nothing; the call must still be safe.
  (void)benchlab::profile::ProbeLiveHeapBytes();
#endif

  std::cout << "heap_probe_smoke: ok\n";
  return 0;
}
