#include "profile/heap_probe.hpp"

#if !(defined(__linux__) && defined(__GLIBC__))

namespace benchlab::profile {

std::optional<std::uint64_t> ProbeLiveHeapBytes() {
  return std::nullopt;
}

} // namespace benchlab::profile

#endif
