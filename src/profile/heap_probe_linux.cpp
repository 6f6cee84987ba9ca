#include "profile/heap_probe.hpp"

#if defined(__linux__) && defined(__GLIBC__)

#include <malloc.h>

namespace benchlab::profile {

std::optional<std::uint64_t> ProbeLiveHeapBytes() {
#if __GLIBC_PREREQ(2, 33)
  const struct mallinfo2 info = mallinfo2();
  const std::uint64_t obtained = static_cast<std::uint64_t>(info.arena) +
                                 static_cast<std::uint64_t>(info.hblkhd);
  const std::uint64_t free_bytes = static_cast<std::uint64_t>(info.fordblks);
#else
  // Older glibc only has the int-typed mallinfo; fields wrap past 2 GiB.
  const struct mallinfo info = mallinfo();
  const std::uint64_t obtained = static_cast<std::uint64_t>(static_cast<unsigned int>(info.arena)) +
                                 static_cast<std::uint64_t>(static_cast<unsigned int>(info.hblkhd));
  const std::uint64_t free_bytes =
      static_cast<std::uint64_t>(static_cast<unsigned int>(info.fordblks));
#endif
  if (free_bytes > obtained) {
    return 0U;
  }
  return obtained - free_bytes;
}

} // namespace benchlab::profile

#endif
