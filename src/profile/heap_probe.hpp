#pragma once

#include <cstdint>
#include <optional>

namespace benchlab::profile {

// Approximate live heap of this process in bytes: memory the allocator has
// obtained from the OS minus what it currently holds as free.
//
// Returns nullopt on platforms whose allocator exposes no such statistic.
// Cheap enough to call every few milliseconds; safe from any thread.
std::optional<std::uint64_t> ProbeLiveHeapBytes();

} // namespace benchlab::profile
