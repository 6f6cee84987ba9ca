#pragma once

#include "core/logging/logger.hpp"
#include "profile/internal_profiler.hpp"
#include "profile/sampling_timer.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace benchlab::profile {

inline constexpr std::string_view kHeapAvgLabel = "Heap-Avg";
inline constexpr std::string_view kHeapMaxLabel = "Heap-Max";
inline constexpr std::string_view kHeapUnit = "bytes";

struct SamplerOptions {
  std::chrono::milliseconds initial_delay{10};
  std::chrono::milliseconds period{100};
};

using HeapProbe = std::function<std::optional<std::uint64_t>()>;

// Samples live heap size at a fixed cadence for the duration of an iteration.
//
// State machine: Idle -> Sampling (BeforeIteration) -> Idle (AfterIteration).
//
// Each recorded sample becomes two observations with the same value:
// "Heap-Avg" tagged average and "Heap-Max" tagged max, both in bytes. The
// reduction to one mean and one peak is left to `results::AggregateResults`.
//
// The timer thread is the only writer of the sample buffer while sampling;
// AfterIteration reads it only after the timer has been joined.
class HeapSizeSampler final : public IInternalProfiler {
public:
  explicit HeapSizeSampler(SamplerOptions options = {}, core::logging::Logger* logger = nullptr);

  // Injection point for tests and for allocators with their own statistics.
  HeapSizeSampler(SamplerOptions options, HeapProbe probe, std::unique_ptr<ISamplingTimer> timer,
                  core::logging::Logger* logger = nullptr);

  ~HeapSizeSampler() override;

  HeapSizeSampler(const HeapSizeSampler&) = delete;
  HeapSizeSampler& operator=(const HeapSizeSampler&) = delete;

  std::string Description() const override;

  // Starts a fresh sample buffer and arms the timer. When the timer cannot be
  // armed the sampler logs a warning and stays idle; the iteration itself is
  // unaffected.
  void BeforeIteration(const results::BenchmarkParams& benchmark_params,
                       const IterationParams& iteration_params) override;

  // Stops the timer (blocking) and converts the buffer. Idle -> empty result.
  std::vector<results::Result> AfterIteration(const results::BenchmarkParams& benchmark_params,
                                              const IterationParams& iteration_params) override;

  bool sampling() const;

private:
  void RecordSample();

  SamplerOptions options_;
  HeapProbe probe_;
  std::unique_ptr<ISamplingTimer> timer_;
  core::logging::Logger* logger_ = nullptr;

  std::vector<std::uint64_t> samples_;
  bool probe_unavailable_logged_ = false;
};

} // namespace benchlab::profile
