#pragma once

#include "results/benchmark_params.hpp"
#include "results/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace benchlab::profile {

enum class IterationType {
  kWarmup,
  kMeasurement,
};

// Iteration metadata handed over by the execution engine. Profilers use it
// only to know an iteration boundary was crossed.
struct IterationParams {
  IterationType type = IterationType::kMeasurement;
  std::uint32_t count = 1;
  std::chrono::milliseconds time{0};
};

// Profiler driven by the iteration loop of the execution engine.
//
// Contract:
// - `BeforeIteration` and `AfterIteration` are called in pairs from the same
//   driver thread.
// - `AfterIteration` returns raw observations for the aggregation step; it
//   must not fail the iteration, so problems surface as an empty result set.
class IInternalProfiler {
public:
  virtual ~IInternalProfiler() = default;

  // Short human-readable summary for profiler listings.
  virtual std::string Description() const = 0;

  virtual void BeforeIteration(const results::BenchmarkParams& benchmark_params,
                               const IterationParams& iteration_params) = 0;

  virtual std::vector<results::Result> AfterIteration(
      const results::BenchmarkParams& benchmark_params,
      const IterationParams& iteration_params) = 0;
};

} // namespace benchlab::profile
