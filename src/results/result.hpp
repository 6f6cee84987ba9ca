#pragma once

#include "results/aggregation_policy.hpp"
#include "results/benchmark_params.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>

namespace benchlab::results {

enum class ResultRole {
  kPrimary,
  kSecondary,
  // Placeholder for a metric some other run reported but this one did not.
  kOmitted,
};

const char* ToString(ResultRole role);

// One already-computed metric of a run.
//
// - `score_error` is NaN when undefined (for example single-sample runs).
// - `policy` is nullopt when the producer did not record how repeated
//   observations combine; exports render it as "unknown".
struct Result {
  std::string label;
  ResultRole role = ResultRole::kSecondary;
  std::uint64_t sample_count = 0;
  double score = 0.0;
  double score_error = std::numeric_limits<double>::quiet_NaN();
  std::string unit;
  std::optional<AggregationPolicy> policy;
};

// Single raw observation as emitted by profilers: secondary role, one sample,
// no error estimate.
Result MakeScalarResult(std::string label, double value, std::string unit,
                        AggregationPolicy policy);

// One measured configuration as handed over by the execution engine.
//
// `secondary` is keyed by the label the producer used; keys are unique but
// callers must not rely on their order.
struct RunResult {
  BenchmarkParams params;
  Result primary;
  std::map<std::string, Result> secondary;
};

} // namespace benchlab::results
