#include "results/aggregation_policy.hpp"

#include <algorithm>
#include <cctype>

namespace benchlab::results {

const char* ToString(AggregationPolicy policy) {
  switch (policy) {
  case AggregationPolicy::kAverage:
    return "Average";
  case AggregationPolicy::kSum:
    return "Sum";
  case AggregationPolicy::kMax:
    return "Max";
  case AggregationPolicy::kMin:
    return "Min";
  }
  return "Average";
}

bool ParseAggregationPolicy(std::string_view raw, AggregationPolicy& policy, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "average" || normalized == "avg" || normalized == "mean") {
    policy = AggregationPolicy::kAverage;
    return true;
  }
  if (normalized == "sum") {
    policy = AggregationPolicy::kSum;
    return true;
  }
  if (normalized == "max") {
    policy = AggregationPolicy::kMax;
    return true;
  }
  if (normalized == "min") {
    policy = AggregationPolicy::kMin;
    return true;
  }

  error = "unknown aggregation policy '" + std::string(raw) + "' (expected average|sum|max|min)";
  return false;
}

} // namespace benchlab::results
