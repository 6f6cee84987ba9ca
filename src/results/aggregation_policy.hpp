#pragma once

#include <string>
#include <string_view>

namespace benchlab::results {

// How several same-labeled observations are folded into one value by the
// aggregation step. Results carry this tag; nothing in the result model acts
// on it except `AggregateResults`.
enum class AggregationPolicy {
  kAverage,
  kSum,
  kMax,
  kMin,
};

// Stable text used in the "Statistic Type" column.
const char* ToString(AggregationPolicy policy);

// Accepts the column text ("Average", "Sum", "Max", "Min") and the short
// forms "avg"/"mean", case-insensitively.
bool ParseAggregationPolicy(std::string_view raw, AggregationPolicy& policy, std::string& error);

} // namespace benchlab::results
