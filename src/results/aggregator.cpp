#include "results/aggregator.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <numeric>
#include <utility>

namespace benchlab::results {

namespace {

double Reduce(AggregationPolicy policy, const std::vector<double>& scores) {
  switch (policy) {
  case AggregationPolicy::kAverage:
    return std::accumulate(scores.begin(), scores.end(), 0.0) /
           static_cast<double>(scores.size());
  case AggregationPolicy::kSum:
    return std::accumulate(scores.begin(), scores.end(), 0.0);
  case AggregationPolicy::kMax:
    return *std::max_element(scores.begin(), scores.end());
  case AggregationPolicy::kMin:
    return *std::min_element(scores.begin(), scores.end());
  }
  return std::numeric_limits<double>::quiet_NaN();
}

} // namespace

bool AggregateResults(const std::vector<Result>& observations,
                      std::map<std::string, Result>& aggregated, std::string& error) {
  aggregated.clear();

  std::map<std::string, std::vector<const Result*>> groups;
  for (const auto& observation : observations) {
    groups[observation.label].push_back(&observation);
  }

  for (const auto& [label, members] : groups) {
    const Result& first = *members.front();
    if (!first.policy.has_value()) {
      error = "result '" + label + "' has no aggregation policy";
      aggregated.clear();
      return false;
    }

    std::vector<double> scores;
    scores.reserve(members.size());
    std::uint64_t sample_count = 0;
    for (const Result* member : members) {
      if (member->policy != first.policy) {
        error = "result '" + label + "' mixes aggregation policies";
        aggregated.clear();
        return false;
      }
      if (member->unit != first.unit) {
        error = "result '" + label + "' mixes units '" + first.unit + "' and '" + member->unit +
                "'";
        aggregated.clear();
        return false;
      }
      scores.push_back(member->score);
      sample_count += member->sample_count;
    }

    Result combined = first;
    combined.score = Reduce(first.policy.value(), scores);
    combined.score_error = std::numeric_limits<double>::quiet_NaN();
    combined.sample_count = sample_count;
    aggregated.emplace(label, std::move(combined));
  }

  return true;
}

} // namespace benchlab::results
