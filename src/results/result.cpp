#include "results/result.hpp"

#include <utility>

namespace benchlab::results {

const char* ToString(ResultRole role) {
  switch (role) {
  case ResultRole::kPrimary:
    return "primary";
  case ResultRole::kSecondary:
    return "secondary";
  case ResultRole::kOmitted:
    return "omitted";
  }
  return "secondary";
}

Result MakeScalarResult(std::string label, double value, std::string unit,
                        AggregationPolicy policy) {
  Result result;
  result.label = std::move(label);
  result.role = ResultRole::kSecondary;
  result.sample_count = 1;
  result.score = value;
  result.unit = std::move(unit);
  result.policy = policy;
  return result;
}

} // namespace benchlab::results
