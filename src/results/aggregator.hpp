#pragma once

#include "results/result.hpp"

#include <map>
#include <string>
#include <vector>

namespace benchlab::results {

// Folds raw observations into one result per label.
//
// Contract:
// - Groups `observations` by label; each group is reduced by its policy:
//   average -> arithmetic mean of scores, sum -> total, max/min -> extremum.
// - `sample_count` of an aggregate is the sum of the group's counts.
// - `score_error` of an aggregate is NaN; error estimation belongs to the
//   execution engine.
// - unit, role and policy are taken from the group; a group that mixes
//   policies or units, or has no policy at all, is rejected.
// - returns false and populates `error` on rejection; `aggregated` is then
//   left empty.
bool AggregateResults(const std::vector<Result>& observations,
                      std::map<std::string, Result>& aggregated, std::string& error);

} // namespace benchlab::results
