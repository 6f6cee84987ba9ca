#pragma once

#include "results/mode.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace benchlab::results {

// Configuration a run was measured under: the mode plus the user-declared
// benchmark parameters (name -> rendered value).
struct BenchmarkParams {
  Mode mode = Mode::kThroughput;
  std::map<std::string, std::string> params;
};

// Parameter names of one run in lexicographic order.
std::vector<std::string> ParamKeys(const BenchmarkParams& params);

// Value of `name` for this run, or nullopt when the run does not declare it.
std::optional<std::string> FindParam(const BenchmarkParams& params, const std::string& name);

} // namespace benchlab::results
