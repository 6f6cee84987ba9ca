#include "results/benchmark_params.hpp"

namespace benchlab::results {

std::vector<std::string> ParamKeys(const BenchmarkParams& params) {
  std::vector<std::string> keys;
  keys.reserve(params.params.size());
  for (const auto& [name, value] : params.params) {
    (void)value;
    keys.push_back(name);
  }
  return keys;
}

std::optional<std::string> FindParam(const BenchmarkParams& params, const std::string& name) {
  const auto it = params.params.find(name);
  if (it == params.params.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace benchlab::results
