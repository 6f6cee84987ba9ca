#include "format/normalized_table.hpp"

#include <set>
#include <utility>

namespace benchlab::format {

namespace {

// Secondary labels of one run must stay distinct after trimming, otherwise the
// run would report the same metric twice.
bool CheckTrimmedNamesUnique(const results::RunResult& run, std::string& error) {
  std::set<std::string> seen;
  for (const auto& [key, result] : run.secondary) {
    (void)key;
    const std::string name = TrimPunctuation(result.label);
    if (!seen.insert(name).second) {
      error = "run '" + run.primary.label + "' reports secondary metric '" + name +
              "' more than once after label trimming";
      return false;
    }
  }
  return true;
}

} // namespace

std::vector<std::string> CollectParameterNames(const std::vector<results::RunResult>& runs) {
  std::set<std::string> names;
  for (const auto& run : runs) {
    for (auto& name : results::ParamKeys(run.params)) {
      names.insert(std::move(name));
    }
  }
  return std::vector<std::string>(names.begin(), names.end());
}

std::vector<std::string> CollectSecondaryMetricNames(const std::vector<results::RunResult>& runs) {
  std::set<std::string> names;
  for (const auto& run : runs) {
    for (const auto& [key, result] : run.secondary) {
      (void)key;
      names.insert(TrimPunctuation(result.label));
    }
  }
  return std::vector<std::string>(names.begin(), names.end());
}

std::vector<Outcome> BuildOutcomes(const std::vector<results::RunResult>& runs,
                                   const std::vector<std::string>& secondary_metric_names) {
  std::vector<Outcome> outcomes;
  for (const auto& run : runs) {
    outcomes.emplace_back(PrimaryOutcome{.run = &run, .result = &run.primary});

    std::set<std::string> written;
    for (const auto& [key, result] : run.secondary) {
      (void)key;
      Outcome secondary = SecondaryOutcome{.run = &run, .result = &result};
      written.insert(OutcomeMetricName(secondary));
      outcomes.push_back(std::move(secondary));
    }

    for (const auto& name : secondary_metric_names) {
      if (written.count(name) == 0U) {
        outcomes.emplace_back(MissingOutcome{.run = &run, .metric_name = name});
      }
    }
  }
  return outcomes;
}

bool BuildNormalizedTable(const std::vector<results::RunResult>& runs, NormalizedTable& table,
                          std::string& error) {
  table = NormalizedTable{};
  if (runs.empty()) {
    return true;
  }

  for (const auto& run : runs) {
    if (!CheckTrimmedNamesUnique(run, error)) {
      return false;
    }
  }

  const std::vector<std::string> parameter_names = CollectParameterNames(runs);
  const std::vector<Outcome> outcomes = BuildOutcomes(runs, CollectSecondaryMetricNames(runs));

  NormalizedTable built;
  built.header.reserve(1U + parameter_names.size() + kFixedColumns.size());
  built.header.emplace_back(kTestColumn);
  built.header.insert(built.header.end(), parameter_names.begin(), parameter_names.end());
  for (const std::string_view column : kFixedColumns) {
    built.header.emplace_back(column);
  }

  built.rows.reserve(outcomes.size());
  for (const auto& outcome : outcomes) {
    std::vector<std::string> row;
    if (!OutcomeRow(outcome, parameter_names, row, error)) {
      return false;
    }
    built.rows.push_back(std::move(row));
  }

  table = std::move(built);
  return true;
}

} // namespace benchlab::format
