#pragma once

#include "format/outcome.hpp"
#include "results/result.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace benchlab::format {

// Columns that follow the per-parameter columns in every row.
inline constexpr std::array<std::string_view, 7> kFixedColumns = {
    "Benchmark Mode",
    "Metric",
    "Sample Size",
    "Statistic Type",
    "Statistic Value",
    "Statistical Margin of Error",
    "Units",
};

inline constexpr std::string_view kTestColumn = "Test";

// Rectangular export of a run collection: every row has header.size() cells.
struct NormalizedTable {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;

  bool empty() const {
    return header.empty() && rows.empty();
  }
};

// Union of parameter names over all runs, sorted.
std::vector<std::string> CollectParameterNames(const std::vector<results::RunResult>& runs);

// Union of punctuation-trimmed secondary labels over all runs, sorted.
std::vector<std::string> CollectSecondaryMetricNames(const std::vector<results::RunResult>& runs);

// Per run, in input order: its primary outcome, one secondary outcome per
// secondary result it carries, then one missing outcome for every name in
// `secondary_metric_names` it did not report. Assumes each run's trimmed
// secondary names are distinct; `BuildNormalizedTable` checks that first.
std::vector<Outcome> BuildOutcomes(const std::vector<results::RunResult>& runs,
                                   const std::vector<std::string>& secondary_metric_names);

// Builds the normalized table for `runs`.
//
// Contract:
// - Empty `runs` yields an empty table (no header, no rows) and true.
// - Header: "Test", sorted parameter names, then `kFixedColumns`.
// - A run lacking a parameter some other run declares is an inconsistent run
//   set: returns false, populates `error` and leaves `table` empty.
// - So is a run with two secondary labels that trim to the same metric name.
// - Does no I/O.
bool BuildNormalizedTable(const std::vector<results::RunResult>& runs, NormalizedTable& table,
                          std::string& error);

} // namespace benchlab::format
