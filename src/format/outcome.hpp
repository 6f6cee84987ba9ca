#pragma once

#include "results/result.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace benchlab::format {

// Cell text used where a value does not exist.
inline constexpr std::string_view kNotAvailable = "NA";
inline constexpr std::string_view kNoneSentinel = "none";
inline constexpr std::string_view kUnknownPolicy = "unknown";

// Row projections of one (run, metric) pair. Pointers refer into the run
// collection being exported and are only valid while it is alive.
struct PrimaryOutcome {
  const results::RunResult* run = nullptr;
  const results::Result* result = nullptr;
};

struct SecondaryOutcome {
  const results::RunResult* run = nullptr;
  const results::Result* result = nullptr;
};

// A secondary metric another run reported but `run` did not.
struct MissingOutcome {
  const results::RunResult* run = nullptr;
  std::string metric_name;
};

using Outcome = std::variant<PrimaryOutcome, SecondaryOutcome, MissingOutcome>;

// Strips every leading character outside [A-Za-z], and only leading ones.
// "··gc.alloc" -> "gc.alloc"; "a··b" stays as is. Idempotent.
std::string TrimPunctuation(std::string_view label);

const results::RunResult& OutcomeRun(const Outcome& outcome);
results::ResultRole OutcomeRole(const Outcome& outcome);

// Primary: the run mode's long label. Secondary: the trimmed result label.
// Missing: the name it was synthesized for.
std::string OutcomeMetricName(const Outcome& outcome);

std::string OutcomeSampleSize(const Outcome& outcome);
std::string OutcomeStatisticType(const Outcome& outcome);
std::string OutcomeStatisticValue(const Outcome& outcome);
std::string OutcomeMarginOfError(const Outcome& outcome);
std::string OutcomeUnits(const Outcome& outcome);

// Renders the full table row for `outcome` with one cell per entry of
// `parameter_names`. Returns false and populates `error` when the run has no
// value for one of those parameters.
bool OutcomeRow(const Outcome& outcome, const std::vector<std::string>& parameter_names,
                std::vector<std::string>& row, std::string& error);

} // namespace benchlab::format
