#include "format/outcome.hpp"

#include "core/number_format.hpp"

#include <cmath>

namespace benchlab::format {

namespace {

bool IsAsciiAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Underlying metric of a primary or secondary outcome; nullptr for missing.
const results::Result* MeasuredResult(const Outcome& outcome) {
  if (const auto* primary = std::get_if<PrimaryOutcome>(&outcome)) {
    return primary->result;
  }
  if (const auto* secondary = std::get_if<SecondaryOutcome>(&outcome)) {
    return secondary->result;
  }
  return nullptr;
}

} // namespace

std::string TrimPunctuation(std::string_view label) {
  std::size_t first = 0;
  while (first < label.size() && !IsAsciiAlpha(label[first])) {
    ++first;
  }
  return std::string(label.substr(first));
}

const results::RunResult& OutcomeRun(const Outcome& outcome) {
  return *std::visit([](const auto& alternative) { return alternative.run; }, outcome);
}

results::ResultRole OutcomeRole(const Outcome& outcome) {
  if (std::holds_alternative<MissingOutcome>(outcome)) {
    return results::ResultRole::kOmitted;
  }
  return MeasuredResult(outcome)->role;
}

std::string OutcomeMetricName(const Outcome& outcome) {
  if (const auto* primary = std::get_if<PrimaryOutcome>(&outcome)) {
    return results::LongLabel(primary->run->params.mode);
  }
  if (const auto* secondary = std::get_if<SecondaryOutcome>(&outcome)) {
    return TrimPunctuation(secondary->result->label);
  }
  return std::get<MissingOutcome>(outcome).metric_name;
}

std::string OutcomeSampleSize(const Outcome& outcome) {
  const results::Result* result = MeasuredResult(outcome);
  if (result == nullptr) {
    return "0";
  }
  return std::to_string(result->sample_count);
}

std::string OutcomeStatisticType(const Outcome& outcome) {
  const results::Result* result = MeasuredResult(outcome);
  if (result == nullptr) {
    return std::string(kNoneSentinel);
  }
  if (!result->policy.has_value()) {
    return std::string(kUnknownPolicy);
  }
  return results::ToString(result->policy.value());
}

std::string OutcomeStatisticValue(const Outcome& outcome) {
  const results::Result* result = MeasuredResult(outcome);
  if (result == nullptr) {
    return "0";
  }
  return core::FormatShortestDouble(result->score);
}

std::string OutcomeMarginOfError(const Outcome& outcome) {
  const results::Result* result = MeasuredResult(outcome);
  if (result == nullptr || std::isnan(result->score_error)) {
    return std::string(kNotAvailable);
  }
  return core::FormatShortestDouble(result->score_error);
}

std::string OutcomeUnits(const Outcome& outcome) {
  const results::Result* result = MeasuredResult(outcome);
  if (result == nullptr) {
    return std::string(kNoneSentinel);
  }
  return result->unit;
}

bool OutcomeRow(const Outcome& outcome, const std::vector<std::string>& parameter_names,
                std::vector<std::string>& row, std::string& error) {
  const results::RunResult& run = OutcomeRun(outcome);

  row.clear();
  row.reserve(parameter_names.size() + 8U);

  // The primary label identifies the run across all of its rows.
  row.push_back(run.primary.label);
  for (const auto& name : parameter_names) {
    const auto value = results::FindParam(run.params, name);
    if (!value.has_value()) {
      error = "run '" + run.primary.label + "' has no value for parameter '" + name +
              "' declared by another run";
      row.clear();
      return false;
    }
    row.push_back(value.value());
  }
  row.push_back(results::ShortLabel(run.params.mode));
  row.push_back(OutcomeMetricName(outcome));
  row.push_back(OutcomeSampleSize(outcome));
  row.push_back(OutcomeStatisticType(outcome));
  row.push_back(OutcomeStatisticValue(outcome));
  row.push_back(OutcomeMarginOfError(outcome));
  row.push_back(OutcomeUnits(outcome));
  return true;
}

} // namespace benchlab::format
