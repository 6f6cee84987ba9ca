#include "results/mode.hpp"

#include <array>

namespace benchlab::results {

namespace {

struct ModeLabels {
  Mode mode;
  const char* short_label;
  const char* long_label;
};

constexpr std::array<ModeLabels, 5> kModeLabels = {{
    {Mode::kThroughput, "thrpt", "Throughput, ops/time"},
    {Mode::kAverageTime, "avgt", "Average time, time/op"},
    {Mode::kSampleTime, "sample", "Sampling time"},
    {Mode::kSingleShotTime, "ss", "Single shot invocation time"},
    {Mode::kAll, "all", "All benchmark modes"},
}};

const ModeLabels& LabelsFor(Mode mode) {
  for (const auto& entry : kModeLabels) {
    if (entry.mode == mode) {
      return entry;
    }
  }
  return kModeLabels.front();
}

} // namespace

const char* ShortLabel(Mode mode) {
  return LabelsFor(mode).short_label;
}

const char* LongLabel(Mode mode) {
  return LabelsFor(mode).long_label;
}

bool ParseMode(std::string_view raw, Mode& mode, std::string& error) {
  for (const auto& entry : kModeLabels) {
    if (raw == entry.short_label) {
      mode = entry.mode;
      return true;
    }
  }

  error = "unknown benchmark mode '" + std::string(raw) + "' (expected thrpt|avgt|sample|ss|all)";
  return false;
}

} // namespace benchlab::results
