#pragma once

#include <string>
#include <string_view>

namespace benchlab::results {

// What the primary metric of a run measures.
enum class Mode {
  kThroughput,
  kAverageTime,
  kSampleTime,
  kSingleShotTime,
  kAll,
};

// Compact label used in input documents and the "Benchmark Mode" column,
// e.g. "thrpt".
const char* ShortLabel(Mode mode);

// Descriptive label used as the metric name of primary rows,
// e.g. "Throughput, ops/time".
const char* LongLabel(Mode mode);

// Parses a short label. Matching is exact; labels are lowercase by contract.
bool ParseMode(std::string_view raw, Mode& mode, std::string& error);

} // namespace benchlab::results
