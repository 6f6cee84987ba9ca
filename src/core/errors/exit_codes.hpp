#pragma once

namespace benchlab::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values keep their conventional meanings:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values separate "the input document is broken" from "the input
// parsed fine but the runs cannot share one table".
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kInputInvalid = 10,
  kInconsistentRuns = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace benchlab::core::errors
