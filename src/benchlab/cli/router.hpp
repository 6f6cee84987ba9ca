#pragma once

#include "core/logging/logger.hpp"
#include "profile/heap_sampler.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace benchlab::cli {

// Options of `benchlab normalize`.
struct NormalizeOptions {
  std::filesystem::path input_path;
  // Empty => write CSV to stdout.
  std::filesystem::path output_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Options of `benchlab heap-profile`.
struct HeapProfileOptions {
  std::string benchmark = "heap-profile";
  std::chrono::milliseconds duration{1'000};
  profile::SamplerOptions sampler;
  std::filesystem::path output_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `benchlab` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => run-result document is malformed
//   20 => runs cannot be normalized into one table
int Dispatch(int argc, char** argv);

} // namespace benchlab::cli
