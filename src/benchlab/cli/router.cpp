#include "benchlab/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/time_utils.hpp"
#include "format/csv_writer.hpp"
#include "format/normalized_table.hpp"
#include "results/aggregator.hpp"
#include "results/run_result_loader.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iostream>
#include <map>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace benchlab::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInputInvalid = core::errors::ToInt(core::errors::ExitCode::kInputInvalid);
constexpr int kExitInconsistentRuns =
    core::errors::ToInt(core::errors::ExitCode::kInconsistentRuns);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  benchlab normalize <runs.json> [--out <file.csv>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  benchlab heap-profile [--duration-ms <ms>] [--period-ms <ms>] "
         "[--initial-delay-ms <ms>] [--benchmark <label>] [--out <file.csv>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  benchlab version\n"
      << "  benchlab help\n";
}

bool ParseMillis(std::string_view flag, std::string_view raw, bool allow_zero,
                 std::chrono::milliseconds& out, std::string& error) {
  std::int64_t value = 0;
  const auto result = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (result.ec != std::errc() || result.ptr != raw.data() + raw.size()) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected integer milliseconds)";
    return false;
  }
  if (value < 0 || (!allow_zero && value == 0)) {
    error = std::string(flag) + (allow_zero ? " must not be negative" : " must be greater than 0");
    return false;
  }
  out = std::chrono::milliseconds(value);
  return true;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[++i];
  return true;
}

// Parse `normalize` args:
// - exactly one input document path
// - optional `--out <file>` and `--log-level <level>`
bool ParseNormalizeOptions(const std::vector<std::string_view>& args, NormalizeOptions& options,
                           std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_path = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.input_path.empty()) {
      error = "normalize accepts exactly 1 input path";
      return false;
    }
    options.input_path = fs::path(token);
  }

  if (options.input_path.empty()) {
    error = "normalize requires exactly 1 argument: <runs.json>";
    return false;
  }
  return true;
}

bool ParseHeapProfileOptions(const std::vector<std::string_view>& args,
                             HeapProfileOptions& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--duration-ms") {
      if (!TakeValue(args, i, value, error) ||
          !ParseMillis(token, value, /*allow_zero=*/false, options.duration, error)) {
        return false;
      }
      continue;
    }
    if (token == "--period-ms") {
      if (!TakeValue(args, i, value, error) ||
          !ParseMillis(token, value, /*allow_zero=*/false, options.sampler.period, error)) {
        return false;
      }
      continue;
    }
    if (token == "--initial-delay-ms") {
      if (!TakeValue(args, i, value, error) ||
          !ParseMillis(token, value, /*allow_zero=*/true, options.sampler.initial_delay,
                       error)) {
        return false;
      }
      continue;
    }
    if (token == "--benchmark") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--benchmark label cannot be empty";
        return false;
      }
      options.benchmark = std::string(value);
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_path = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "heap-profile does not accept positional arguments";
    }
    return false;
  }
  return true;
}

bool EmitTable(const format::NormalizedTable& table, const fs::path& output_path,
               core::logging::Logger& logger, std::string& error) {
  if (output_path.empty()) {
    return format::WriteNormalizedCsv(table, std::cout, error);
  }
  if (!format::WriteNormalizedCsvFile(table, output_path, error)) {
    return false;
  }
  logger.Info("normalized table written",
              {{"path", output_path.string()}, {"rows", std::to_string(table.rows.size())}});
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "benchlab 0.1.0\n";
  return kExitSuccess;
}

int CommandNormalize(const std::vector<std::string_view>& args) {
  NormalizeOptions options;
  std::string error;
  if (!ParseNormalizeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);

  std::vector<results::RunResult> runs;
  if (!results::LoadRunResultsFile(options.input_path, runs, error)) {
    logger.Error("failed to load run results",
                 {{"path", options.input_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitInputInvalid;
  }
  logger.Debug("run results loaded",
               {{"path", options.input_path.string()}, {"runs", std::to_string(runs.size())}});

  if (runs.empty()) {
    logger.Info("no runs to export", {{"path", options.input_path.string()}});
    return kExitSuccess;
  }

  format::NormalizedTable table;
  if (!format::BuildNormalizedTable(runs, table, error)) {
    logger.Error("run set cannot be normalized", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitInconsistentRuns;
  }

  if (!EmitTable(table, options.output_path, logger, error)) {
    logger.Error("failed to write normalized table", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  return kExitSuccess;
}

// Allocation churn that keeps a bounded working set alive so the heap grows
// and shrinks while the sampler runs.
void RunAllocationWorkload(std::chrono::milliseconds duration) {
  constexpr std::size_t kMaxLiveBlocks = 64;
  constexpr std::size_t kMinBlockBytes = 4U * 1024U;
  constexpr std::size_t kBlockStepBytes = 16U * 1024U;

  std::deque<std::vector<unsigned char>> live_blocks;
  std::size_t round = 0;
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (std::chrono::steady_clock::now() < deadline) {
    const std::size_t block_bytes = kMinBlockBytes + (round % 16U) * kBlockStepBytes;
    live_blocks.emplace_back(block_bytes, static_cast<unsigned char>(round & 0xFFU));
    if (live_blocks.size() > kMaxLiveBlocks) {
      live_blocks.pop_front();
    }
    ++round;
  }
}

int CommandHeapProfile(const std::vector<std::string_view>& args) {
  HeapProfileOptions options;
  std::string error;
  if (!ParseHeapProfileOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetBenchmark(options.benchmark);

  results::RunResult run;
  run.params.mode = results::Mode::kSingleShotTime;
  run.params.params = {
      {"duration_ms", std::to_string(options.duration.count())},
      {"period_ms", std::to_string(options.sampler.period.count())},
  };

  profile::IterationParams iteration;
  iteration.type = profile::IterationType::kMeasurement;
  iteration.count = 1;
  iteration.time = options.duration;

  profile::HeapSizeSampler sampler(options.sampler, &logger);
  logger.Info("iteration started", {{"profiler", sampler.Description()},
                                    {"duration_ms", std::to_string(options.duration.count())}});

  const auto started = std::chrono::steady_clock::now();
  sampler.BeforeIteration(run.params, iteration);
  RunAllocationWorkload(options.duration);
  std::vector<results::Result> observations = sampler.AfterIteration(run.params, iteration);
  const auto finished = std::chrono::steady_clock::now();

  logger.Info("iteration finished",
              {{"elapsed_ms", core::FormatElapsedMillis(started, finished)},
               {"observations", std::to_string(observations.size())}});

  run.primary.label = options.benchmark;
  run.primary.role = results::ResultRole::kPrimary;
  run.primary.sample_count = 1;
  run.primary.score =
      std::chrono::duration<double, std::milli>(finished - started).count();
  run.primary.unit = "ms";
  run.primary.policy = results::AggregationPolicy::kAverage;

  if (!results::AggregateResults(observations, run.secondary, error)) {
    logger.Error("failed to aggregate heap observations", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (run.secondary.empty()) {
    logger.Warn("no heap samples were collected");
  }

  format::NormalizedTable table;
  const std::vector<results::RunResult> runs = {run};
  if (!format::BuildNormalizedTable(runs, table, error)) {
    logger.Error("run set cannot be normalized", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitInconsistentRuns;
  }

  if (!EmitTable(table, options.output_path, logger, error)) {
    logger.Error("failed to write normalized table", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "normalize") {
    return CommandNormalize(args);
  }

  if (command == "heap-profile") {
    return CommandHeapProfile(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace benchlab::cli
