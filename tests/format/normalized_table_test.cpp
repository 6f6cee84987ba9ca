#include "../common/run_fixtures.hpp"
#include "format/normalized_table.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <string>
#include <vector>

using benchlab::format::BuildNormalizedTable;
using benchlab::format::NormalizedTable;
using benchlab::results::Mode;
using benchlab::results::RunResult;
using benchlab::tests::common::AddSecondary;
using benchlab::tests::common::MakeRun;

namespace {

std::size_t ColumnIndex(const NormalizedTable& table, const std::string& name) {
  const auto it = std::find(table.header.begin(), table.header.end(), name);
  REQUIRE(it != table.header.end());
  return static_cast<std::size_t>(it - table.header.begin());
}

NormalizedTable BuildOrFail(const std::vector<RunResult>& runs) {
  NormalizedTable table;
  std::string error;
  REQUIRE(BuildNormalizedTable(runs, table, error));
  REQUIRE(error.empty());
  return table;
}

} // namespace

TEST_CASE("Empty run set produces an empty table", "[format][normalized]") {
  NormalizedTable table;
  table.header.push_back("stale");
  std::string error;
  REQUIRE(BuildNormalizedTable({}, table, error));
  REQUIRE(table.header.empty());
  REQUIRE(table.rows.empty());
  REQUIRE(table.empty());
}

TEST_CASE("Missing secondary metric gets a placeholder row", "[format][normalized]") {
  RunResult run_a = MakeRun("bench.Alloc.run", Mode::kThroughput, {{"size", "10"}});
  AddSecondary(run_a, "\xC2\xB7gc.count", 3.0);
  RunResult run_b = MakeRun("bench.Alloc.run", Mode::kThroughput, {{"size", "20"}});

  const NormalizedTable table = BuildOrFail({run_a, run_b});

  REQUIRE(table.header == std::vector<std::string>{"Test", "size", "Benchmark Mode", "Metric",
                                                   "Sample Size", "Statistic Type",
                                                   "Statistic Value",
                                                   "Statistical Margin of Error", "Units"});
  REQUIRE(table.rows.size() == 4U);

  const std::size_t size_col = ColumnIndex(table, "size");
  const std::size_t metric_col = ColumnIndex(table, "Metric");
  const std::size_t samples_col = ColumnIndex(table, "Sample Size");
  const std::size_t value_col = ColumnIndex(table, "Statistic Value");
  const std::size_t type_col = ColumnIndex(table, "Statistic Type");
  const std::size_t margin_col = ColumnIndex(table, "Statistical Margin of Error");
  const std::size_t units_col = ColumnIndex(table, "Units");

  CHECK(table.rows[0][metric_col] == "Throughput, ops/time");
  CHECK(table.rows[0][size_col] == "10");

  CHECK(table.rows[1][metric_col] == "gc.count");
  CHECK(table.rows[1][value_col] == "3");
  CHECK(table.rows[1][type_col] == "Sum");
  CHECK(table.rows[1][size_col] == "10");

  CHECK(table.rows[2][metric_col] == "Throughput, ops/time");
  CHECK(table.rows[2][size_col] == "20");

  CHECK(table.rows[3][metric_col] == "gc.count");
  CHECK(table.rows[3][size_col] == "20");
  CHECK(table.rows[3][samples_col] == "0");
  CHECK(table.rows[3][value_col] == "0");
  CHECK(table.rows[3][margin_col] == "NA");
  CHECK(table.rows[3][type_col] == "none");
  CHECK(table.rows[3][units_col] == "none");
}

TEST_CASE("Every row matches the header width", "[format][normalized]") {
  RunResult run_a = MakeRun("bench.A", Mode::kAverageTime, {{"size", "1"}, {"impl", "fast"}});
  AddSecondary(run_a, "\xC2\xB7gc.alloc.rate", 12.5, "MB/sec",
               benchlab::results::AggregationPolicy::kAverage);
  AddSecondary(run_a, "\xC2\xB7gc.count", 2.0);
  RunResult run_b = MakeRun("bench.B", Mode::kSampleTime, {{"size", "2"}, {"impl", "slow"}});
  AddSecondary(run_b, "cache.misses", 900.0);
  RunResult run_c = MakeRun("bench.C", Mode::kSingleShotTime, {{"size", "3"}, {"impl", "x"}});

  const NormalizedTable table = BuildOrFail({run_a, run_b, run_c});

  // 1 test column + 2 parameters + 7 fixed columns.
  REQUIRE(table.header.size() == 10U);
  for (const auto& row : table.rows) {
    REQUIRE(row.size() == table.header.size());
  }
}

TEST_CASE("Each run reports every secondary name exactly once", "[format][normalized]") {
  RunResult run_a = MakeRun("bench.A", Mode::kThroughput, {});
  AddSecondary(run_a, "\xC2\xB7gc.alloc.rate", 12.5);
  AddSecondary(run_a, "\xC2\xB7gc.count", 2.0);
  RunResult run_b = MakeRun("bench.B", Mode::kThroughput, {});
  AddSecondary(run_b, "cache.misses", 900.0);
  AddSecondary(run_b, "\xC2\xB7gc.count", 4.0);
  RunResult run_c = MakeRun("bench.C", Mode::kThroughput, {});

  const NormalizedTable table = BuildOrFail({run_a, run_b, run_c});
  const std::size_t test_col = ColumnIndex(table, "Test");
  const std::size_t metric_col = ColumnIndex(table, "Metric");

  const std::set<std::string> expected = {"cache.misses", "gc.alloc.rate", "gc.count"};
  for (const std::string benchmark : {"bench.A", "bench.B", "bench.C"}) {
    std::multiset<std::string> seen;
    for (const auto& row : table.rows) {
      if (row[test_col] == benchmark && row[metric_col] != "Throughput, ops/time") {
        seen.insert(row[metric_col]);
      }
    }
    REQUIRE(std::set<std::string>(seen.begin(), seen.end()) == expected);
    REQUIRE(seen.size() == expected.size());
  }
  REQUIRE(table.rows.size() == 3U * (1U + expected.size()));
}

TEST_CASE("Primary rows are named after the run mode", "[format][normalized]") {
  RunResult throughput = MakeRun("bench.Named", Mode::kThroughput, {});
  throughput.primary.label = "some.custom.label";
  RunResult avgt = MakeRun("bench.Avgt", Mode::kAverageTime, {});

  const NormalizedTable table = BuildOrFail({throughput, avgt});
  const std::size_t metric_col = ColumnIndex(table, "Metric");
  const std::size_t mode_col = ColumnIndex(table, "Benchmark Mode");
  const std::size_t test_col = ColumnIndex(table, "Test");

  REQUIRE(table.rows.size() == 2U);
  CHECK(table.rows[0][metric_col] == "Throughput, ops/time");
  CHECK(table.rows[0][test_col] == "some.custom.label");
  CHECK(table.rows[0][mode_col] == "thrpt");
  CHECK(table.rows[1][metric_col] == "Average time, time/op");
  CHECK(table.rows[1][mode_col] == "avgt");
}

TEST_CASE("Parameter columns are the sorted union across runs", "[format][normalized]") {
  const RunResult run_a = MakeRun("bench.A", Mode::kThroughput, {{"zeta", "1"}, {"alpha", "a"}});
  const RunResult run_b = MakeRun("bench.B", Mode::kThroughput, {{"alpha", "b"}, {"zeta", "2"}});

  const NormalizedTable table = BuildOrFail({run_a, run_b});
  REQUIRE(table.header[1] == "alpha");
  REQUIRE(table.header[2] == "zeta");
  CHECK(table.rows[1][1] == "b");
  CHECK(table.rows[1][2] == "2");
}

TEST_CASE("Run lacking a parameter declared elsewhere is rejected", "[format][normalized]") {
  const RunResult run_a = MakeRun("bench.A", Mode::kThroughput, {{"size", "10"}, {"impl", "x"}});
  const RunResult run_b = MakeRun("bench.B", Mode::kThroughput, {{"size", "20"}});

  NormalizedTable table;
  std::string error;
  REQUIRE_FALSE(BuildNormalizedTable({run_a, run_b}, table, error));
  REQUIRE(table.empty());
  REQUIRE(error.find("bench.B") != std::string::npos);
  REQUIRE(error.find("impl") != std::string::npos);
}

TEST_CASE("Run with two labels trimming to one metric is rejected", "[format][normalized]") {
  RunResult run_a = MakeRun("bench.A", Mode::kThroughput, {});
  AddSecondary(run_a, "\xC2\xB7gc.count", 3.0);
  AddSecondary(run_a, "gc.count", 4.0);
  const RunResult run_b = MakeRun("bench.B", Mode::kThroughput, {});

  NormalizedTable table;
  std::string error;
  REQUIRE_FALSE(BuildNormalizedTable({run_a, run_b}, table, error));
  REQUIRE(table.empty());
  REQUIRE(error.find("bench.A") != std::string::npos);
  REQUIRE(error.find("gc.count") != std::string::npos);
}

TEST_CASE("Undefined score error renders as NA", "[format][normalized]") {
  RunResult run = MakeRun("bench.Single", Mode::kSingleShotTime, {});
  run.primary.score_error = std::numeric_limits<double>::quiet_NaN();
  run.primary.sample_count = 1;

  const NormalizedTable table = BuildOrFail({run});
  const std::size_t margin_col = ColumnIndex(table, "Statistical Margin of Error");
  REQUIRE(table.rows.size() == 1U);
  CHECK(table.rows[0][margin_col] == "NA");
}

TEST_CASE("Measured values keep full precision", "[format][normalized]") {
  RunResult run = MakeRun("bench.Precise", Mode::kThroughput, {}, 12345.678901);
  run.primary.score_error = 0.1;

  const NormalizedTable table = BuildOrFail({run});
  CHECK(table.rows[0][ColumnIndex(table, "Statistic Value")] == "12345.678901");
  CHECK(table.rows[0][ColumnIndex(table, "Statistical Margin of Error")] == "0.1");
  CHECK(table.rows[0][ColumnIndex(table, "Sample Size")] == "5");
  CHECK(table.rows[0][ColumnIndex(table, "Units")] == "ops/s");
}

TEST_CASE("Result without a policy renders an unknown statistic type", "[format][normalized]") {
  RunResult run = MakeRun("bench.Untagged", Mode::kThroughput, {});
  run.primary.policy.reset();

  const NormalizedTable table = BuildOrFail({run});
  CHECK(table.rows[0][ColumnIndex(table, "Statistic Type")] == "unknown");
}
