#include "results/aggregator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <map>
#include <string>
#include <vector>

using benchlab::results::AggregateResults;
using benchlab::results::AggregationPolicy;
using benchlab::results::MakeScalarResult;
using benchlab::results::Result;

TEST_CASE("Observations reduce by their policy", "[results][aggregate]") {
  const std::vector<Result> observations = {
      MakeScalarResult("Heap-Avg", 100.0, "bytes", AggregationPolicy::kAverage),
      MakeScalarResult("Heap-Max", 100.0, "bytes", AggregationPolicy::kMax),
      MakeScalarResult("Heap-Avg", 300.0, "bytes", AggregationPolicy::kAverage),
      MakeScalarResult("Heap-Max", 300.0, "bytes", AggregationPolicy::kMax),
      MakeScalarResult("allocs", 4.0, "counts", AggregationPolicy::kSum),
      MakeScalarResult("allocs", 6.0, "counts", AggregationPolicy::kSum),
      MakeScalarResult("latency.floor", 7.0, "us", AggregationPolicy::kMin),
      MakeScalarResult("latency.floor", 3.0, "us", AggregationPolicy::kMin),
  };

  std::map<std::string, Result> aggregated;
  std::string error;
  REQUIRE(AggregateResults(observations, aggregated, error));
  REQUIRE(aggregated.size() == 4U);

  CHECK(aggregated.at("Heap-Avg").score == 200.0);
  CHECK(aggregated.at("Heap-Avg").sample_count == 2U);
  CHECK(aggregated.at("Heap-Avg").unit == "bytes");
  CHECK(std::isnan(aggregated.at("Heap-Avg").score_error));
  CHECK(aggregated.at("Heap-Max").score == 300.0);
  CHECK(aggregated.at("Heap-Max").policy == AggregationPolicy::kMax);
  CHECK(aggregated.at("allocs").score == 10.0);
  CHECK(aggregated.at("latency.floor").score == 3.0);
}

TEST_CASE("No observations aggregate to nothing", "[results][aggregate]") {
  std::map<std::string, Result> aggregated;
  std::string error;
  REQUIRE(AggregateResults({}, aggregated, error));
  REQUIRE(aggregated.empty());
}

TEST_CASE("Mixed policies under one label are rejected", "[results][aggregate]") {
  const std::vector<Result> observations = {
      MakeScalarResult("Heap", 1.0, "bytes", AggregationPolicy::kAverage),
      MakeScalarResult("Heap", 2.0, "bytes", AggregationPolicy::kMax),
  };
  std::map<std::string, Result> aggregated;
  std::string error;
  REQUIRE_FALSE(AggregateResults(observations, aggregated, error));
  REQUIRE(aggregated.empty());
  REQUIRE(error.find("Heap") != std::string::npos);
}

TEST_CASE("Mixed units under one label are rejected", "[results][aggregate]") {
  const std::vector<Result> observations = {
      MakeScalarResult("Heap", 1.0, "bytes", AggregationPolicy::kMax),
      MakeScalarResult("Heap", 2.0, "KiB", AggregationPolicy::kMax),
  };
  std::map<std::string, Result> aggregated;
  std::string error;
  REQUIRE_FALSE(AggregateResults(observations, aggregated, error));
}

TEST_CASE("Untagged observations cannot be aggregated", "[results][aggregate]") {
  Result untagged = MakeScalarResult("Heap", 1.0, "bytes", AggregationPolicy::kMax);
  untagged.policy.reset();
  std::map<std::string, Result> aggregated;
  std::string error;
  REQUIRE_FALSE(AggregateResults({untagged}, aggregated, error));
  REQUIRE(error.find("no aggregation policy") != std::string::npos);
}
