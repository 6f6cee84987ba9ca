#include "results/run_result_loader.hpp"

#include "core/json_dom.hpp"
#include "core/number_format.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <utility>

namespace fs = std::filesystem;

namespace benchlab::results {

namespace {

using JsonValue = core::json::Value;

// 2^64; the largest double below it converts to std::uint64_t exactly.
constexpr double kUint64Bound = 18446744073709551616.0;

bool TypeError(const std::string& path, std::string_view expected, const JsonValue& actual,
               std::string& error) {
  error = path + " must be " + std::string(expected) + " (got " +
          core::json::TypeName(actual.type) + ")";
  return false;
}

bool ReadNonNegativeInteger(const JsonValue& value, const std::string& path, std::uint64_t& out,
                            std::string& error) {
  if (value.type != JsonValue::Type::kNumber || !std::isfinite(value.number_value) ||
      value.number_value < 0.0 || std::floor(value.number_value) != value.number_value ||
      value.number_value >= kUint64Bound) {
    error = path + " must be a non-negative integer";
    return false;
  }
  out = static_cast<std::uint64_t>(value.number_value);
  return true;
}

bool ParseResult(const JsonValue& value, const std::string& path, std::string default_label,
                 ResultRole role, Result& result, std::string& error) {
  if (value.type != JsonValue::Type::kObject) {
    return TypeError(path, "an object", value, error);
  }

  result = Result{};
  result.role = role;

  if (const JsonValue* label = core::json::FindMember(value, "label"); label != nullptr) {
    if (label->type != JsonValue::Type::kString) {
      return TypeError(path + ".label", "a string", *label, error);
    }
    result.label = label->string_value;
  } else if (!default_label.empty()) {
    result.label = std::move(default_label);
  } else {
    error = path + ".label is required";
    return false;
  }

  const JsonValue* score = core::json::FindMember(value, "score");
  if (score == nullptr) {
    error = path + ".score is required";
    return false;
  }
  if (score->type != JsonValue::Type::kNumber) {
    return TypeError(path + ".score", "a number", *score, error);
  }
  result.score = score->number_value;

  result.sample_count = 1;
  if (const JsonValue* samples = core::json::FindMember(value, "samples"); samples != nullptr) {
    if (!ReadNonNegativeInteger(*samples, path + ".samples", result.sample_count, error)) {
      return false;
    }
  }

  if (const JsonValue* score_error = core::json::FindMember(value, "score_error");
      score_error != nullptr && score_error->type != JsonValue::Type::kNull) {
    if (score_error->type != JsonValue::Type::kNumber) {
      return TypeError(path + ".score_error", "a number or null", *score_error, error);
    }
    result.score_error = score_error->number_value;
  }

  if (const JsonValue* unit = core::json::FindMember(value, "unit"); unit != nullptr) {
    if (unit->type != JsonValue::Type::kString) {
      return TypeError(path + ".unit", "a string", *unit, error);
    }
    result.unit = unit->string_value;
  }

  if (const JsonValue* policy = core::json::FindMember(value, "policy");
      policy != nullptr && policy->type != JsonValue::Type::kNull) {
    if (policy->type != JsonValue::Type::kString) {
      return TypeError(path + ".policy", "a string", *policy, error);
    }
    AggregationPolicy parsed = AggregationPolicy::kAverage;
    std::string policy_error;
    if (!ParseAggregationPolicy(policy->string_value, parsed, policy_error)) {
      error = path + ".policy: " + policy_error;
      return false;
    }
    result.policy = parsed;
  }

  return true;
}

bool ParseParams(const JsonValue& value, const std::string& path,
                 std::map<std::string, std::string>& params, std::string& error) {
  if (value.type != JsonValue::Type::kObject) {
    return TypeError(path, "an object", value, error);
  }

  for (const auto& [name, param] : value.object_value) {
    switch (param.type) {
    case JsonValue::Type::kString:
      params[name] = param.string_value;
      break;
    case JsonValue::Type::kNumber:
      params[name] = core::FormatShortestDouble(param.number_value);
      break;
    case JsonValue::Type::kBool:
      params[name] = param.bool_value ? "true" : "false";
      break;
    default:
      return TypeError(path + "." + name, "a string, number or bool", param, error);
    }
  }
  return true;
}

bool ParseRun(const JsonValue& value, const std::string& path, RunResult& run,
              std::string& error) {
  if (value.type != JsonValue::Type::kObject) {
    return TypeError(path, "an object", value, error);
  }

  const JsonValue* mode = core::json::FindMember(value, "mode");
  if (mode == nullptr) {
    error = path + ".mode is required";
    return false;
  }
  if (mode->type != JsonValue::Type::kString) {
    return TypeError(path + ".mode", "a string", *mode, error);
  }
  std::string mode_error;
  if (!ParseMode(mode->string_value, run.params.mode, mode_error)) {
    error = path + ".mode: " + mode_error;
    return false;
  }

  if (const JsonValue* params = core::json::FindMember(value, "params"); params != nullptr) {
    if (!ParseParams(*params, path + ".params", run.params.params, error)) {
      return false;
    }
  }

  const JsonValue* primary = core::json::FindMember(value, "primary");
  if (primary == nullptr) {
    error = path + ".primary is required";
    return false;
  }
  if (!ParseResult(*primary, path + ".primary", "", ResultRole::kPrimary, run.primary, error)) {
    return false;
  }

  if (const JsonValue* secondary = core::json::FindMember(value, "secondary");
      secondary != nullptr) {
    if (secondary->type != JsonValue::Type::kObject) {
      return TypeError(path + ".secondary", "an object", *secondary, error);
    }
    for (const auto& [name, item] : secondary->object_value) {
      Result result;
      if (!ParseResult(item, path + ".secondary." + name, name, ResultRole::kSecondary, result,
                       error)) {
        return false;
      }
      run.secondary.emplace(name, std::move(result));
    }
  }

  return true;
}

} // namespace

bool LoadRunResults(std::string_view json_text, std::vector<RunResult>& runs,
                    std::string& error) {
  runs.clear();

  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    return TypeError("document", "an object", root, error);
  }

  const JsonValue* run_list = core::json::FindMember(root, "runs");
  if (run_list == nullptr) {
    error = "runs is required";
    return false;
  }
  if (run_list->type != JsonValue::Type::kArray) {
    return TypeError("runs", "an array", *run_list, error);
  }

  std::vector<RunResult> parsed;
  parsed.reserve(run_list->array_value.size());
  for (std::size_t i = 0; i < run_list->array_value.size(); ++i) {
    RunResult run;
    if (!ParseRun(run_list->array_value[i], "runs[" + std::to_string(i) + "]", run, error)) {
      return false;
    }
    parsed.push_back(std::move(run));
  }

  runs = std::move(parsed);
  return true;
}

bool LoadRunResultsFile(const fs::path& path, std::vector<RunResult>& runs, std::string& error) {
  runs.clear();

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open run results file: " + path.string();
    return false;
  }

  const std::string contents((std::istreambuf_iterator<char>(input)),
                             std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading run results file: " + path.string();
    return false;
  }

  return LoadRunResults(contents, runs, error);
}

} // namespace benchlab::results
