#pragma once

#include "results/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace benchlab::results {

// Reads the run-result document produced by the execution engine.
//
// Document shape:
//   {"runs": [{"mode": "thrpt",
//              "params": {"size": "10"},
//              "primary": {"label": ..., "samples": ..., "score": ...,
//                          "score_error": ..., "unit": ..., "policy": ...},
//              "secondary": {"<name>": {...same fields...}}}]}
//
// Contract:
// - `mode` and `primary` are required per run; `params` and `secondary` may be
//   omitted.
// - parameter values may be strings, numbers or booleans; they are stored in
//   their rendered text form.
// - per result: `score` is required; `samples` defaults to 1; `score_error`
//   may be null or omitted (NaN); `unit` defaults to ""; `policy` may be
//   omitted (unknown policy). A secondary `label` defaults to its map key.
// - runs keep document order.
// - returns false and populates `error` (prefixed with the JSON path of the
//   offending field) on any structural problem; `runs` is then left empty.
bool LoadRunResults(std::string_view json_text, std::vector<RunResult>& runs,
                    std::string& error);

// Reads `path` and forwards to `LoadRunResults`.
bool LoadRunResultsFile(const std::filesystem::path& path, std::vector<RunResult>& runs,
                        std::string& error);

} // namespace benchlab::results
