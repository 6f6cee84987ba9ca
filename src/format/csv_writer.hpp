#pragma once

#include "format/normalized_table.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace benchlab::format {

// Quotes `field` when it contains a comma, a double quote, CR or LF, or
// starts/ends with a space; embedded quotes are doubled. Other fields are
// returned unchanged.
std::string EscapeCsvField(std::string_view field);

// Writes one comma-separated record terminated by CRLF.
void WriteCsvRecord(std::ostream& out, const std::vector<std::string>& fields);

// Serializes `table` (header first) to `out`.
//
// Contract:
// - An empty table writes nothing and succeeds.
// - Returns false and populates `error` when the stream fails.
bool WriteNormalizedCsv(const NormalizedTable& table, std::ostream& out, std::string& error);

// Writes `table` to `output_path`.
//
// Contract:
// - Creates the parent directory if needed.
// - Truncates an existing file.
// - Returns false and populates `error` on failure.
bool WriteNormalizedCsvFile(const NormalizedTable& table, const std::filesystem::path& output_path,
                            std::string& error);

} // namespace benchlab::format
