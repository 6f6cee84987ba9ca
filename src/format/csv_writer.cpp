#include "format/csv_writer.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace benchlab::format {

namespace {

constexpr std::string_view kRecordSeparator = "\r\n";

bool NeedsQuoting(std::string_view field) {
  if (field.empty()) {
    return false;
  }
  if (field.front() == ' ' || field.back() == ' ') {
    return true;
  }
  return field.find_first_of(",\"\r\n") != std::string_view::npos;
}

} // namespace

std::string EscapeCsvField(std::string_view field) {
  if (!NeedsQuoting(field)) {
    return std::string(field);
  }

  std::string quoted;
  quoted.reserve(field.size() + 2U);
  quoted.push_back('"');
  for (const char c : field) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

void WriteCsvRecord(std::ostream& out, const std::vector<std::string>& fields) {
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << EscapeCsvField(fields[i]);
  }
  out << kRecordSeparator;
}

bool WriteNormalizedCsv(const NormalizedTable& table, std::ostream& out, std::string& error) {
  if (table.empty()) {
    return true;
  }

  WriteCsvRecord(out, table.header);
  for (const auto& row : table.rows) {
    WriteCsvRecord(out, row);
  }
  out.flush();

  if (!out) {
    error = "failed while writing normalized csv output";
    return false;
  }
  return true;
}

bool WriteNormalizedCsvFile(const NormalizedTable& table, const fs::path& output_path,
                            std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const fs::path parent = output_path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      error = "failed to create output directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  std::ofstream out_file(output_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open output file '" + output_path.string() + "' for writing";
    return false;
  }

  if (!WriteNormalizedCsv(table, out_file, error)) {
    error = "failed while writing output file '" + output_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace benchlab::format
