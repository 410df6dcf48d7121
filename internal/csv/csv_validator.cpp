#include "csv_validator.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_set>

#include "internal/csv/csv_reader.hpp"
#include "internal/util/strings.hpp"

namespace graphingest::csv {

using graphingest::v1::FILE_KIND_ENTITY;
using graphingest::v1::FILE_KIND_RELATIONSHIP;
using graphingest::v1::FILE_KIND_UNSPECIFIED;

namespace {

constexpr const char* kHeaderRequired      = "First row MUST contain column headers (property names)";
constexpr const char* kEscapingRequirement = "Proper CSV escaping for special characters required";

std::string RowPrefix(std::size_t row_number) {
  return "Row " + std::to_string(row_number) + ": ";
}

std::string CellPrefix(std::size_t row_number, std::size_t column) {
  return "Row " + std::to_string(row_number) + ", Column " + std::to_string(column) + ": ";
}

ValidationReport Fail(std::string error) {
  ValidationReport report;
  report.valid = false;
  report.errors.push_back(std::move(error));
  return report;
}

} // namespace

CsvValidator::CsvValidator(ValidatorOptions options) : options_(options) {
}

ValidationReport CsvValidator::ValidateFile(const std::string& path) const {
  const std::filesystem::path file_path(path);
  if (!std::filesystem::exists(file_path)) {
    return Fail("File not found: " + file_path.filename().string());
  }

  std::ifstream in(file_path, std::ios::binary);
  if (!in) {
    return Fail("Error reading CSV file: cannot open " + file_path.filename().string());
  }
  return Validate(in);
}

ValidationReport CsvValidator::Validate(std::istream& in) const {
  CsvReader reader(in, options_.delimiter);

  CsvRecord header;
  if (!reader.Next(header)) {
    return Fail("Empty file");
  }
  if (header.fields.empty()) {
    return Fail(kHeaderRequired);
  }
  for (const auto& cell : header.fields) {
    if (util::IsBlank(cell)) {
      return Fail(kHeaderRequired);
    }
  }

  Scan scan;
  scan.layout      = AnalyzeHeader(header.fields);
  scan.report.kind = scan.layout.kind;

  CheckRequiredColumns(scan);
  CheckDuplicateColumns(header.fields, scan);

  const std::size_t expected_columns = header.fields.size();
  std::size_t       counted          = 0;

  CsvRecord record;
  while (reader.Next(record)) {
    if (record.IsBlank()) {
      continue;
    }

    ++counted;
    if (counted > options_.row_limit) {
      if (counted == options_.row_limit + 1) {
        scan.report.warnings.push_back("File has more than " + std::to_string(options_.row_limit) + " rows. Validation limited to first " +
                                       std::to_string(options_.row_limit) + " rows.");
      }
      continue;
    }

    const std::size_t row_number = record.record_number;

    if (record.fields.size() != expected_columns) {
      scan.report.errors.push_back(RowPrefix(row_number) + "All rows must have the same number of columns (" + std::to_string(record.fields.size()) +
                                   " vs " + std::to_string(expected_columns) + ")");
      continue;
    }

    if (record.unterminated_field) {
      scan.report.warnings.push_back(CellPrefix(row_number, *record.unterminated_field + 1) + "Unterminated quote - " + kEscapingRequirement);
    }
    CheckEscaping(record, row_number, scan);

    if (scan.layout.kind == FILE_KIND_RELATIONSHIP) {
      CheckRelationshipRow(record.fields, row_number, scan);
    } else {
      CheckEntityRow(record.fields, row_number, scan);
    }
  }

  scan.report.data_rows = counted;
  if (counted == 0) {
    scan.report.warnings.push_back("No data rows found");
  }

  ConsolidateErrors(scan);
  scan.report.valid = scan.report.errors.empty();
  return std::move(scan.report);
}

void CsvValidator::CheckRequiredColumns(Scan& scan) const {
  const auto& layout = scan.layout;

  if (options_.expected_kind != FILE_KIND_UNSPECIFIED && options_.expected_kind != layout.kind) {
    if (options_.expected_kind == FILE_KIND_RELATIONSHIP) {
      scan.report.errors.push_back("Expected a relationship file but the header has no source_id/target_id columns");
    } else {
      scan.report.errors.push_back("Expected a node file but the header has source_id/target_id columns");
    }
  }

  if (layout.kind == FILE_KIND_RELATIONSHIP) {
    std::vector<std::string> missing;
    if (!layout.source_column) {
      missing.emplace_back(kSourceIdColumn);
    }
    if (!layout.target_column) {
      missing.emplace_back(kTargetIdColumn);
    }
    if (!missing.empty()) {
      scan.missing_required.insert(missing.begin(), missing.end());
      scan.report.errors.push_back("For relationship files required fields: " + util::Join(missing, " and "));
    }
    return;
  }

  if (!layout.id_column) {
    scan.missing_required.insert(std::string(kIdColumn));
    scan.report.errors.push_back("For node files required fields: id");
  }
}

void CsvValidator::CheckDuplicateColumns(const std::vector<std::string>& header, Scan& scan) const {
  std::unordered_set<std::string> seen;
  std::vector<std::string>        duplicates;
  for (const auto& cell : header) {
    auto normalized = util::ToLower(util::Trim(cell));
    if (!seen.insert(normalized).second && std::find(duplicates.begin(), duplicates.end(), normalized) == duplicates.end()) {
      duplicates.push_back(std::move(normalized));
    }
  }
  if (!duplicates.empty()) {
    scan.report.errors.push_back("Duplicate columns: " + util::Join(duplicates, ", "));
  }
}

// Enclosed cells may carry quotes and line breaks; only bare cells are suspect.
void CsvValidator::CheckEscaping(const CsvRecord& record, std::size_t row_number, Scan& scan) const {
  for (std::size_t i = 0; i < record.fields.size(); ++i) {
    const auto& cell = record.fields[i];
    if (cell.empty()) {
      continue;
    }

    const bool quoted = i < record.quoted.size() && record.quoted[i];
    const bool stray  = i < record.stray_quote.size() && record.stray_quote[i];

    if (stray) {
      scan.report.warnings.push_back(CellPrefix(row_number, i + 1) + "Possible unescaped quote - " + kEscapingRequirement);
    }

    if (!quoted && cell.find_first_of("\r\n") != std::string::npos) {
      scan.report.warnings.push_back(CellPrefix(row_number, i + 1) + "Newline detected - " + kEscapingRequirement);
    }
  }
}

void CsvValidator::CheckEntityRow(const std::vector<std::string>& row, std::size_t row_number, Scan& scan) const {
  if (!scan.layout.id_column) {
    if (scan.missing_required.count(std::string(kIdColumn)) == 0) {
      scan.report.errors.push_back(RowPrefix(row_number) + "Missing 'id' column");
    }
    return;
  }

  if (util::IsBlank(row[*scan.layout.id_column])) {
    scan.report.warnings.push_back(RowPrefix(row_number) + "Empty 'id' value, row will be skipped");
  }
}

void CsvValidator::CheckRelationshipRow(const std::vector<std::string>& row, std::size_t row_number, Scan& scan) const {
  std::string source_id;
  std::string target_id;

  if (scan.layout.source_column) {
    source_id = util::Trim(row[*scan.layout.source_column]);
    if (source_id.empty()) {
      scan.report.warnings.push_back(RowPrefix(row_number) + "Empty 'source_id', row will be skipped");
    }
  } else {
    scan.report.errors.push_back(RowPrefix(row_number) + "Missing 'source_id' column");
  }

  if (scan.layout.target_column) {
    target_id = util::Trim(row[*scan.layout.target_column]);
    if (target_id.empty()) {
      scan.report.warnings.push_back(RowPrefix(row_number) + "Empty 'target_id', row will be skipped");
    }
  } else {
    scan.report.errors.push_back(RowPrefix(row_number) + "Missing 'target_id' column");
  }

  if (!source_id.empty() && source_id == target_id) {
    scan.report.warnings.push_back(RowPrefix(row_number) +
                                   "The source and target IDs are the same. This creates a self-referencing relationship.");
  }
}

// One root cause, one message: drop exact duplicates and row-level
// "Missing ... column" errors for columns already reported from the header.
void CsvValidator::ConsolidateErrors(Scan& scan) {
  std::unordered_set<std::string> seen;
  std::vector<std::string>        consolidated;
  consolidated.reserve(scan.report.errors.size());

  for (auto& error : scan.report.errors) {
    if (!seen.insert(error).second) {
      continue;
    }

    const bool row_level_missing = error.rfind("Row ", 0) == 0 && error.find("Missing") != std::string::npos;
    if (row_level_missing) {
      const auto lowered   = util::ToLower(error);
      const bool redundant = std::any_of(scan.missing_required.begin(), scan.missing_required.end(),
                                         [&](const std::string& column) { return lowered.find(column) != std::string::npos; });
      if (redundant) {
        continue;
      }
    }
    consolidated.push_back(std::move(error));
  }

  scan.report.errors = std::move(consolidated);
}

} // namespace graphingest::csv
