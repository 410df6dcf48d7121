#pragma once

#include <cstddef>
#include <istream>
#include <set>
#include <string>
#include <vector>

#include "graphingest/v1.hpp"
#include "internal/csv/csv_reader.hpp"
#include "internal/csv/header.hpp"

namespace graphingest::csv {

struct ValidationReport {
  bool                      valid = false;
  std::vector<std::string>  errors;
  std::vector<std::string>  warnings;
  graphingest::v1::FileKind kind = graphingest::v1::FILE_KIND_UNSPECIFIED;

  // Non-blank data rows seen, including rows past the validation limit.
  std::size_t data_rows = 0;
};

struct ValidatorOptions {
  char        delimiter = ',';
  std::size_t row_limit = 10000;

  // When set, a header describing the other kind is a structural error.
  graphingest::v1::FileKind expected_kind = graphingest::v1::FILE_KIND_UNSPECIFIED;
};

/*
  Structural and content validation of an entity or relationship CSV.

  Errors make the file unusable; warnings are surfaced to the user but never
  stop ingestion. Row numbers are 1-based record numbers, header = row 1.
*/
class CsvValidator {
 public:
  explicit CsvValidator(ValidatorOptions options = {});

  ValidationReport Validate(std::istream& in) const;
  ValidationReport ValidateFile(const std::string& path) const;

 private:
  struct Scan {
    ValidationReport      report;
    HeaderLayout          layout;
    std::set<std::string> missing_required;
  };

  void CheckRequiredColumns(Scan& scan) const;
  void CheckDuplicateColumns(const std::vector<std::string>& header, Scan& scan) const;
  void CheckEscaping(const CsvRecord& record, std::size_t row_number, Scan& scan) const;
  void CheckEntityRow(const std::vector<std::string>& row, std::size_t row_number, Scan& scan) const;
  void CheckRelationshipRow(const std::vector<std::string>& row, std::size_t row_number, Scan& scan) const;

  static void ConsolidateErrors(Scan& scan);

  ValidatorOptions options_;
};

} // namespace graphingest::csv
