#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/csv/header.hpp"
#include "internal/csv/type_inference.hpp"

namespace graphingest::csv {

/*
  One parsed data row, keyed by header name in column order.

  Values are trimmed raw strings; an empty cell is nullopt. Conversion to typed
  values happens at ingestion time, see ConvertValue.
*/
struct TypedRow {
  std::vector<std::pair<std::string, std::optional<std::string>>> cells;
  std::size_t record_number = 0;

  const std::optional<std::string>& At(std::size_t column) const {
    return cells[column].second;
  }
};

struct FileMetadata {
  std::size_t                             row_count    = 0;
  std::size_t                             column_count = 0;
  std::vector<std::string>                columns;
  std::vector<ColumnInference>            data_types;
  std::vector<std::optional<std::string>> sample_values;
};

struct ParsedFile {
  HeaderLayout          layout;
  std::vector<TypedRow> rows;
  FileMetadata          metadata;

  // "Row N: ..." for rows dropped because their width differs from the header.
  std::vector<std::string> malformed_rows;
};

struct ParserOptions {
  char        delimiter        = ',';
  std::size_t type_sample_size = 100;
};

/*
  Materializes a validated file.

  Blank rows are skipped. Validation only inspects a prefix of large files, so
  a row whose width differs from the header is dropped and reported in
  malformed_rows instead of failing the file.
*/
class CsvParser {
 public:
  explicit CsvParser(ParserOptions options = {});

  ParsedFile Parse(std::istream& in) const;
  ParsedFile ParseFile(const std::string& path) const;

 private:
  void InferTypes(ParsedFile& file) const;

  ParserOptions options_;
};

} // namespace graphingest::csv
