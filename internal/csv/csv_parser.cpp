#include "csv_parser.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>

#include "internal/csv/csv_reader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace graphingest::csv {

CsvParser::CsvParser(ParserOptions options) : options_(options) {
}

ParsedFile CsvParser::ParseFile(const std::string& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to parse CSV file: cannot open " + path);
  }
  auto parsed = Parse(in);

  GRAPHINGEST_LOG_INFO("parsed CSV file", {observability::StringField("path", path),
                                           observability::IntField("rows", static_cast<std::int64_t>(parsed.metadata.row_count)),
                                           observability::IntField("columns", static_cast<std::int64_t>(parsed.metadata.column_count))});
  return parsed;
}

ParsedFile CsvParser::Parse(std::istream& in) const {
  CsvReader  reader(in, options_.delimiter);
  ParsedFile file;

  CsvRecord header;
  if (!reader.Next(header) || header.IsBlank()) {
    throw util::StructuralError("Empty file", {"Empty file"});
  }

  file.layout = AnalyzeHeader(header.fields);
  for (const auto& column : file.layout.columns) {
    file.metadata.columns.push_back(column.name);
  }
  file.metadata.column_count = file.metadata.columns.size();

  CsvRecord record;
  while (reader.Next(record)) {
    if (record.IsBlank()) {
      continue;
    }
    if (record.fields.size() != file.metadata.column_count) {
      file.malformed_rows.push_back("Row " + std::to_string(record.record_number) + ": Expected " + std::to_string(file.metadata.column_count) +
                                    " columns, found " + std::to_string(record.fields.size()) + "; row skipped");
      continue;
    }

    TypedRow row;
    row.record_number = record.record_number;
    row.cells.reserve(record.fields.size());
    for (std::size_t i = 0; i < record.fields.size(); ++i) {
      auto value = util::Trim(record.fields[i]);
      if (value.empty()) {
        row.cells.emplace_back(file.metadata.columns[i], std::nullopt);
      } else {
        row.cells.emplace_back(file.metadata.columns[i], std::move(value));
      }
    }
    file.rows.push_back(std::move(row));
  }

  file.metadata.row_count = file.rows.size();
  InferTypes(file);
  return file;
}

void CsvParser::InferTypes(ParsedFile& file) const {
  auto& meta = file.metadata;
  meta.data_types.assign(meta.column_count, ColumnInference{});
  meta.sample_values.assign(meta.column_count, std::nullopt);

  for (std::size_t column = 0; column < meta.column_count; ++column) {
    std::vector<std::string> values;
    values.reserve(std::min(options_.type_sample_size, file.rows.size()));
    for (const auto& row : file.rows) {
      if (values.size() >= options_.type_sample_size) {
        break;
      }
      if (const auto& cell = row.At(column)) {
        values.push_back(*cell);
      }
    }

    if (!values.empty()) {
      meta.sample_values[column] = values.front();
    }
    meta.data_types[column] = InferColumnType(values, options_.type_sample_size);
  }
}

} // namespace graphingest::csv
