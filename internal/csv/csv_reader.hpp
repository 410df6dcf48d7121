#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace graphingest::csv {

/*
  One delimited record.

  record_number is 1-based and counts records, not physical lines: the header
  is record 1 and a quoted field spanning three lines still counts once.
*/
struct CsvRecord {
  std::vector<std::string> fields;

  // Parallel to fields. quoted: enclosed in quotes with nothing after the
  // closing quote. stray_quote: a quote character outside an enclosed field,
  // e.g. ab"c or "ab"c.
  std::vector<bool> quoted;
  std::vector<bool> stray_quote;

  std::size_t              record_number = 0;
  std::size_t              line          = 0;

  // Set when the input ended inside a quoted field.
  std::optional<std::size_t> unterminated_field;

  bool IsBlank() const;
};

/*
  Streaming RFC 4180 tokenizer.

  - "" inside a quoted field is a literal quote
  - quoted fields may contain delimiters and line breaks
  - LF, CRLF and bare CR all terminate a record
  - characters after a closing quote are appended verbatim (lenient, like most
    spreadsheet exports expect)
  - a leading UTF-8 byte order mark is dropped
*/
class CsvReader {
 public:
  explicit CsvReader(std::istream& in, char delimiter = ',');

  // Returns false once the stream is exhausted.
  bool Next(CsvRecord& record);

  std::size_t RecordsRead() const {
    return records_read_;
  }

 private:
  int  Get();
  int  Peek();
  void ConsumeLineBreak(int c);

  std::istream& in_;
  char          delimiter_;
  std::size_t   line_         = 1;
  std::size_t   records_read_ = 0;
  bool          started_      = false;
};

} // namespace graphingest::csv
