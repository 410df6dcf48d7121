#include "internal/csv/csv_reader.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using graphingest::csv::CsvReader;
using graphingest::csv::CsvRecord;

namespace {

std::vector<CsvRecord> ReadAll(const std::string& text, char delimiter = ',') {
  std::istringstream     in(text);
  CsvReader              reader(in, delimiter);
  std::vector<CsvRecord> records;
  CsvRecord              record;
  while (reader.Next(record)) {
    records.push_back(record);
  }
  return records;
}

void TestSimpleRecords() {
  const auto records = ReadAll("id,name\n1,Alice\n2,Bob\n");
  assert(records.size() == 3);
  assert((records[0].fields == std::vector<std::string>{"id", "name"}));
  assert((records[2].fields == std::vector<std::string>{"2", "Bob"}));
  assert(records[2].record_number == 3);
  assert(records[2].line == 3);
}

void TestQuotedFieldsWithDelimitersEscapesAndNewlines() {
  const auto records = ReadAll("id,bio\n1,\"likes \"\"tea\"\", coffee\"\n2,\"line one\nline two\"\n3,plain\n");
  assert(records.size() == 4);
  assert(records[1].fields[1] == "likes \"tea\", coffee");
  assert(records[2].fields[1] == "line one\nline two");
  assert(records[2].record_number == 3);
  // the quoted newline moves the physical line but not the record number
  assert(records[3].record_number == 4);
  assert(records[3].line == 5);
}

void TestLineEndings() {
  const auto crlf = ReadAll("a,b\r\n1,2\r\n");
  assert(crlf.size() == 2);
  assert(crlf[1].fields[1] == "2");

  const auto cr = ReadAll("a,b\r1,2\r");
  assert(cr.size() == 2);
  assert(cr[1].fields[0] == "1");

  const auto no_trailing = ReadAll("a,b\n1,2");
  assert(no_trailing.size() == 2);
  assert(no_trailing[1].fields[1] == "2");
}

void TestByteOrderMarkIsDropped() {
  const auto records = ReadAll("\xEF\xBB\xBFid,name\n1,x\n");
  assert(records.size() == 2);
  assert(records[0].fields[0] == "id");
}

void TestBlankLinesAndTrailingDelimiter() {
  const auto records = ReadAll("id,name\n\n1,\n , \n");
  assert(records.size() == 4);
  assert(records[1].IsBlank());
  assert(records[1].fields.empty());
  assert((records[2].fields == std::vector<std::string>{"1", ""}));
  assert(!records[2].IsBlank());
  assert(records[3].IsBlank());
}

void TestUnterminatedQuoteIsFlagged() {
  const auto records = ReadAll("id,name\n1,\"open ended\n2,x\n");
  assert(records.size() == 2);
  assert(records[1].unterminated_field.has_value());
  assert(*records[1].unterminated_field == 1);
  assert(!records[0].unterminated_field.has_value());
}

void TestQuotingFlags() {
  const auto records = ReadAll("\"a\",b,c\"d,\"e\"f,\n");
  assert(records.size() == 1);
  const auto& r = records[0];
  assert((r.fields == std::vector<std::string>{"a", "b", "c\"d", "ef", ""}));
  assert((r.quoted == std::vector<bool>{true, false, false, false, false}));
  assert((r.stray_quote == std::vector<bool>{false, false, true, true, false}));
}

void TestCustomDelimiter() {
  const auto records = ReadAll("id;name\n1;\"a;b\"\n", ';');
  assert(records.size() == 2);
  assert(records[1].fields[1] == "a;b");
}

} // namespace

int main() {
  TestSimpleRecords();
  TestQuotedFieldsWithDelimitersEscapesAndNewlines();
  TestLineEndings();
  TestByteOrderMarkIsDropped();
  TestBlankLinesAndTrailingDelimiter();
  TestUnterminatedQuoteIsFlagged();
  TestQuotingFlags();
  TestCustomDelimiter();

  std::cout << "graph_ingest_unit_csv_reader: pass\n";
  return 0;
}
