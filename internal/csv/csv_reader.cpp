#include "csv_reader.hpp"

#include "internal/util/strings.hpp"

namespace graphingest::csv {

namespace {

enum class State {
  kStartField,
  kInField,
  kInQuoted,
  kQuoteInQuoted,
};

} // namespace

bool CsvRecord::IsBlank() const {
  for (const auto& field : fields) {
    if (!util::IsBlank(field)) {
      return false;
    }
  }
  return true;
}

CsvReader::CsvReader(std::istream& in, char delimiter) : in_(in), delimiter_(delimiter) {
}

int CsvReader::Get() {
  return in_.get();
}

int CsvReader::Peek() {
  return in_.peek();
}

void CsvReader::ConsumeLineBreak(int c) {
  if (c == '\r' && Peek() == '\n') {
    Get();
  }
  ++line_;
}

bool CsvReader::Next(CsvRecord& record) {
  record = CsvRecord{};

  if (!started_) {
    started_ = true;
    if (Peek() == 0xEF) {
      char bom[3] = {};
      in_.read(bom, 3);
      if (!(static_cast<unsigned char>(bom[1]) == 0xBB && static_cast<unsigned char>(bom[2]) == 0xBF)) {
        in_.clear();
        in_.seekg(0);
      }
    }
  }

  int c = Get();
  if (c == std::char_traits<char>::eof()) {
    return false;
  }

  record.line          = line_;
  record.record_number = ++records_read_;

  // blank physical line: a record without fields
  if (c == '\n' || c == '\r') {
    ConsumeLineBreak(c);
    return true;
  }

  std::string field;
  State       state  = State::kStartField;
  bool        quoted = false;
  bool        stray  = false;

  const auto push_field = [&]() {
    record.fields.push_back(std::move(field));
    record.quoted.push_back(quoted);
    record.stray_quote.push_back(stray);
    field.clear();
    quoted = false;
    stray  = false;
  };

  for (;; c = Get()) {
    const bool eof = c == std::char_traits<char>::eof();

    switch (state) {
      case State::kStartField:
        if (eof) {
          push_field();
          return true;
        }
        if (c == '"') {
          quoted = true;
          state  = State::kInQuoted;
        } else if (c == delimiter_) {
          push_field();
        } else if (c == '\n' || c == '\r') {
          push_field();
          ConsumeLineBreak(c);
          return true;
        } else {
          field.push_back(static_cast<char>(c));
          state = State::kInField;
        }
        break;

      case State::kInField:
        if (eof) {
          push_field();
          return true;
        }
        if (c == delimiter_) {
          push_field();
          state = State::kStartField;
        } else if (c == '\n' || c == '\r') {
          push_field();
          ConsumeLineBreak(c);
          return true;
        } else {
          if (c == '"') {
            stray = true;
          }
          field.push_back(static_cast<char>(c));
        }
        break;

      case State::kInQuoted:
        if (eof) {
          record.unterminated_field = record.fields.size();
          push_field();
          return true;
        }
        if (c == '"') {
          state = State::kQuoteInQuoted;
        } else {
          if (c == '\n') {
            ++line_;
          } else if (c == '\r' && Peek() != '\n') {
            ++line_;
          }
          field.push_back(static_cast<char>(c));
        }
        break;

      case State::kQuoteInQuoted:
        if (eof) {
          push_field();
          return true;
        }
        if (c == '"') {
          field.push_back('"');
          state = State::kInQuoted;
        } else if (c == delimiter_) {
          push_field();
          state = State::kStartField;
        } else if (c == '\n' || c == '\r') {
          push_field();
          ConsumeLineBreak(c);
          return true;
        } else {
          // text after the closing quote
          quoted = false;
          stray  = true;
          field.push_back(static_cast<char>(c));
          state = State::kInField;
        }
        break;
    }
  }
}

} // namespace graphingest::csv
