#include "type_inference.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

#include "internal/util/strings.hpp"

namespace graphingest::csv {

using graphingest::v1::COLUMN_TYPE_BOOLEAN;
using graphingest::v1::COLUMN_TYPE_DATE;
using graphingest::v1::COLUMN_TYPE_DATETIME;
using graphingest::v1::COLUMN_TYPE_FLOAT;
using graphingest::v1::COLUMN_TYPE_INTEGER;
using graphingest::v1::COLUMN_TYPE_STRING;
using graphingest::v1::COLUMN_TYPE_UNKNOWN;

namespace {

constexpr std::array<std::string_view, 6> kBooleanWords  = {"true", "false", "1", "0", "yes", "no"};
constexpr std::array<std::string_view, 3> kTruthyWords   = {"true", "1", "yes"};

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
  static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) {
    return 29;
  }
  return kDays[static_cast<std::size_t>(month - 1)];
}

// Reads between min_digits and max_digits ASCII digits at pos.
std::optional<int> ReadNumber(std::string_view value, std::size_t& pos, std::size_t min_digits, std::size_t max_digits, std::size_t* digits_read = nullptr) {
  std::size_t count  = 0;
  int         result = 0;
  while (pos < value.size() && count < max_digits && value[pos] >= '0' && value[pos] <= '9') {
    result = result * 10 + (value[pos] - '0');
    ++pos;
    ++count;
  }
  if (count < min_digits) {
    return std::nullopt;
  }
  if (digits_read != nullptr) {
    *digits_read = count;
  }
  return result;
}

bool AllOf(const std::vector<std::string>& sample, bool (*predicate)(std::string_view)) {
  return std::all_of(sample.begin(), sample.end(), [predicate](const std::string& v) { return predicate(v); });
}

std::optional<std::string_view> FirstFormatMatchingAll(const std::vector<std::string>& sample, const std::vector<std::string_view>& formats) {
  for (const auto format : formats) {
    const bool all_match = std::all_of(sample.begin(), sample.end(), [format](const std::string& v) { return ParseWithFormat(v, format).has_value(); });
    if (all_match) {
      return format;
    }
  }
  return std::nullopt;
}

std::optional<model::LocalDateTime> ParseWithAny(std::string_view value, const std::vector<std::string_view>& formats) {
  for (const auto format : formats) {
    if (auto parsed = ParseWithFormat(value, format)) {
      return parsed;
    }
  }
  return std::nullopt;
}

} // namespace

const std::vector<std::string_view>& DateFormats() {
  static const std::vector<std::string_view> kFormats = {"%Y-%m-%d", "%m/%d/%Y", "%d/%m/%Y", "%Y/%m/%d"};
  return kFormats;
}

const std::vector<std::string_view>& DateTimeFormats() {
  static const std::vector<std::string_view> kFormats = {
      "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S.%f", "%Y-%m-%dT%H:%M:%S.%f", "%m/%d/%Y %H:%M:%S",
  };
  return kFormats;
}

std::optional<model::LocalDateTime> ParseWithFormat(std::string_view value, std::string_view format) {
  model::LocalDateTime out;
  std::size_t          pos = 0;

  for (std::size_t i = 0; i < format.size(); ++i) {
    const char f = format[i];
    if (f != '%') {
      if (pos >= value.size() || value[pos] != f) {
        return std::nullopt;
      }
      ++pos;
      continue;
    }

    if (++i >= format.size()) {
      return std::nullopt;
    }

    std::optional<int> field;
    switch (format[i]) {
      case 'Y':
        field = ReadNumber(value, pos, 4, 4);
        if (field) out.date.year = *field;
        break;
      case 'm':
        field = ReadNumber(value, pos, 1, 2);
        if (field) out.date.month = *field;
        break;
      case 'd':
        field = ReadNumber(value, pos, 1, 2);
        if (field) out.date.day = *field;
        break;
      case 'H':
        field = ReadNumber(value, pos, 1, 2);
        if (field) out.hour = *field;
        break;
      case 'M':
        field = ReadNumber(value, pos, 1, 2);
        if (field) out.minute = *field;
        break;
      case 'S':
        field = ReadNumber(value, pos, 1, 2);
        if (field) out.second = *field;
        break;
      case 'f': {
        std::size_t digits = 0;
        field              = ReadNumber(value, pos, 1, 6, &digits);
        if (field) {
          int micros = *field;
          for (; digits < 6; ++digits) {
            micros *= 10;
          }
          out.microsecond = micros;
        }
        break;
      }
      default:
        return std::nullopt;
    }
    if (!field) {
      return std::nullopt;
    }
  }

  if (pos != value.size()) {
    return std::nullopt;
  }

  const auto& d = out.date;
  if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > DaysInMonth(d.year, d.month)) {
    return std::nullopt;
  }
  if (out.hour > 23 || out.minute > 59 || out.second > 61) {
    return std::nullopt;
  }
  return out;
}

bool IsIntegerValue(std::string_view value) {
  return util::ParseInt64(value).has_value();
}

bool IsFloatValue(std::string_view value) {
  return util::ParseDouble(value).has_value();
}

bool IsBooleanValue(std::string_view value) {
  const auto lowered = util::ToLower(value);
  return std::find(kBooleanWords.begin(), kBooleanWords.end(), lowered) != kBooleanWords.end();
}

ColumnInference InferColumnType(const std::vector<std::string>& values, std::size_t sample_size) {
  if (values.empty()) {
    return {COLUMN_TYPE_UNKNOWN, {}};
  }

  const std::vector<std::string> sample(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(std::min(sample_size, values.size())));

  if (AllOf(sample, IsIntegerValue)) {
    return {COLUMN_TYPE_INTEGER, {}};
  }
  if (AllOf(sample, IsFloatValue)) {
    return {COLUMN_TYPE_FLOAT, {}};
  }
  if (AllOf(sample, IsBooleanValue)) {
    return {COLUMN_TYPE_BOOLEAN, {}};
  }
  if (auto format = FirstFormatMatchingAll(sample, DateFormats())) {
    return {COLUMN_TYPE_DATE, *format};
  }
  if (auto format = FirstFormatMatchingAll(sample, DateTimeFormats())) {
    return {COLUMN_TYPE_DATETIME, *format};
  }
  return {COLUMN_TYPE_STRING, {}};
}

model::PropertyValue ConvertValue(const std::optional<std::string>& raw, const ColumnInference& inference) {
  if (!raw || raw->empty()) {
    return std::monostate{};
  }
  const std::string& value = *raw;

  switch (inference.type) {
    case COLUMN_TYPE_INTEGER:
      if (auto parsed = util::ParseInt64(value)) {
        return *parsed;
      }
      break;
    case COLUMN_TYPE_FLOAT:
      if (auto parsed = util::ParseDouble(value)) {
        return *parsed;
      }
      break;
    case COLUMN_TYPE_BOOLEAN:
      if (IsBooleanValue(value)) {
        const auto lowered = util::ToLower(value);
        return std::find(kTruthyWords.begin(), kTruthyWords.end(), lowered) != kTruthyWords.end();
      }
      break;
    case COLUMN_TYPE_DATE: {
      auto parsed = inference.format.empty() ? ParseWithAny(value, DateFormats()) : ParseWithFormat(value, inference.format);
      if (parsed) {
        return parsed->date;
      }
      break;
    }
    case COLUMN_TYPE_DATETIME: {
      auto parsed = inference.format.empty() ? ParseWithAny(value, DateTimeFormats()) : ParseWithFormat(value, inference.format);
      if (parsed) {
        return *parsed;
      }
      break;
    }
    default:
      break;
  }
  return value;
}

std::optional<model::NodeId> CoerceIdentifier(const std::optional<std::string>& raw) {
  if (!raw) {
    return std::nullopt;
  }
  auto value = util::Trim(*raw);
  if (value.empty()) {
    return std::nullopt;
  }
  if (util::LooksLikeInteger(value)) {
    if (auto parsed = util::ParseInt64(value)) {
      return model::NodeId{*parsed};
    }
  }
  return model::NodeId{std::move(value)};
}

std::string_view ColumnTypeName(ColumnType type) {
  switch (type) {
    case COLUMN_TYPE_INTEGER:
      return "integer";
    case COLUMN_TYPE_FLOAT:
      return "float";
    case COLUMN_TYPE_BOOLEAN:
      return "boolean";
    case COLUMN_TYPE_DATE:
      return "date";
    case COLUMN_TYPE_DATETIME:
      return "datetime";
    case COLUMN_TYPE_STRING:
      return "string";
    default:
      return "unknown";
  }
}

} // namespace graphingest::csv
