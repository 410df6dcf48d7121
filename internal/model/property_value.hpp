#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace graphingest::model {

struct LocalDate {
  int year  = 1970;
  int month = 1;
  int day   = 1;

  bool operator==(const LocalDate&) const = default;
};

struct LocalDateTime {
  LocalDate date;
  int       hour        = 0;
  int       minute      = 0;
  int       second      = 0;
  int       microsecond = 0;

  bool operator==(const LocalDateTime&) const = default;
};

// monostate is the null marker; null properties are never written to a store.
using PropertyValue = std::variant<std::monostate, std::int64_t, double, bool, std::string, LocalDate, LocalDateTime>;

// Insertion-ordered, column order of the source file.
using PropertyList = std::vector<std::pair<std::string, PropertyValue>>;

// Numeric-looking identifiers are integers, anything else matches verbatim.
using NodeId = std::variant<std::int64_t, std::string>;

inline bool IsNull(const PropertyValue& value) {
  return std::holds_alternative<std::monostate>(value);
}

// "2024-01-05"
std::string FormatIso(const LocalDate& date);
// "2024-01-05T10:30:00" or "2024-01-05T10:30:00.250000"
std::string FormatIso(const LocalDateTime& value);

// Human readable rendering used in logs, warnings and tests.
std::string ToDisplayString(const PropertyValue& value);
std::string ToDisplayString(const NodeId& id);

PropertyValue ToPropertyValue(const NodeId& id);

} // namespace graphingest::model
