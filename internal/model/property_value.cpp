#include "property_value.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace graphingest::model {

std::string FormatIso(const LocalDate& date) {
  return fmt::format("{:04d}-{:02d}-{:02d}", date.year, date.month, date.day);
}

std::string FormatIso(const LocalDateTime& value) {
  auto out = fmt::format("{}T{:02d}:{:02d}:{:02d}", FormatIso(value.date), value.hour, value.minute, value.second);
  if (value.microsecond != 0) {
    out += fmt::format(".{:06d}", value.microsecond);
  }
  return out;
}

std::string ToDisplayString(const PropertyValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, LocalDate> || std::is_same_v<T, LocalDateTime>) {
          return FormatIso(v);
        } else {
          return fmt::format("{}", v);
        }
      },
      value);
}

std::string ToDisplayString(const NodeId& id) {
  if (const auto* number = std::get_if<std::int64_t>(&id)) {
    return std::to_string(*number);
  }
  return std::get<std::string>(id);
}

PropertyValue ToPropertyValue(const NodeId& id) {
  if (const auto* number = std::get_if<std::int64_t>(&id)) {
    return *number;
  }
  return std::get<std::string>(id);
}

} // namespace graphingest::model
