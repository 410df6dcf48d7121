#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graphingest::util {

std::string Trim(std::string_view value);
std::string ToLower(std::string_view value);
std::string ToUpper(std::string_view value);

bool IsBlank(std::string_view value);

// Joins with separator, e.g. Join({"a","b"}, ", ") -> "a, b".
std::string Join(const std::vector<std::string>& parts, std::string_view separator);

// Optional sign followed by digits only, e.g. "-42". No whitespace, no exponent.
bool LooksLikeInteger(std::string_view value);

// Full-string numeric parsers; nullopt on any trailing garbage or overflow.
std::optional<std::int64_t> ParseInt64(std::string_view value);
std::optional<double>       ParseDouble(std::string_view value);

} // namespace graphingest::util
