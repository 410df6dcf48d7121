#include "strings.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace graphingest::util {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Digits with optional single underscores between them, as accepted by most
// CSV producers that emit grouped numbers ("1_000").
std::string StripDigitGroups(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '_') {
      const bool between_digits = i > 0 && i + 1 < value.size() && std::isdigit(static_cast<unsigned char>(value[i - 1])) &&
                                  std::isdigit(static_cast<unsigned char>(value[i + 1]));
      if (!between_digits) {
        return {};
      }
      continue;
    }
    out.push_back(value[i]);
  }
  return out;
}

} // namespace

std::string Trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end   = value.size();
  while (begin < end && IsSpace(value[begin])) ++begin;
  while (end > begin && IsSpace(value[end - 1])) --end;
  return std::string(value.substr(begin, end - begin));
}

std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string ToUpper(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

bool IsBlank(std::string_view value) {
  return std::all_of(value.begin(), value.end(), IsSpace);
}

std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out.append(separator);
    out.append(parts[i]);
  }
  return out;
}

bool LooksLikeInteger(std::string_view value) {
  if (!value.empty() && (value.front() == '-' || value.front() == '+')) {
    value.remove_prefix(1);
  }
  if (value.empty()) {
    return false;
  }
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<std::int64_t> ParseInt64(std::string_view value) {
  const std::string trimmed = Trim(value);
  const std::string digits  = StripDigitGroups(trimmed);
  if (!LooksLikeInteger(digits)) {
    return std::nullopt;
  }

  errno           = 0;
  char*      end  = nullptr;
  const auto parsed = std::strtoll(digits.c_str(), &end, 10);
  if (errno == ERANGE || end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(parsed);
}

std::optional<double> ParseDouble(std::string_view value) {
  const std::string trimmed = Trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  // strtod accepts hexadecimal floats; CSV numbers never use them.
  if (trimmed.find_first_of("xX") != std::string::npos) {
    return std::nullopt;
  }
  const std::string cleaned = trimmed.find('_') == std::string::npos ? trimmed : StripDigitGroups(trimmed);
  if (cleaned.empty()) {
    return std::nullopt;
  }

  errno            = 0;
  char*        end = nullptr;
  const double parsed = std::strtod(cleaned.c_str(), &end);
  if (end == nullptr || *end != '\0' || end == cleaned.c_str()) {
    return std::nullopt;
  }
  if (errno == ERANGE && (parsed == HUGE_VAL || parsed == -HUGE_VAL)) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace graphingest::util
