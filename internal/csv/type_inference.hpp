#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "graphingest/v1.hpp"
#include "internal/model/property_value.hpp"

namespace graphingest::csv {

using graphingest::v1::ColumnType;

/*
  Inferred type of one column.

  format is the strptime-style pattern that matched every sampled value for
  DATE and DATETIME columns, empty otherwise.
*/
struct ColumnInference {
  ColumnType       type = graphingest::v1::COLUMN_TYPE_UNKNOWN;
  std::string_view format;
};

// Ordered: the first format that parses the whole sample wins.
const std::vector<std::string_view>& DateFormats();
const std::vector<std::string_view>& DateTimeFormats();

// Strict strptime subset: %Y %m %d %H %M %S %f and literal characters.
// Calendar checks included, so "02/30/2024" does not parse.
std::optional<model::LocalDateTime> ParseWithFormat(std::string_view value, std::string_view format);

bool IsIntegerValue(std::string_view value);
bool IsFloatValue(std::string_view value);
bool IsBooleanValue(std::string_view value);

/*
  Classifies a column from its non-null values.

  Only the first sample_size values are examined. Precedence is
  integer > float > boolean > date > datetime > string; a class wins only when
  every sampled value parses. An empty sample yields UNKNOWN.
*/
ColumnInference InferColumnType(const std::vector<std::string>& values, std::size_t sample_size = 100);

/*
  Best-effort conversion of a raw cell.

  Never throws: a value that does not fit the inferred type comes back as the
  original string. Null (nullopt or empty) converts to the null marker.
*/
model::PropertyValue ConvertValue(const std::optional<std::string>& raw, const ColumnInference& inference);

// Identifier columns are exempt from the soft-fail policy: numeric-looking
// ids always become integers, others stay verbatim. Blank ids yield nullopt.
std::optional<model::NodeId> CoerceIdentifier(const std::optional<std::string>& raw);

std::string_view ColumnTypeName(ColumnType type);

} // namespace graphingest::csv
