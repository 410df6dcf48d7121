#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "graphingest/v1.hpp"

namespace graphingest::csv {

inline constexpr std::string_view kIdColumn       = "id";
inline constexpr std::string_view kSourceIdColumn = "source_id";
inline constexpr std::string_view kTargetIdColumn = "target_id";

enum class ColumnRole {
  kProperty,
  kId,
  kSourceId,
  kTargetId,
};

/*
  A header cell split into its parts.

  "Customer:source_id" -> name "Customer:source_id", normalized
  "customer:source_id", declared_label "Customer", key "source_id".
  Cells without a colon have an empty declared_label and key == normalized.
*/
struct HeaderColumn {
  std::string name;
  std::string normalized;
  std::string declared_label;
  std::string key;
  ColumnRole  role = ColumnRole::kProperty;
};

struct HeaderLayout {
  std::vector<HeaderColumn> columns;
  graphingest::v1::FileKind kind = graphingest::v1::FILE_KIND_ENTITY;

  std::optional<std::size_t> id_column;
  std::optional<std::size_t> source_column;
  std::optional<std::size_t> target_column;

  // Labels named by "Label:source_id" / "Label:target_id" cells.
  std::optional<std::string> DeclaredSourceLabel() const;
  std::optional<std::string> DeclaredTargetLabel() const;
};

// Kind is decided from header cells alone: any source_id/target_id cell makes
// it a relationship file, otherwise it is an entity file keyed by id.
HeaderLayout AnalyzeHeader(const std::vector<std::string>& header);

} // namespace graphingest::csv
