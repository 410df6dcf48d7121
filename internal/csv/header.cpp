#include "header.hpp"

#include "internal/util/strings.hpp"

namespace graphingest::csv {

namespace {

HeaderColumn SplitColumn(const std::string& raw) {
  HeaderColumn column;
  column.name       = util::Trim(raw);
  column.normalized = util::ToLower(column.name);

  const auto colon = column.name.rfind(':');
  if (colon == std::string::npos) {
    column.key = column.normalized;
    return column;
  }

  column.declared_label = util::Trim(std::string_view(column.name).substr(0, colon));
  column.key            = util::ToLower(util::Trim(std::string_view(column.name).substr(colon + 1)));
  return column;
}

std::optional<std::string> LabelAt(const HeaderLayout& layout, const std::optional<std::size_t>& index) {
  if (!index) {
    return std::nullopt;
  }
  const auto& label = layout.columns[*index].declared_label;
  if (label.empty()) {
    return std::nullopt;
  }
  return label;
}

} // namespace

std::optional<std::string> HeaderLayout::DeclaredSourceLabel() const {
  return LabelAt(*this, source_column);
}

std::optional<std::string> HeaderLayout::DeclaredTargetLabel() const {
  return LabelAt(*this, target_column);
}

HeaderLayout AnalyzeHeader(const std::vector<std::string>& header) {
  HeaderLayout layout;
  layout.columns.reserve(header.size());

  for (std::size_t i = 0; i < header.size(); ++i) {
    auto column = SplitColumn(header[i]);
    if (column.key == kSourceIdColumn && !layout.source_column) {
      column.role          = ColumnRole::kSourceId;
      layout.source_column = i;
    } else if (column.key == kTargetIdColumn && !layout.target_column) {
      column.role          = ColumnRole::kTargetId;
      layout.target_column = i;
    }
    layout.columns.push_back(std::move(column));
  }

  if (layout.source_column || layout.target_column) {
    layout.kind = graphingest::v1::FILE_KIND_RELATIONSHIP;
    return layout;
  }

  layout.kind = graphingest::v1::FILE_KIND_ENTITY;
  for (std::size_t i = 0; i < layout.columns.size(); ++i) {
    if (layout.columns[i].key == kIdColumn) {
      layout.columns[i].role = ColumnRole::kId;
      layout.id_column       = i;
      break;
    }
  }
  return layout;
}

} // namespace graphingest::csv
