#include "relationship_patterns.hpp"

#include <algorithm>

#include "internal/util/strings.hpp"

namespace graphingest::resolver {

namespace {

bool Contains(const std::vector<std::string>& labels, const std::string& label) {
  return std::find(labels.begin(), labels.end(), label) != labels.end();
}

// The label itself when known, else the first known alias substitute.
std::optional<std::string> Available(const std::string& label, const std::vector<std::string>& known, const std::vector<LabelAlias>& aliases) {
  if (Contains(known, label)) {
    return label;
  }
  for (const auto& alias : aliases) {
    if (alias.label == label && Contains(known, alias.substitute)) {
      return alias.substitute;
    }
  }
  return std::nullopt;
}

} // namespace

const PatternTable& DefaultPatternTable() {
  static const PatternTable kTable = {
      {
          {"PURCHASED", "Customer", "Product"},
          {"BUY", "Customer", "Product"},
          {"ORDER", "Customer", "Product"},
          {"FOLLOWS", "User", "User"},
          {"FOLLOW", "User", "User"},
          {"IN_CATEGORY", "Product", "Category"},
          {"CATEGORY", "Product", "Category"},
          {"VIEWED", "Customer", "Product"},
          {"VIEW", "Customer", "Product"},
          {"AUTHORED", "User", "Post"},
          {"AUTHOR", "User", "Post"},
          {"COMMENTED", "User", "Comment"},
          {"COMMENT", "User", "Comment"},
      },
      {
          {"User", "Customer"},
      },
  };
  return kTable;
}

std::optional<std::pair<std::string, std::string>> InferFromName(std::string_view relationship_type, const std::vector<std::string>& known_labels,
                                                                 const PatternTable& table) {
  if (relationship_type.empty()) {
    return std::nullopt;
  }
  const auto upper = util::ToUpper(relationship_type);

  for (const auto& pattern : table.patterns) {
    if (upper.find(util::ToUpper(pattern.token)) == std::string::npos) {
      continue;
    }
    auto source = Available(pattern.source_label, known_labels, table.aliases);
    auto target = Available(pattern.target_label, known_labels, table.aliases);
    if (source && target) {
      return std::make_pair(std::move(*source), std::move(*target));
    }
  }
  return std::nullopt;
}

} // namespace graphingest::resolver
