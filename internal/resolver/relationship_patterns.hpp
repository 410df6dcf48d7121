#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace graphingest::resolver {

// Relationship type token -> conventional (source, target) labels.
struct RelationshipPattern {
  std::string token;
  std::string source_label;
  std::string target_label;
};

// A generic label that may stand in for a more specific one.
struct LabelAlias {
  std::string label;
  std::string substitute;
};

struct PatternTable {
  std::vector<RelationshipPattern> patterns;
  std::vector<LabelAlias>          aliases;
};

/*
  Built-in table: purchase/view style names connect Customer -> Product,
  follow connects User -> User, category Product -> Category, authoring
  User -> Post, commenting User -> Comment. User may be served by Customer.
*/
const PatternTable& DefaultPatternTable();

/*
  Case-insensitive substring match of relationship_type against the table,
  in table order. A pattern is accepted only if both labels (directly or via
  an alias) are in known_labels.
*/
std::optional<std::pair<std::string, std::string>> InferFromName(std::string_view relationship_type, const std::vector<std::string>& known_labels,
                                                                 const PatternTable& table = DefaultPatternTable());

} // namespace graphingest::resolver
