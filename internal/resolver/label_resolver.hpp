#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/csv/csv_parser.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/resolver/relationship_patterns.hpp"

namespace graphingest::resolver {

enum class Strategy {
  kDeclared,
  kNamePattern,
  kSingleLabel,
  kSampling,
  kDefault,
};

std::string_view StrategyName(Strategy strategy);

struct ResolutionInput {
  std::string  relationship_type;
  std::int64_t dataset_id = 0;

  // Header ("Label:source_id") or submit-time declarations.
  std::optional<std::string> declared_source;
  std::optional<std::string> declared_target;

  // Entity labels of the dataset, in upload order.
  std::vector<std::string> known_labels;

  // Distinct identifiers sampled from the first data rows.
  std::vector<graph::NodeId> source_sample;
  std::vector<graph::NodeId> target_sample;
};

struct LabelResolution {
  std::string source_label;
  std::string target_label;
  Strategy    source_strategy = Strategy::kDefault;
  Strategy    target_strategy = Strategy::kDefault;

  // True when either side fell back to the positional default.
  bool low_confidence = false;
};

/*
  Determines which entity labels a relationship file connects.

  First success wins, per side:
    1. declared labels, which must be known (util::ResolutionError otherwise)
    2. name pattern table
    3. the single known label
    4. sampled existence probing against the graph store (strict plurality)
    5. positional default: first known label for source, first label
       different from source for target
*/
class LabelResolver {
 public:
  explicit LabelResolver(graph::GraphStore& store, const PatternTable& patterns = DefaultPatternTable());

  LabelResolution Resolve(const ResolutionInput& input) const;

 private:
  std::optional<std::string> Probe(const std::vector<graph::NodeId>& sample, const std::vector<std::string>& labels, std::int64_t dataset_id,
                                   std::string_view side) const;

  graph::GraphStore&  store_;
  const PatternTable& patterns_;
};

/*
  Up to max_ids distinct coerced identifiers from column over the first
  max_rows rows, in encounter order.
*/
std::vector<graph::NodeId> SampleIdentifiers(const std::vector<csv::TypedRow>& rows, std::size_t column, std::size_t max_rows, std::size_t max_ids);

} // namespace graphingest::resolver
