#include "label_resolver.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace graphingest::resolver {

using observability::IntField;
using observability::StringField;

namespace {

bool Contains(const std::vector<std::string>& labels, const std::string& label) {
  return std::find(labels.begin(), labels.end(), label) != labels.end();
}

std::string DefaultTarget(const std::vector<std::string>& labels, const std::string& source) {
  for (const auto& label : labels) {
    if (label != source) {
      return label;
    }
  }
  return source;
}

} // namespace

std::string_view StrategyName(Strategy strategy) {
  switch (strategy) {
    case Strategy::kDeclared:
      return "declared";
    case Strategy::kNamePattern:
      return "name_pattern";
    case Strategy::kSingleLabel:
      return "single_label";
    case Strategy::kSampling:
      return "sampling";
    case Strategy::kDefault:
      return "default";
  }
  return "unknown";
}

LabelResolver::LabelResolver(graph::GraphStore& store, const PatternTable& patterns) : store_(store), patterns_(patterns) {
}

LabelResolution LabelResolver::Resolve(const ResolutionInput& input) const {
  const auto& known = input.known_labels;

  std::vector<std::string> missing;
  for (const auto* declared : {&input.declared_source, &input.declared_target}) {
    if (*declared && !Contains(known, **declared) && !Contains(missing, **declared)) {
      missing.push_back(**declared);
    }
  }
  if (!missing.empty()) {
    throw util::ResolutionError(util::Join(missing, ", ") + " node(s) not available in dataset. Please upload the corresponding node file(s) first.");
  }
  if (known.empty()) {
    throw util::ResolutionError("No node labels available in dataset. Please upload node files first.");
  }

  std::optional<std::string> source = input.declared_source;
  std::optional<std::string> target = input.declared_target;

  LabelResolution out;
  out.source_strategy = Strategy::kDeclared;
  out.target_strategy = Strategy::kDeclared;

  auto fill = [&](Strategy strategy, const std::string& s, const std::string& t) {
    if (!source) {
      source              = s;
      out.source_strategy = strategy;
    }
    if (!target) {
      target              = t;
      out.target_strategy = strategy;
    }
  };

  if (!source || !target) {
    if (auto inferred = InferFromName(input.relationship_type, known, patterns_)) {
      GRAPHINGEST_LOG_INFO("labels inferred from relationship type", {StringField("type", input.relationship_type), StringField("source", inferred->first),
                                                                       StringField("target", inferred->second)});
      fill(Strategy::kNamePattern, inferred->first, inferred->second);
    }
  }

  if ((!source || !target) && known.size() == 1) {
    fill(Strategy::kSingleLabel, known.front(), known.front());
  }

  if (!source) {
    if ((source = Probe(input.source_sample, known, input.dataset_id, "source"))) {
      out.source_strategy = Strategy::kSampling;
    }
  }
  if (!target) {
    if ((target = Probe(input.target_sample, known, input.dataset_id, "target"))) {
      out.target_strategy = Strategy::kSampling;
    }
  }

  if (!source) {
    source              = known.front();
    out.source_strategy = Strategy::kDefault;
    out.low_confidence  = true;
    GRAPHINGEST_LOG_WARN("could not determine source label, using fallback", {StringField("label", *source)});
  }
  if (!target) {
    target              = DefaultTarget(known, *source);
    out.target_strategy = Strategy::kDefault;
    out.low_confidence  = true;
    GRAPHINGEST_LOG_WARN("could not determine target label, using fallback", {StringField("label", *target)});
  }

  if (*source == *target && known.size() > 1 && out.source_strategy != Strategy::kDeclared) {
    GRAPHINGEST_LOG_WARN("source and target labels are the same while several labels exist", {StringField("label", *source)});
  }

  out.source_label = std::move(*source);
  out.target_label = std::move(*target);
  return out;
}

std::optional<std::string> LabelResolver::Probe(const std::vector<graph::NodeId>& sample, const std::vector<std::string>& labels, std::int64_t dataset_id,
                                                std::string_view side) const {
  if (sample.empty()) {
    return std::nullopt;
  }

  std::map<std::string, std::size_t> hits;
  for (const auto& label : labels) {
    hits[label] = store_.FindExistingNodeIds(label, dataset_id, sample).size();
  }

  std::optional<std::string> best;
  std::size_t                best_hits = 0;
  bool                       tied      = false;
  for (const auto& label : labels) {
    const auto count = hits[label];
    if (count > best_hits) {
      best      = label;
      best_hits = count;
      tied      = false;
    } else if (count == best_hits && count > 0) {
      tied = true;
    }
  }

  if (!best || tied) {
    GRAPHINGEST_LOG_WARN("sampled identifiers did not single out a label",
                         {StringField("side", side), IntField("sampled", static_cast<std::int64_t>(sample.size())), IntField("best_hits", static_cast<std::int64_t>(best_hits))});
    return std::nullopt;
  }

  GRAPHINGEST_LOG_INFO("label determined from sampled identifiers", {StringField("side", side), StringField("label", *best),
                                                                     IntField("hits", static_cast<std::int64_t>(best_hits)),
                                                                     IntField("sampled", static_cast<std::int64_t>(sample.size()))});
  return best;
}

std::vector<graph::NodeId> SampleIdentifiers(const std::vector<csv::TypedRow>& rows, std::size_t column, std::size_t max_rows, std::size_t max_ids) {
  std::vector<graph::NodeId> out;
  std::set<graph::NodeId>    seen;
  const auto                 limit = std::min(max_rows, rows.size());
  for (std::size_t i = 0; i < limit && out.size() < max_ids; ++i) {
    if (auto id = csv::CoerceIdentifier(rows[i].At(column))) {
      if (seen.insert(*id).second) {
        out.push_back(std::move(*id));
      }
    }
  }
  return out;
}

} // namespace graphingest::resolver
