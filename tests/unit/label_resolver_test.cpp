#include "internal/resolver/label_resolver.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/graph/memory/memory_graph_store.hpp"
#include "internal/util/errors.hpp"

using graphingest::graph::MemoryGraphStore;
using graphingest::graph::NodeId;
using graphingest::graph::NodeUpsert;
using namespace graphingest::resolver;

namespace {

constexpr std::int64_t kDataset = 7;

void AddNodes(MemoryGraphStore& store, const std::string& label, const std::vector<NodeId>& ids) {
  std::vector<NodeUpsert> nodes;
  for (const auto& id : ids) {
    nodes.push_back({id, {}});
  }
  store.UpsertNodes(label, kDataset, nodes);
}

ResolutionInput Input(const std::string& type, std::vector<std::string> known) {
  ResolutionInput input;
  input.relationship_type = type;
  input.dataset_id        = kDataset;
  input.known_labels      = std::move(known);
  return input;
}

void TestDeclaredLabelsWinOverEverything() {
  MemoryGraphStore store;
  // sampling would say Person -> Person
  AddNodes(store, "Person", {std::int64_t{1}, std::int64_t{2}});

  auto input            = Input("PURCHASED", {"Person", "Customer", "Product"});
  input.declared_source = "Customer";
  input.declared_target = "Product";
  input.source_sample   = {std::int64_t{1}};
  input.target_sample   = {std::int64_t{2}};

  const auto resolution = LabelResolver(store).Resolve(input);
  assert(resolution.source_label == "Customer");
  assert(resolution.target_label == "Product");
  assert(resolution.source_strategy == Strategy::kDeclared);
  assert(resolution.target_strategy == Strategy::kDeclared);
  assert(!resolution.low_confidence);
}

void TestUnknownDeclaredLabelIsFatal() {
  MemoryGraphStore store;
  auto             input = Input("LIKES", {"Customer"});
  input.declared_source  = "Customer";
  input.declared_target  = "Movie";

  bool threw = false;
  try {
    (void)LabelResolver(store).Resolve(input);
  } catch (const graphingest::util::ResolutionError& e) {
    threw = std::string(e.what()) == "Movie node(s) not available in dataset. Please upload the corresponding node file(s) first.";
  }
  assert(threw);
}

void TestNoKnownLabelsIsFatal() {
  MemoryGraphStore store;
  bool             threw = false;
  try {
    (void)LabelResolver(store).Resolve(Input("LIKES", {}));
  } catch (const graphingest::util::ResolutionError& e) {
    threw = std::string(e.what()) == "No node labels available in dataset. Please upload node files first.";
  }
  assert(threw);
}

void TestNamePattern() {
  MemoryGraphStore store;
  const auto       resolution = LabelResolver(store).Resolve(Input("PURCHASED", {"Product", "Customer"}));
  assert(resolution.source_label == "Customer");
  assert(resolution.target_label == "Product");
  assert(resolution.source_strategy == Strategy::kNamePattern);
}

void TestSingleLabel() {
  MemoryGraphStore store;
  const auto       resolution = LabelResolver(store).Resolve(Input("KNOWS", {"Person"}));
  assert(resolution.source_label == "Person");
  assert(resolution.target_label == "Person");
  assert(resolution.source_strategy == Strategy::kSingleLabel);
}

void TestSamplingPicksPluralityPerSide() {
  MemoryGraphStore store;
  AddNodes(store, "Author", {std::int64_t{1}, std::int64_t{2}, std::int64_t{3}});
  AddNodes(store, "Book", {std::int64_t{3}, std::string("isbn-1"), std::string("isbn-2")});

  auto input          = Input("WROTE", {"Book", "Author"});
  input.source_sample = {std::int64_t{1}, std::int64_t{2}, std::int64_t{3}};
  input.target_sample = {std::string("isbn-1"), std::string("isbn-2"), std::int64_t{3}};

  const auto resolution = LabelResolver(store).Resolve(input);
  assert(resolution.source_label == "Author");
  assert(resolution.target_label == "Book");
  assert(resolution.source_strategy == Strategy::kSampling);
  assert(resolution.target_strategy == Strategy::kSampling);
  assert(!resolution.low_confidence);
}

void TestTieFallsThroughToDefault() {
  MemoryGraphStore store;
  AddNodes(store, "A", {std::int64_t{1}});
  AddNodes(store, "B", {std::int64_t{1}});

  auto input          = Input("LINKS", {"A", "B"});
  input.source_sample = {std::int64_t{1}};
  input.target_sample = {std::int64_t{99}};

  const auto resolution = LabelResolver(store).Resolve(input);
  assert(resolution.source_label == "A");
  assert(resolution.target_label == "B");
  assert(resolution.source_strategy == Strategy::kDefault);
  assert(resolution.target_strategy == Strategy::kDefault);
  assert(resolution.low_confidence);
}

void TestPartialDeclarationKeepsDeclaredSide() {
  MemoryGraphStore store;
  AddNodes(store, "Tag", {std::string("red")});

  auto input            = Input("TAGGED", {"Post", "Tag"});
  input.declared_source = "Post";
  input.target_sample   = {std::string("red")};

  const auto resolution = LabelResolver(store).Resolve(input);
  assert(resolution.source_label == "Post");
  assert(resolution.source_strategy == Strategy::kDeclared);
  assert(resolution.target_label == "Tag");
  assert(resolution.target_strategy == Strategy::kSampling);
}

void TestSampleIdentifiers() {
  std::vector<graphingest::csv::TypedRow> rows;
  for (const char* value : {"1", "1", "", "x", "2", "3", "4"}) {
    graphingest::csv::TypedRow row;
    row.cells.emplace_back("source_id", std::string(value).empty() ? std::nullopt : std::optional<std::string>(value));
    rows.push_back(row);
  }

  const auto sample = SampleIdentifiers(rows, 0, 5, 10);
  assert(sample.size() == 3);
  assert(std::get<std::int64_t>(sample[0]) == 1);
  assert(std::get<std::string>(sample[1]) == "x");
  assert(std::get<std::int64_t>(sample[2]) == 2);

  assert(SampleIdentifiers(rows, 0, 100, 2).size() == 2);
}

void TestStrategyNames() {
  assert(StrategyName(Strategy::kNamePattern) == "name_pattern");
  assert(StrategyName(Strategy::kDefault) == "default");
}

} // namespace

int main() {
  TestDeclaredLabelsWinOverEverything();
  TestUnknownDeclaredLabelIsFatal();
  TestNoKnownLabelsIsFatal();
  TestNamePattern();
  TestSingleLabel();
  TestSamplingPicksPluralityPerSide();
  TestTieFallsThroughToDefault();
  TestPartialDeclarationKeepsDeclaredSide();
  TestSampleIdentifiers();
  TestStrategyNames();

  std::cout << "graph_ingest_unit_label_resolver: pass\n";
  return 0;
}
