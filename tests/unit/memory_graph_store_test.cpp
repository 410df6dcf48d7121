#include "internal/graph/memory/memory_graph_store.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "internal/util/errors.hpp"

using namespace graphingest::graph;
namespace model = graphingest::model;

namespace {

constexpr std::int64_t kDataset = 1;
constexpr std::int64_t kOther   = 2;

NodeUpsert Node(std::int64_t id, const std::string& name) {
  return {id, {{"name", std::string(name)}}};
}

void TestUpsertIsIdempotentAndReplacesProperties() {
  MemoryGraphStore store;

  auto first = store.UpsertNodes("Person", kDataset, {Node(1, "Alice"), Node(2, "Bob")});
  assert(first.written == 2 && first.created == 2);

  NodeUpsert updated{std::int64_t{1}, {{"age", std::int64_t{30}}}};
  auto       second = store.UpsertNodes("Person", kDataset, {updated});
  assert(second.written == 1 && second.created == 0);
  assert(store.CountNodes("Person", kDataset) == 2);

  const auto props = store.NodeProperties("Person", kDataset, std::int64_t{1});
  assert(props.has_value());
  assert(props->count("name") == 0);
  assert(std::get<std::int64_t>(props->at("age")) == 30);
  assert(std::get<std::int64_t>(props->at(kIdProperty)) == 1);
  assert(std::get<std::int64_t>(props->at(kDatasetProperty)) == kDataset);
}

void TestNullPropertiesAreOmitted() {
  MemoryGraphStore store;
  store.UpsertNodes("Person", kDataset, {{std::int64_t{1}, {{"nickname", model::PropertyValue{}}, {"name", std::string("A")}}}});
  const auto props = store.NodeProperties("Person", kDataset, std::int64_t{1});
  assert(props->count("nickname") == 0);
  assert(props->count("name") == 1);
}

void TestDatasetsAreIsolated() {
  MemoryGraphStore store;
  store.UpsertNodes("Person", kDataset, {Node(1, "Alice")});
  store.UpsertNodes("Person", kOther, {Node(1, "Other Alice")});

  assert(store.CountNodes("Person", kDataset) == 1);
  assert(store.CountNodes("Person", kOther) == 1);
  assert(store.FindExistingNodeIds("Person", kOther, {std::int64_t{1}, std::int64_t{2}}).size() == 1);

  store.DeleteNodesNotIn("Person", kOther, {});
  assert(store.CountNodes("Person", kDataset) == 1);
  assert(store.CountNodes("Person", kOther) == 0);
}

void TestIdentifiersAreTypeSensitive() {
  MemoryGraphStore store;
  store.UpsertNodes("Person", kDataset, {Node(1, "Alice")});
  assert(store.FindExistingNodeIds("Person", kDataset, {std::string("1")}).empty());
  assert(store.FindExistingNodeIds("Person", kDataset, {std::int64_t{1}, std::int64_t{1}}).size() == 1);
}

void TestRelationshipsRequireEndpoints() {
  MemoryGraphStore store;
  store.UpsertNodes("Person", kDataset, {Node(1, "Alice"), Node(2, "Bob")});

  const RelationshipShape knows{"Person", "Person", "KNOWS"};
  auto result = store.UpsertRelationships(knows, kDataset,
                                          {{std::int64_t{1}, std::int64_t{2}, {{"since", model::LocalDate{2024, 1, 1}}}},
                                           {std::int64_t{1}, std::int64_t{3}, {}}});
  assert(result.written == 1 && result.created == 1);

  auto again = store.UpsertRelationships(knows, kDataset, {{std::int64_t{1}, std::int64_t{2}, {}}});
  assert(again.written == 1 && again.created == 0);
  assert(store.CountRelationships(std::string("KNOWS"), kDataset) == 1);
  assert(store.CountRelationships(std::nullopt, kDataset) == 1);

  const auto props = store.RelationshipProperties(knows, kDataset, std::int64_t{1}, std::int64_t{2});
  assert(props.has_value());
  assert(props->count("since") == 0);
  assert(std::get<std::int64_t>(props->at(kDatasetProperty)) == kDataset);
}

void TestDeleteNodesNotInDetachesRelationships() {
  MemoryGraphStore store;
  store.UpsertNodes("Person", kDataset, {Node(1, "A"), Node(2, "B"), Node(3, "C")});
  const RelationshipShape knows{"Person", "Person", "KNOWS"};
  store.UpsertRelationships(knows, kDataset, {{std::int64_t{1}, std::int64_t{2}, {}}, {std::int64_t{2}, std::int64_t{3}, {}}});

  const auto deleted = store.DeleteNodesNotIn("Person", kDataset, {std::int64_t{2}, std::int64_t{3}, std::int64_t{4}});
  assert(deleted == 1);
  assert(store.CountNodes("Person", kDataset) == 2);
  assert(store.CountRelationships(std::nullopt, kDataset) == 1);
  assert(!store.RelationshipProperties(knows, kDataset, std::int64_t{1}, std::int64_t{2}).has_value());
}

void TestDeleteRelationshipsOfType() {
  MemoryGraphStore store;
  store.UpsertNodes("Person", kDataset, {Node(1, "A"), Node(2, "B")});
  store.UpsertRelationships({"Person", "Person", "KNOWS"}, kDataset, {{std::int64_t{1}, std::int64_t{2}, {}}});
  store.UpsertRelationships({"Person", "Person", "LIKES"}, kDataset, {{std::int64_t{1}, std::int64_t{2}, {}}});

  assert(store.DeleteRelationshipsOfType("KNOWS", kDataset) == 1);
  assert(store.CountRelationships(std::string("KNOWS"), kDataset) == 0);
  assert(store.CountRelationships(std::string("LIKES"), kDataset) == 1);
}

void TestSchema() {
  MemoryGraphStore store;
  store.UpsertNodes("Person", kDataset, {Node(1, "A")});
  store.UpsertNodes("City", kDataset, {{std::int64_t{9}, {{"population", std::int64_t{5}}}}});
  store.UpsertRelationships({"Person", "City", "LIVES_IN"}, kDataset, {{std::int64_t{1}, std::int64_t{9}, {}}});
  store.UpsertNodes("Ghost", kOther, {Node(1, "x")});

  const auto schema = store.Schema(kDataset);
  assert(schema.labels.size() == 2);
  assert(std::find(schema.labels.begin(), schema.labels.end(), "Ghost") == schema.labels.end());
  assert((schema.relationship_types == std::vector<std::string>{"LIVES_IN"}));
  const auto& city_keys = schema.property_keys.at("City");
  assert(std::find(city_keys.begin(), city_keys.end(), "population") != city_keys.end());
}

void TestInvalidIdentifiersAreRejected() {
  MemoryGraphStore store;
  bool             threw = false;
  try {
    store.UpsertNodes("Person`) DETACH DELETE n //", kDataset, {Node(1, "A")});
  } catch (const graphingest::util::InvalidIdentifier&) {
    threw = true;
  }
  assert(threw);
  assert(store.Schema(kDataset).labels.empty());
}

void TestConcurrentWriters() {
  MemoryGraphStore         store;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store, t] {
      for (int i = 0; i < 100; ++i) {
        store.UpsertNodes("Person", kDataset, {Node(t * 1000 + i, "n")});
      }
    });
  }
  for (auto& thread : threads) thread.join();
  assert(store.CountNodes("Person", kDataset) == 400);
}

} // namespace

int main() {
  TestUpsertIsIdempotentAndReplacesProperties();
  TestNullPropertiesAreOmitted();
  TestDatasetsAreIsolated();
  TestIdentifiersAreTypeSensitive();
  TestRelationshipsRequireEndpoints();
  TestDeleteNodesNotInDetachesRelationships();
  TestDeleteRelationshipsOfType();
  TestSchema();
  TestInvalidIdentifiersAreRejected();
  TestConcurrentWriters();

  std::cout << "graph_ingest_unit_memory_graph_store: pass\n";
  return 0;
}
