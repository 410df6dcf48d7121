#include "internal/graph/cypher/cypher_builder.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/util/errors.hpp"

using namespace graphingest::graph;
namespace model = graphingest::model;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestIdentifierAllowList() {
  assert(cypher::IsValidIdentifier("Person"));
  assert(cypher::IsValidIdentifier("_private"));
  assert(cypher::IsValidIdentifier("WORKS_AT2"));
  assert(!cypher::IsValidIdentifier(""));
  assert(!cypher::IsValidIdentifier("2Person"));
  assert(!cypher::IsValidIdentifier("Person Name"));
  assert(!cypher::IsValidIdentifier("Person`"));
  assert(!cypher::IsValidIdentifier("Person-Name"));

  assert(cypher::SanitizeIdentifier("Person") == "Person");

  bool threw = false;
  try {
    cypher::SanitizeIdentifier("x`) DETACH DELETE n //");
  } catch (const graphingest::util::InvalidIdentifier& e) {
    threw = Contains(e.what(), "invalid label or relationship type");
  }
  assert(threw);
}

void TestValueConversion() {
  assert(cypher::ToValue(model::PropertyValue{}).has_null_value());
  assert(cypher::ToValue(model::PropertyValue{std::int64_t{42}}).number_value() == 42.0);
  assert(cypher::ToValue(model::PropertyValue{true}).bool_value());
  assert(cypher::ToValue(model::PropertyValue{std::string("x")}).string_value() == "x");
  assert(cypher::ToValue(model::PropertyValue{model::LocalDate{2024, 1, 5}}).string_value() == "2024-01-05");
  assert(cypher::ToValue(model::NodeId{std::string("a-1")}).string_value() == "a-1");

  const auto props = cypher::ToStruct({{"name", std::string("A")}, {"missing", model::PropertyValue{}}});
  assert(props.fields().size() == 1);
  assert(props.fields().count("name") == 1);
}

void TestCoalesceKeepsFirstPositionLastProperties() {
  std::vector<NodeUpsert> nodes{
      {std::int64_t{1}, {{"v", std::int64_t{1}}}},
      {std::int64_t{2}, {{"v", std::int64_t{2}}}},
      {std::int64_t{1}, {{"v", std::int64_t{3}}}},
  };
  const auto out = cypher::CoalesceNodes(nodes);
  assert(out.size() == 2);
  assert(std::get<std::int64_t>(out[0].id) == 1);
  assert(std::get<std::int64_t>(out[0].properties[0].second) == 3);

  std::vector<RelationshipUpsert> rows{
      {std::int64_t{1}, std::int64_t{2}, {}},
      {std::int64_t{2}, std::int64_t{1}, {}},
      {std::int64_t{1}, std::int64_t{2}, {{"w", 1.5}}},
  };
  const auto rels = cypher::CoalesceRelationships(rows);
  assert(rels.size() == 2);
  assert(rels[0].properties.size() == 1);
}

void TestUpsertNodesStatement() {
  const auto statement = cypher::UpsertNodes("Person", 7, {{std::int64_t{1}, {{"name", std::string("Alice")}}}});
  assert(Contains(statement.text, "UNWIND $rows AS row"));
  assert(Contains(statement.text, "MERGE (n:`Person` {id: row.id, dataset_id: $dataset_id})"));
  assert(Contains(statement.text, "SET n = row.props"));

  const auto& fields = statement.parameters.fields();
  assert(fields.at("dataset_id").number_value() == 7.0);
  const auto& row   = fields.at("rows").list_value().values(0).struct_value().fields();
  const auto& props = row.at("props").struct_value().fields();
  assert(row.at("id").number_value() == 1.0);
  assert(props.at("name").string_value() == "Alice");
  assert(props.at("id").number_value() == 1.0);
  assert(props.at("dataset_id").number_value() == 7.0);
}

void TestUpsertRelationshipsStatement() {
  const RelationshipShape shape{"Person", "Company", "WORKS_AT"};
  const auto statement = cypher::UpsertRelationships(shape, 3, {{std::int64_t{1}, std::string("acme"), {}}});
  assert(Contains(statement.text, "MATCH (s:`Person` {id: row.source, dataset_id: $dataset_id})"));
  assert(Contains(statement.text, "MATCH (t:`Company` {id: row.target, dataset_id: $dataset_id})"));
  assert(Contains(statement.text, "MERGE (s)-[rel:`WORKS_AT` {dataset_id: $dataset_id}]->(t)"));

  const auto& row = statement.parameters.fields().at("rows").list_value().values(0).struct_value().fields();
  assert(row.at("target").string_value() == "acme");
  assert(row.at("props").struct_value().fields().at("dataset_id").number_value() == 3.0);
}

void TestCascadeStatements() {
  const auto nodes = cypher::DeleteNodesNotIn("Person", 1, {std::int64_t{2}, std::int64_t{3}});
  assert(Contains(nodes.text, "NOT n.id IN $keep"));
  assert(Contains(nodes.text, "DETACH DELETE n"));
  assert(nodes.parameters.fields().at("keep").list_value().values_size() == 2);

  const auto rels = cypher::DeleteRelationshipsOfType("KNOWS", 1);
  assert(Contains(rels.text, "MATCH ()-[r:`KNOWS`]->()"));
  assert(Contains(rels.text, "r.dataset_id = $dataset_id"));
}

void TestCountStatements() {
  assert(Contains(cypher::CountRelationships(std::nullopt, 1).text, "MATCH ()-[r]->()"));
  assert(Contains(cypher::CountRelationships(std::string("KNOWS"), 1).text, "[r:`KNOWS`]"));
  assert(Contains(cypher::CountNodes("Person", 1).text, "(n:`Person`)"));
  assert(cypher::Schema(1).size() == 3);
}

void TestStatementsRejectUnsafeIdentifiers() {
  bool threw = false;
  try {
    cypher::CountNodes("Person}) RETURN 1 //", 1);
  } catch (const graphingest::util::InvalidIdentifier&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestIdentifierAllowList();
  TestValueConversion();
  TestCoalesceKeepsFirstPositionLastProperties();
  TestUpsertNodesStatement();
  TestUpsertRelationshipsStatement();
  TestCascadeStatements();
  TestCountStatements();
  TestStatementsRejectUnsafeIdentifiers();

  std::cout << "graph_ingest_unit_cypher_builder: pass\n";
  return 0;
}
