#include "internal/graph/neo4j/neo4j_http_store.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "internal/util/errors.hpp"

using namespace graphingest::graph;
namespace config = graphingest::runtime::config;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

config::Neo4jConfig TestConfig() {
  config::Neo4jConfig cfg;
  cfg.set_uri("http://localhost:7474/");
  cfg.set_database("neo4j");
  cfg.set_request_timeout_ms(1000);
  return cfg;
}

// Records request bodies and replays one canned response.
struct FakeTransport {
  std::vector<std::string>* requests;
  std::string               response;

  std::string operator()(const std::string& body) const {
    requests->push_back(body);
    return response;
  }
};

void TestEndpointStripsTrailingSlash() {
  std::vector<std::string> requests;
  Neo4jHttpStore           store(TestConfig(), FakeTransport{&requests, "{}"});
  assert(store.Endpoint() == "http://localhost:7474/db/neo4j/tx/commit");
}

void TestMissingUriIsRejected() {
  bool threw = false;
  try {
    Neo4jHttpStore store(config::Neo4jConfig{}, FakeTransport{nullptr, "{}"});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEncodeRequest() {
  cypher::Statement statement;
  statement.text = "RETURN 1";
  (*statement.parameters.mutable_fields())["x"].set_number_value(5);

  const auto body = Neo4jHttpStore::EncodeRequest({statement});
  assert(Contains(body, "\"statements\""));
  assert(Contains(body, "\"statement\":\"RETURN 1\""));
  assert(Contains(body, "\"x\":5"));
}

void TestDecodeResponse() {
  const auto results = Neo4jHttpStore::DecodeResponse(
      R"({"results":[{"columns":["written","created"],"data":[{"row":[3,2],"meta":[]}]}],"errors":[]})");
  assert(results.size() == 1);
  assert(results[0].columns.size() == 2);
  assert(results[0].At(0, "written").number_value() == 3.0);
  assert(results[0].At(0, "created").number_value() == 2.0);
  assert(results[0].At(0, "missing").has_null_value());
  assert(results[0].At(5, "written").has_null_value());
}

void TestNeo4jErrorsRaise() {
  bool threw = false;
  try {
    Neo4jHttpStore::DecodeResponse(R"({"results":[],"errors":[{"code":"Neo.ClientError.Statement.SyntaxError","message":"bad"}]})");
  } catch (const graphingest::util::GraphStoreError& e) {
    threw = Contains(e.what(), "Neo.ClientError.Statement.SyntaxError") && Contains(e.what(), "bad");
  }
  assert(threw);

  threw = false;
  try {
    Neo4jHttpStore::DecodeResponse("not json");
  } catch (const graphingest::util::GraphStoreError& e) {
    threw = Contains(e.what(), "malformed response");
  }
  assert(threw);
}

void TestUpsertNodesUsesResultCounts() {
  std::vector<std::string> requests;
  Neo4jHttpStore store(TestConfig(),
                       FakeTransport{&requests, R"({"results":[{"columns":["written","created"],"data":[{"row":[2,1]}]}],"errors":[]})"});

  const auto result = store.UpsertNodes("Person", 4, {{std::int64_t{1}, {}}, {std::int64_t{2}, {}}, {std::int64_t{1}, {}}});
  assert(result.written == 2);
  assert(result.created == 1);
  assert(requests.size() == 1);
  assert(Contains(requests[0], "MERGE (n:`Person`"));

  assert(store.UpsertNodes("Person", 4, {}).written == 0);
  assert(requests.size() == 1);
}

void TestFindExistingNodeIdsMapsTypes() {
  std::vector<std::string> requests;
  Neo4jHttpStore store(TestConfig(),
                       FakeTransport{&requests, R"({"results":[{"columns":["id"],"data":[{"row":[1]},{"row":["a-2"]}]}],"errors":[]})"});

  const auto ids = store.FindExistingNodeIds("Person", 1, {std::int64_t{1}, std::string("a-2"), std::int64_t{3}});
  assert(ids.size() == 2);
  assert(std::get<std::int64_t>(ids[0]) == 1);
  assert(std::get<std::string>(ids[1]) == "a-2");

  assert(store.FindExistingNodeIds("Person", 1, {}).empty());
  assert(requests.size() == 1);
}

void TestSchemaReadsThreeResultSets() {
  std::vector<std::string> requests;
  Neo4jHttpStore store(TestConfig(), FakeTransport{&requests, R"({"results":[
      {"columns":["label"],"data":[{"row":["Person"]},{"row":["Company"]}]},
      {"columns":["type"],"data":[{"row":["WORKS_AT"]}]},
      {"columns":["label","keys"],"data":[{"row":["Person",["id","dataset_id","name"]]}]}
    ],"errors":[]})"});

  const auto schema = store.Schema(1);
  assert(schema.labels.size() == 2);
  assert(schema.relationship_types.size() == 1 && schema.relationship_types[0] == "WORKS_AT");
  assert(schema.property_keys.at("Person").size() == 3);
  assert(Contains(requests[0], "labels(n)"));
}

void TestSchemaRejectsShortResponse() {
  std::vector<std::string> requests;
  Neo4jHttpStore store(TestConfig(), FakeTransport{&requests, R"({"results":[],"errors":[]})"});
  bool threw = false;
  try {
    store.Schema(1);
  } catch (const graphingest::util::GraphStoreError&) {
    threw = true;
  }
  assert(threw);
}

void TestTransportFailurePropagates() {
  Neo4jHttpStore store(TestConfig(), [](const std::string&) -> std::string {
    throw graphingest::util::GraphStoreError("connection refused");
  });
  bool threw = false;
  try {
    store.CountNodes("Person", 1);
  } catch (const graphingest::util::GraphStoreError& e) {
    threw = Contains(e.what(), "connection refused");
  }
  assert(threw);
}

} // namespace

int main() {
  TestEndpointStripsTrailingSlash();
  TestMissingUriIsRejected();
  TestEncodeRequest();
  TestDecodeResponse();
  TestNeo4jErrorsRaise();
  TestUpsertNodesUsesResultCounts();
  TestFindExistingNodeIdsMapsTypes();
  TestSchemaReadsThreeResultSets();
  TestSchemaRejectsShortResponse();
  TestTransportFailurePropagates();

  std::cout << "graph_ingest_unit_neo4j_http_store: pass\n";
  return 0;
}
