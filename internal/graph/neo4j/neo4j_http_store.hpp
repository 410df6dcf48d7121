#pragma once

#include <functional>
#include <string>
#include <vector>

#include "google/protobuf/struct.pb.h"
#include "graphingest/config/v1/config.pb.h"
#include "internal/graph/cypher/cypher_builder.hpp"
#include "internal/graph/graph_store.hpp"

namespace graphingest::graph {

// One statement's result: column names and rows of values.
struct ResultSet {
  std::vector<std::string>                          columns;
  std::vector<std::vector<google::protobuf::Value>> rows;

  // Value of column in row, or null when absent.
  const google::protobuf::Value& At(std::size_t row, const std::string& column) const;
};

/*
  Neo4j over the HTTP transactional endpoint.

  Each call is one POST to <uri>/db/<database>/tx/commit carrying every
  statement of the operation, so an operation is atomic on the server side.
  Requests are bounded by request_timeout_ms. Transport failures, non-2xx
  replies and Neo4j "errors" entries raise util::GraphStoreError.
*/
class Neo4jHttpStore final : public GraphStore {
 public:
  // Takes a JSON request body, returns the JSON response body.
  using Transport = std::function<std::string(const std::string& body)>;

  // An empty transport means libcurl against config.uri.
  explicit Neo4jHttpStore(graphingest::runtime::config::Neo4jConfig config, Transport transport = {});

  UpsertResult UpsertNodes(const std::string& label, std::int64_t dataset_id, const std::vector<NodeUpsert>& nodes) override;
  UpsertResult UpsertRelationships(const RelationshipShape& shape, std::int64_t dataset_id, const std::vector<RelationshipUpsert>& rows) override;

  std::uint64_t DeleteNodesNotIn(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& keep) override;
  std::uint64_t DeleteRelationshipsOfType(const std::string& type, std::int64_t dataset_id) override;

  std::vector<NodeId> FindExistingNodeIds(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& ids) override;

  std::uint64_t CountNodes(const std::string& label, std::int64_t dataset_id) override;
  std::uint64_t CountRelationships(const std::optional<std::string>& type, std::int64_t dataset_id) override;

  GraphSchema Schema(std::int64_t dataset_id) override;

  // Wire codec, exposed for tests.
  static std::string            EncodeRequest(const std::vector<cypher::Statement>& statements);
  static std::vector<ResultSet> DecodeResponse(const std::string& body);

  std::string Endpoint() const;

 private:
  std::vector<ResultSet> Execute(const std::vector<cypher::Statement>& statements);
  std::string            Post(const std::string& body) const;

  graphingest::runtime::config::Neo4jConfig config_;
  Transport                                 transport_;
};

} // namespace graphingest::graph
