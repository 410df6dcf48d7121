#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "google/protobuf/struct.pb.h"
#include "internal/graph/graph_store.hpp"

namespace graphingest::graph::cypher {

/*
  Labels and relationship types cannot be bound as parameters, so they are
  spliced into statement text. Only [A-Za-z_][A-Za-z0-9_]* is accepted; every
  interpolated identifier goes through SanitizeIdentifier first. Values are
  always parameters.
*/
bool IsValidIdentifier(std::string_view identifier);

// Returns identifier unchanged or throws util::InvalidIdentifier.
std::string SanitizeIdentifier(std::string_view identifier);

struct Statement {
  std::string                 text;
  google::protobuf::Struct    parameters;
};

google::protobuf::Value ToValue(const model::PropertyValue& value);
google::protobuf::Value ToValue(const NodeId& id);

// Parameter map for a property list, null values omitted.
google::protobuf::Struct ToStruct(const PropertyList& properties);

// Collapses rows sharing an identity into one, keeping the last row's
// properties at the first row's position.
std::vector<NodeUpsert>         CoalesceNodes(const std::vector<NodeUpsert>& nodes);
std::vector<RelationshipUpsert> CoalesceRelationships(const std::vector<RelationshipUpsert>& rows);

// RETURN written, created
Statement UpsertNodes(const std::string& label, std::int64_t dataset_id, const std::vector<NodeUpsert>& nodes);
Statement UpsertRelationships(const RelationshipShape& shape, std::int64_t dataset_id, const std::vector<RelationshipUpsert>& rows);

// RETURN id
Statement FindExistingNodeIds(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& ids);

// RETURN deleted
Statement DeleteNodesNotIn(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& keep);
Statement DeleteRelationshipsOfType(const std::string& type, std::int64_t dataset_id);

// RETURN count
Statement CountNodes(const std::string& label, std::int64_t dataset_id);
Statement CountRelationships(const std::optional<std::string>& type, std::int64_t dataset_id);

// Three statements: labels, relationship types, label -> keys.
std::vector<Statement> Schema(std::int64_t dataset_id);

} // namespace graphingest::graph::cypher
