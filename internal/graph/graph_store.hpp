#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/property_value.hpp"

namespace graphingest::graph {

using model::NodeId;
using model::PropertyList;

inline constexpr const char* kIdProperty      = "id";
inline constexpr const char* kDatasetProperty = "dataset_id";

struct NodeUpsert {
  NodeId       id;
  PropertyList properties;
};

struct RelationshipUpsert {
  NodeId       source;
  NodeId       target;
  PropertyList properties;
};

// Endpoint labels and type of one relationship file.
struct RelationshipShape {
  std::string source_label;
  std::string target_label;
  std::string type;
};

struct UpsertResult {
  std::uint64_t written = 0; // rows applied, including overwrites
  std::uint64_t created = 0; // entities that did not exist before
};

struct GraphSchema {
  std::vector<std::string>                        labels;
  std::vector<std::string>                        relationship_types;
  std::map<std::string, std::vector<std::string>> property_keys; // label -> union of keys
};

/*
  Property-graph backend.

  Every node carries "id" and "dataset_id" properties and is identified by
  (label, id, dataset_id); every relationship carries "dataset_id" and is
  identified by (source, target, type, dataset_id). Upserts are idempotent:
  properties of an existing entity are overwritten, never duplicated.

  Implementations throw util::GraphStoreError on any backend failure and
  util::InvalidIdentifier when a label or type fails the allow-list.
*/
class GraphStore {
 public:
  virtual ~GraphStore() = default;

  // ------------------------------------------------------------------
  // Writes
  // ------------------------------------------------------------------
  virtual UpsertResult UpsertNodes(const std::string& label, std::int64_t dataset_id, const std::vector<NodeUpsert>& nodes) = 0;

  /*
    Rows whose endpoints do not exist are not written and do not count
    towards UpsertResult::written.
  */
  virtual UpsertResult UpsertRelationships(const RelationshipShape& shape, std::int64_t dataset_id, const std::vector<RelationshipUpsert>& rows) = 0;

  // ------------------------------------------------------------------
  // Cascade sync
  // ------------------------------------------------------------------
  // Deletes every node of label in the dataset whose id is not in keep,
  // together with its relationships. Returns the number of nodes deleted.
  virtual std::uint64_t DeleteNodesNotIn(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& keep) = 0;

  virtual std::uint64_t DeleteRelationshipsOfType(const std::string& type, std::int64_t dataset_id) = 0;

  // ------------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------------
  // Subset of ids that exist as label nodes in the dataset.
  virtual std::vector<NodeId> FindExistingNodeIds(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& ids) = 0;

  virtual std::uint64_t CountNodes(const std::string& label, std::int64_t dataset_id) = 0;

  // No type counts relationships of every type in the dataset.
  virtual std::uint64_t CountRelationships(const std::optional<std::string>& type, std::int64_t dataset_id) = 0;

  virtual GraphSchema Schema(std::int64_t dataset_id) = 0;
};

using GraphStorePtr = std::shared_ptr<GraphStore>;

} // namespace graphingest::graph
