#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <tuple>

#include "internal/graph/graph_store.hpp"

namespace graphingest::graph {

/*
  In-process property graph.

  Backs graph.memory and the test suite. Mirrors the Neo4j backend's
  semantics, including identifier sanitization and detach-on-delete.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class MemoryGraphStore : public GraphStore {
 public:
  using Properties = std::map<std::string, model::PropertyValue>;

  MemoryGraphStore()           = default;
  ~MemoryGraphStore() override = default;

  UpsertResult UpsertNodes(const std::string& label, std::int64_t dataset_id, const std::vector<NodeUpsert>& nodes) override;
  UpsertResult UpsertRelationships(const RelationshipShape& shape, std::int64_t dataset_id, const std::vector<RelationshipUpsert>& rows) override;

  std::uint64_t DeleteNodesNotIn(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& keep) override;
  std::uint64_t DeleteRelationshipsOfType(const std::string& type, std::int64_t dataset_id) override;

  std::vector<NodeId> FindExistingNodeIds(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& ids) override;

  std::uint64_t CountNodes(const std::string& label, std::int64_t dataset_id) override;
  std::uint64_t CountRelationships(const std::optional<std::string>& type, std::int64_t dataset_id) override;

  GraphSchema Schema(std::int64_t dataset_id) override;

  // Inspection helpers.
  std::optional<Properties> NodeProperties(const std::string& label, std::int64_t dataset_id, const NodeId& id) const;
  std::optional<Properties> RelationshipProperties(const RelationshipShape& shape, std::int64_t dataset_id, const NodeId& source, const NodeId& target) const;

 private:
  struct NodeKey {
    std::string  label;
    std::int64_t dataset_id = 0;
    NodeId       id;

    bool operator<(const NodeKey& other) const {
      return std::tie(label, dataset_id, id) < std::tie(other.label, other.dataset_id, other.id);
    }
  };

  struct RelationshipKey {
    std::string  type;
    std::int64_t dataset_id = 0;
    NodeKey      source;
    NodeKey      target;

    bool operator<(const RelationshipKey& other) const {
      return std::tie(type, dataset_id, source, target) < std::tie(other.type, other.dataset_id, other.source, other.target);
    }
  };

  mutable std::shared_mutex             mutex_;
  std::map<NodeKey, Properties>         nodes_;
  std::map<RelationshipKey, Properties> relationships_;
};

} // namespace graphingest::graph
