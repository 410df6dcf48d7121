#include "memory_graph_store.hpp"

#include <algorithm>
#include <mutex>
#include <set>

#include "internal/graph/cypher/cypher_builder.hpp"

namespace graphingest::graph {

namespace {

// Upserts replace the whole property set, like SET n = $props.
void Replace(MemoryGraphStore::Properties& target, const PropertyList& properties) {
  target.clear();
  for (const auto& [key, value] : properties) {
    if (model::IsNull(value)) {
      continue;
    }
    target[key] = value;
  }
}

void AddUnique(std::vector<std::string>& out, const std::string& value) {
  if (std::find(out.begin(), out.end(), value) == out.end()) {
    out.push_back(value);
  }
}

} // namespace

UpsertResult MemoryGraphStore::UpsertNodes(const std::string& label, std::int64_t dataset_id, const std::vector<NodeUpsert>& nodes) {
  const auto safe_label = cypher::SanitizeIdentifier(label);

  std::unique_lock lock(mutex_);
  UpsertResult     result;
  for (const auto& node : nodes) {
    auto [it, inserted] = nodes_.try_emplace(NodeKey{safe_label, dataset_id, node.id});
    Replace(it->second, node.properties);
    it->second[kIdProperty]      = model::ToPropertyValue(node.id);
    it->second[kDatasetProperty] = dataset_id;

    ++result.written;
    if (inserted) {
      ++result.created;
    }
  }
  return result;
}

UpsertResult MemoryGraphStore::UpsertRelationships(const RelationshipShape& shape, std::int64_t dataset_id, const std::vector<RelationshipUpsert>& rows) {
  const auto source_label = cypher::SanitizeIdentifier(shape.source_label);
  const auto target_label = cypher::SanitizeIdentifier(shape.target_label);
  const auto type         = cypher::SanitizeIdentifier(shape.type);

  std::unique_lock lock(mutex_);
  UpsertResult     result;
  for (const auto& row : rows) {
    NodeKey source{source_label, dataset_id, row.source};
    NodeKey target{target_label, dataset_id, row.target};
    if (nodes_.count(source) == 0 || nodes_.count(target) == 0) {
      continue;
    }

    auto [it, inserted] = relationships_.try_emplace(RelationshipKey{type, dataset_id, std::move(source), std::move(target)});
    Replace(it->second, row.properties);
    it->second[kDatasetProperty] = dataset_id;

    ++result.written;
    if (inserted) {
      ++result.created;
    }
  }
  return result;
}

std::uint64_t MemoryGraphStore::DeleteNodesNotIn(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& keep) {
  const auto              safe_label = cypher::SanitizeIdentifier(label);
  const std::set<NodeId>  keep_set(keep.begin(), keep.end());

  std::unique_lock lock(mutex_);
  std::set<NodeKey> removed;
  for (auto it = nodes_.begin(); it != nodes_.end();) {
    const auto& key = it->first;
    if (key.label == safe_label && key.dataset_id == dataset_id && keep_set.count(key.id) == 0) {
      removed.insert(key);
      it = nodes_.erase(it);
    } else {
      ++it;
    }
  }

  if (!removed.empty()) {
    for (auto it = relationships_.begin(); it != relationships_.end();) {
      if (removed.count(it->first.source) != 0 || removed.count(it->first.target) != 0) {
        it = relationships_.erase(it);
      } else {
        ++it;
      }
    }
  }
  return removed.size();
}

std::uint64_t MemoryGraphStore::DeleteRelationshipsOfType(const std::string& type, std::int64_t dataset_id) {
  const auto safe_type = cypher::SanitizeIdentifier(type);

  std::unique_lock lock(mutex_);
  std::uint64_t    deleted = 0;
  for (auto it = relationships_.begin(); it != relationships_.end();) {
    if (it->first.type == safe_type && it->first.dataset_id == dataset_id) {
      it = relationships_.erase(it);
      ++deleted;
    } else {
      ++it;
    }
  }
  return deleted;
}

std::vector<NodeId> MemoryGraphStore::FindExistingNodeIds(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& ids) {
  const auto safe_label = cypher::SanitizeIdentifier(label);

  std::shared_lock    lock(mutex_);
  std::vector<NodeId> found;
  std::set<NodeId>    seen;
  for (const auto& id : ids) {
    if (nodes_.count(NodeKey{safe_label, dataset_id, id}) != 0 && seen.insert(id).second) {
      found.push_back(id);
    }
  }
  return found;
}

std::uint64_t MemoryGraphStore::CountNodes(const std::string& label, std::int64_t dataset_id) {
  const auto safe_label = cypher::SanitizeIdentifier(label);

  std::shared_lock lock(mutex_);
  return static_cast<std::uint64_t>(std::count_if(nodes_.begin(), nodes_.end(), [&](const auto& entry) {
    return entry.first.label == safe_label && entry.first.dataset_id == dataset_id;
  }));
}

std::uint64_t MemoryGraphStore::CountRelationships(const std::optional<std::string>& type, std::int64_t dataset_id) {
  std::optional<std::string> safe_type;
  if (type) {
    safe_type = cypher::SanitizeIdentifier(*type);
  }

  std::shared_lock lock(mutex_);
  return static_cast<std::uint64_t>(std::count_if(relationships_.begin(), relationships_.end(), [&](const auto& entry) {
    return entry.first.dataset_id == dataset_id && (!safe_type || entry.first.type == *safe_type);
  }));
}

GraphSchema MemoryGraphStore::Schema(std::int64_t dataset_id) {
  std::shared_lock lock(mutex_);
  GraphSchema      schema;
  for (const auto& [key, properties] : nodes_) {
    if (key.dataset_id != dataset_id) {
      continue;
    }
    AddUnique(schema.labels, key.label);
    auto& keys = schema.property_keys[key.label];
    for (const auto& property : properties) {
      AddUnique(keys, property.first);
    }
  }
  for (const auto& entry : relationships_) {
    if (entry.first.dataset_id == dataset_id) {
      AddUnique(schema.relationship_types, entry.first.type);
    }
  }
  return schema;
}

std::optional<MemoryGraphStore::Properties> MemoryGraphStore::NodeProperties(const std::string& label, std::int64_t dataset_id, const NodeId& id) const {
  std::shared_lock lock(mutex_);
  auto             it = nodes_.find(NodeKey{label, dataset_id, id});
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<MemoryGraphStore::Properties> MemoryGraphStore::RelationshipProperties(const RelationshipShape& shape, std::int64_t dataset_id, const NodeId& source,
                                                                                     const NodeId& target) const {
  std::shared_lock lock(mutex_);
  auto it = relationships_.find(RelationshipKey{shape.type, dataset_id, NodeKey{shape.source_label, dataset_id, source}, NodeKey{shape.target_label, dataset_id, target}});
  if (it == relationships_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace graphingest::graph
