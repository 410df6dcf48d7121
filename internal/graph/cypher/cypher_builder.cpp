#include "cypher_builder.hpp"

#include <map>
#include <type_traits>
#include <utility>

#include "internal/util/errors.hpp"

namespace graphingest::graph::cypher {

namespace {

bool IsIdentifierStart(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool IsIdentifierChar(char c) {
  return IsIdentifierStart(c) || (c >= '0' && c <= '9');
}

std::string Quoted(std::string_view identifier) {
  return "`" + SanitizeIdentifier(identifier) + "`";
}

google::protobuf::Value DatasetValue(std::int64_t dataset_id) {
  google::protobuf::Value value;
  value.set_number_value(static_cast<double>(dataset_id));
  return value;
}

google::protobuf::Value IdList(const std::vector<NodeId>& ids) {
  google::protobuf::Value list;
  auto*                   values = list.mutable_list_value();
  for (const auto& id : ids) {
    *values->add_values() = ToValue(id);
  }
  return list;
}

Statement WithDataset(std::string text, std::int64_t dataset_id) {
  Statement statement;
  statement.text                                           = std::move(text);
  (*statement.parameters.mutable_fields())["dataset_id"] = DatasetValue(dataset_id);
  return statement;
}

} // namespace

bool IsValidIdentifier(std::string_view identifier) {
  if (identifier.empty() || !IsIdentifierStart(identifier.front())) {
    return false;
  }
  for (const char c : identifier) {
    if (!IsIdentifierChar(c)) {
      return false;
    }
  }
  return true;
}

std::string SanitizeIdentifier(std::string_view identifier) {
  if (!IsValidIdentifier(identifier)) {
    throw util::InvalidIdentifier("invalid label or relationship type '" + std::string(identifier) +
                                  "': only letters, digits and underscore are allowed");
  }
  return std::string(identifier);
}

google::protobuf::Value ToValue(const model::PropertyValue& value) {
  google::protobuf::Value out;
  std::visit(
      [&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          out.set_null_value(google::protobuf::NULL_VALUE);
        } else if constexpr (std::is_same_v<T, bool>) {
          out.set_bool_value(v);
        } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
          out.set_number_value(static_cast<double>(v));
        } else if constexpr (std::is_same_v<T, std::string>) {
          out.set_string_value(v);
        } else {
          out.set_string_value(model::FormatIso(v));
        }
      },
      value);
  return out;
}

google::protobuf::Value ToValue(const NodeId& id) {
  return ToValue(model::ToPropertyValue(id));
}

google::protobuf::Struct ToStruct(const PropertyList& properties) {
  google::protobuf::Struct out;
  auto&                    fields = *out.mutable_fields();
  for (const auto& [key, value] : properties) {
    if (!model::IsNull(value)) {
      fields[key] = ToValue(value);
    }
  }
  return out;
}

std::vector<NodeUpsert> CoalesceNodes(const std::vector<NodeUpsert>& nodes) {
  std::vector<NodeUpsert>       out;
  std::map<NodeId, std::size_t> index;
  for (const auto& node : nodes) {
    auto [it, inserted] = index.try_emplace(node.id, out.size());
    if (inserted) {
      out.push_back(node);
    } else {
      out[it->second].properties = node.properties;
    }
  }
  return out;
}

std::vector<RelationshipUpsert> CoalesceRelationships(const std::vector<RelationshipUpsert>& rows) {
  std::vector<RelationshipUpsert>                    out;
  std::map<std::pair<NodeId, NodeId>, std::size_t> index;
  for (const auto& row : rows) {
    auto [it, inserted] = index.try_emplace(std::make_pair(row.source, row.target), out.size());
    if (inserted) {
      out.push_back(row);
    } else {
      out[it->second].properties = row.properties;
    }
  }
  return out;
}

Statement UpsertNodes(const std::string& label, std::int64_t dataset_id, const std::vector<NodeUpsert>& nodes) {
  const auto l = Quoted(label);

  auto statement = WithDataset("UNWIND $rows AS row\n"
                               "OPTIONAL MATCH (existing:" + l + " {id: row.id, dataset_id: $dataset_id})\n"
                               "WITH row, count(existing) AS before\n"
                               "MERGE (n:" + l + " {id: row.id, dataset_id: $dataset_id})\n"
                               "SET n = row.props\n"
                               "RETURN count(n) AS written, sum(CASE WHEN before = 0 THEN 1 ELSE 0 END) AS created",
                               dataset_id);

  google::protobuf::Value rows;
  auto*                   list = rows.mutable_list_value();
  for (const auto& node : nodes) {
    google::protobuf::Value row;
    auto&                   fields = *row.mutable_struct_value()->mutable_fields();
    fields["id"]                   = ToValue(node.id);

    auto props                              = ToStruct(node.properties);
    (*props.mutable_fields())[kIdProperty]      = ToValue(node.id);
    (*props.mutable_fields())[kDatasetProperty] = DatasetValue(dataset_id);
    *fields["props"].mutable_struct_value()    = std::move(props);

    *list->add_values() = std::move(row);
  }
  (*statement.parameters.mutable_fields())["rows"] = std::move(rows);
  return statement;
}

Statement UpsertRelationships(const RelationshipShape& shape, std::int64_t dataset_id, const std::vector<RelationshipUpsert>& rows) {
  const auto s = Quoted(shape.source_label);
  const auto t = Quoted(shape.target_label);
  const auto r = Quoted(shape.type);

  auto statement = WithDataset("UNWIND $rows AS row\n"
                               "MATCH (s:" + s + " {id: row.source, dataset_id: $dataset_id})\n"
                               "MATCH (t:" + t + " {id: row.target, dataset_id: $dataset_id})\n"
                               "OPTIONAL MATCH (s)-[existing:" + r + " {dataset_id: $dataset_id}]->(t)\n"
                               "WITH s, t, row, count(existing) AS before\n"
                               "MERGE (s)-[rel:" + r + " {dataset_id: $dataset_id}]->(t)\n"
                               "SET rel = row.props\n"
                               "RETURN count(rel) AS written, sum(CASE WHEN before = 0 THEN 1 ELSE 0 END) AS created",
                               dataset_id);

  google::protobuf::Value params;
  auto*                   list = params.mutable_list_value();
  for (const auto& rel : rows) {
    google::protobuf::Value row;
    auto&                   fields = *row.mutable_struct_value()->mutable_fields();
    fields["source"]               = ToValue(rel.source);
    fields["target"]               = ToValue(rel.target);

    auto props                                  = ToStruct(rel.properties);
    (*props.mutable_fields())[kDatasetProperty] = DatasetValue(dataset_id);
    *fields["props"].mutable_struct_value()     = std::move(props);

    *list->add_values() = std::move(row);
  }
  (*statement.parameters.mutable_fields())["rows"] = std::move(params);
  return statement;
}

Statement FindExistingNodeIds(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& ids) {
  auto statement = WithDataset("MATCH (n:" + Quoted(label) + ")\n"
                               "WHERE n.dataset_id = $dataset_id AND n.id IN $ids\n"
                               "RETURN DISTINCT n.id AS id",
                               dataset_id);
  (*statement.parameters.mutable_fields())["ids"] = IdList(ids);
  return statement;
}

Statement DeleteNodesNotIn(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& keep) {
  auto statement = WithDataset("MATCH (n:" + Quoted(label) + ")\n"
                               "WHERE n.dataset_id = $dataset_id AND NOT n.id IN $keep\n"
                               "DETACH DELETE n\n"
                               "RETURN count(*) AS deleted",
                               dataset_id);
  (*statement.parameters.mutable_fields())["keep"] = IdList(keep);
  return statement;
}

Statement DeleteRelationshipsOfType(const std::string& type, std::int64_t dataset_id) {
  return WithDataset("MATCH ()-[r:" + Quoted(type) + "]->()\n"
                     "WHERE r.dataset_id = $dataset_id\n"
                     "DELETE r\n"
                     "RETURN count(*) AS deleted",
                     dataset_id);
}

Statement CountNodes(const std::string& label, std::int64_t dataset_id) {
  return WithDataset("MATCH (n:" + Quoted(label) + ")\n"
                     "WHERE n.dataset_id = $dataset_id\n"
                     "RETURN count(n) AS count",
                     dataset_id);
}

Statement CountRelationships(const std::optional<std::string>& type, std::int64_t dataset_id) {
  const std::string pattern = type ? "()-[r:" + Quoted(*type) + "]->()" : "()-[r]->()";
  return WithDataset("MATCH " + pattern + "\n"
                     "WHERE r.dataset_id = $dataset_id\n"
                     "RETURN count(r) AS count",
                     dataset_id);
}

std::vector<Statement> Schema(std::int64_t dataset_id) {
  std::vector<Statement> statements;
  statements.push_back(WithDataset("MATCH (n)\n"
                                   "WHERE n.dataset_id = $dataset_id\n"
                                   "UNWIND labels(n) AS label\n"
                                   "RETURN DISTINCT label",
                                   dataset_id));
  statements.push_back(WithDataset("MATCH ()-[r]->()\n"
                                   "WHERE r.dataset_id = $dataset_id\n"
                                   "RETURN DISTINCT type(r) AS type",
                                   dataset_id));
  statements.push_back(WithDataset("MATCH (n)\n"
                                   "WHERE n.dataset_id = $dataset_id\n"
                                   "WITH n LIMIT 1000\n"
                                   "UNWIND labels(n) AS label\n"
                                   "UNWIND keys(n) AS key\n"
                                   "RETURN label, collect(DISTINCT key) AS keys",
                                   dataset_id));
  return statements;
}

} // namespace graphingest::graph::cypher
