#include "neo4j_http_store.hpp"

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace graphingest::graph {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlList   = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag g_curl_init;

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), size * nmemb);
  return size * nmemb;
}

const google::protobuf::Value& NullValue() {
  static const google::protobuf::Value kNull = [] {
    google::protobuf::Value v;
    v.set_null_value(google::protobuf::NULL_VALUE);
    return v;
  }();
  return kNull;
}

std::uint64_t ToCount(const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::kNumberValue || value.number_value() < 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(std::llround(value.number_value()));
}

// Neo4j integers arrive as JSON numbers; integral numbers map back to int64 ids.
std::optional<NodeId> ToNodeId(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::trunc(number) == number) {
        return NodeId{static_cast<std::int64_t>(number)};
      }
      return NodeId{std::to_string(number)};
    }
    case google::protobuf::Value::kStringValue:
      return NodeId{value.string_value()};
    default:
      return std::nullopt;
  }
}

UpsertResult ToUpsertResult(const std::vector<ResultSet>& results) {
  UpsertResult out;
  if (results.empty() || results.front().rows.empty()) {
    return out;
  }
  out.written = ToCount(results.front().At(0, "written"));
  out.created = ToCount(results.front().At(0, "created"));
  return out;
}

std::uint64_t FirstCount(const std::vector<ResultSet>& results, const std::string& column) {
  if (results.empty() || results.front().rows.empty()) {
    return 0;
  }
  return ToCount(results.front().At(0, column));
}

} // namespace

const google::protobuf::Value& ResultSet::At(std::size_t row, const std::string& column) const {
  if (row >= rows.size()) {
    return NullValue();
  }
  for (std::size_t i = 0; i < columns.size() && i < rows[row].size(); ++i) {
    if (columns[i] == column) {
      return rows[row][i];
    }
  }
  return NullValue();
}

Neo4jHttpStore::Neo4jHttpStore(graphingest::runtime::config::Neo4jConfig config, Transport transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (config_.uri().empty()) {
    throw std::runtime_error("graph.neo4j.uri is required");
  }
  while (!config_.uri().empty() && config_.uri().back() == '/') {
    config_.mutable_uri()->pop_back();
  }
  if (!transport_) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }
}

std::string Neo4jHttpStore::Endpoint() const {
  return config_.uri() + "/db/" + config_.database() + "/tx/commit";
}

std::string Neo4jHttpStore::EncodeRequest(const std::vector<cypher::Statement>& statements) {
  google::protobuf::Struct request;
  auto* list = (*request.mutable_fields())["statements"].mutable_list_value();
  for (const auto& statement : statements) {
    auto& fields                                   = *list->add_values()->mutable_struct_value()->mutable_fields();
    fields["statement"].set_string_value(statement.text);
    *fields["parameters"].mutable_struct_value() = statement.parameters;
  }

  std::string body;
  const auto  status = google::protobuf::util::MessageToJsonString(request, &body);
  if (!status.ok()) {
    throw util::GraphStoreError("failed to encode cypher request: " + status.ToString());
  }
  return body;
}

std::vector<ResultSet> Neo4jHttpStore::DecodeResponse(const std::string& body) {
  google::protobuf::Struct response;
  const auto               status = google::protobuf::util::JsonStringToMessage(body, &response);
  if (!status.ok()) {
    throw util::GraphStoreError("malformed response from Neo4j: " + status.ToString());
  }

  const auto& fields = response.fields();

  auto errors = fields.find("errors");
  if (errors != fields.end() && errors->second.list_value().values_size() > 0) {
    const auto& first   = errors->second.list_value().values(0).struct_value().fields();
    std::string code    = first.count("code") ? first.at("code").string_value() : "unknown";
    std::string message = first.count("message") ? first.at("message").string_value() : "no message";
    throw util::GraphStoreError("Neo4j error " + code + ": " + message);
  }

  std::vector<ResultSet> out;
  auto                   results = fields.find("results");
  if (results == fields.end()) {
    return out;
  }

  for (const auto& result : results->second.list_value().values()) {
    const auto& rf = result.struct_value().fields();
    ResultSet   set;
    if (auto columns = rf.find("columns"); columns != rf.end()) {
      for (const auto& column : columns->second.list_value().values()) {
        set.columns.push_back(column.string_value());
      }
    }
    if (auto data = rf.find("data"); data != rf.end()) {
      for (const auto& entry : data->second.list_value().values()) {
        const auto& ef  = entry.struct_value().fields();
        auto        row = ef.find("row");
        if (row == ef.end()) {
          continue;
        }
        const auto& values = row->second.list_value().values();
        set.rows.emplace_back(values.begin(), values.end());
      }
    }
    out.push_back(std::move(set));
  }
  return out;
}

std::string Neo4jHttpStore::Post(const std::string& body) const {
  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw util::GraphStoreError("failed to initialize libcurl");
  }

  CurlList headers(nullptr, &curl_slist_free_all);
  for (const char* header : {"Content-Type: application/json", "Accept: application/json;charset=UTF-8"}) {
    auto* appended = curl_slist_append(headers.get(), header);
    if (appended == nullptr) {
      throw util::GraphStoreError("failed to build HTTP headers");
    }
    headers.release();
    headers.reset(appended);
  }

  const auto  url = Endpoint();
  std::string response;
  std::string credentials = config_.username() + ":" + config_.password();

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.request_timeout_ms()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (!config_.username().empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl.get(), CURLOPT_USERPWD, credentials.c_str());
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw util::GraphStoreError("Neo4j request to " + url + " failed: " + curl_easy_strerror(res));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    throw util::GraphStoreError("Neo4j returned HTTP " + std::to_string(http_code) + ": " + response.substr(0, 512));
  }
  return response;
}

std::vector<ResultSet> Neo4jHttpStore::Execute(const std::vector<cypher::Statement>& statements) {
  const auto body     = EncodeRequest(statements);
  const auto response = transport_ ? transport_(body) : Post(body);
  return DecodeResponse(response);
}

UpsertResult Neo4jHttpStore::UpsertNodes(const std::string& label, std::int64_t dataset_id, const std::vector<NodeUpsert>& nodes) {
  if (nodes.empty()) {
    return {};
  }
  return ToUpsertResult(Execute({cypher::UpsertNodes(label, dataset_id, cypher::CoalesceNodes(nodes))}));
}

UpsertResult Neo4jHttpStore::UpsertRelationships(const RelationshipShape& shape, std::int64_t dataset_id, const std::vector<RelationshipUpsert>& rows) {
  if (rows.empty()) {
    return {};
  }
  const auto coalesced = cypher::CoalesceRelationships(rows);
  auto       result    = ToUpsertResult(Execute({cypher::UpsertRelationships(shape, dataset_id, coalesced)}));
  if (result.written < coalesced.size()) {
    GRAPHINGEST_LOG_WARN("relationship rows not written, endpoints missing",
                         {observability::StringField("type", shape.type), observability::IntField("written", static_cast<std::int64_t>(result.written)),
                          observability::IntField("submitted", static_cast<std::int64_t>(coalesced.size()))});
  }
  return result;
}

std::uint64_t Neo4jHttpStore::DeleteNodesNotIn(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& keep) {
  return FirstCount(Execute({cypher::DeleteNodesNotIn(label, dataset_id, keep)}), "deleted");
}

std::uint64_t Neo4jHttpStore::DeleteRelationshipsOfType(const std::string& type, std::int64_t dataset_id) {
  return FirstCount(Execute({cypher::DeleteRelationshipsOfType(type, dataset_id)}), "deleted");
}

std::vector<NodeId> Neo4jHttpStore::FindExistingNodeIds(const std::string& label, std::int64_t dataset_id, const std::vector<NodeId>& ids) {
  std::vector<NodeId> found;
  if (ids.empty()) {
    return found;
  }
  const auto results = Execute({cypher::FindExistingNodeIds(label, dataset_id, ids)});
  if (results.empty()) {
    return found;
  }
  for (std::size_t i = 0; i < results.front().rows.size(); ++i) {
    if (auto id = ToNodeId(results.front().At(i, "id"))) {
      found.push_back(std::move(*id));
    }
  }
  return found;
}

std::uint64_t Neo4jHttpStore::CountNodes(const std::string& label, std::int64_t dataset_id) {
  return FirstCount(Execute({cypher::CountNodes(label, dataset_id)}), "count");
}

std::uint64_t Neo4jHttpStore::CountRelationships(const std::optional<std::string>& type, std::int64_t dataset_id) {
  return FirstCount(Execute({cypher::CountRelationships(type, dataset_id)}), "count");
}

GraphSchema Neo4jHttpStore::Schema(std::int64_t dataset_id) {
  const auto  results = Execute(cypher::Schema(dataset_id));
  GraphSchema schema;
  if (results.size() != 3) {
    throw util::GraphStoreError("unexpected schema response: " + std::to_string(results.size()) + " result sets");
  }

  for (std::size_t i = 0; i < results[0].rows.size(); ++i) {
    schema.labels.push_back(results[0].At(i, "label").string_value());
  }
  for (std::size_t i = 0; i < results[1].rows.size(); ++i) {
    schema.relationship_types.push_back(results[1].At(i, "type").string_value());
  }
  for (std::size_t i = 0; i < results[2].rows.size(); ++i) {
    auto& keys = schema.property_keys[results[2].At(i, "label").string_value()];
    for (const auto& key : results[2].At(i, "keys").list_value().values()) {
      keys.push_back(key.string_value());
    }
  }
  return schema;
}

} // namespace graphingest::graph
