#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace graphingest::config {

namespace {

constexpr uint32_t kDefaultWorkers            = 2;
constexpr uint32_t kDefaultBatchSize          = 100;
constexpr uint32_t kDefaultMaxRowWarnings     = 100;
constexpr uint32_t kDefaultValidationRowLimit = 10000;
constexpr uint32_t kDefaultTypeSampleSize     = 100;
constexpr uint32_t kDefaultLabelSampleRows    = 5;
constexpr uint32_t kDefaultLabelSampleIds     = 10;
constexpr uint32_t kDefaultRequestTimeoutMs   = 30000;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars ("123", 'true') stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

graphingest::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  graphingest::runtime::config::RuntimeConfig config;

  // An empty file is a valid "all defaults" configuration.
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json_status.ToString());
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + status.ToString());
    }
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(graphingest::runtime::config::RuntimeConfig& config) {
  auto* ingest = config.mutable_ingest();
  if (ingest->workers() == 0) ingest->set_workers(kDefaultWorkers);
  if (ingest->batch_size() == 0) ingest->set_batch_size(kDefaultBatchSize);
  if (ingest->max_row_warnings() == 0) ingest->set_max_row_warnings(kDefaultMaxRowWarnings);
  if (ingest->validation_row_limit() == 0) ingest->set_validation_row_limit(kDefaultValidationRowLimit);
  if (ingest->type_sample_size() == 0) ingest->set_type_sample_size(kDefaultTypeSampleSize);
  if (ingest->label_sample_rows() == 0) ingest->set_label_sample_rows(kDefaultLabelSampleRows);
  if (ingest->label_sample_ids() == 0) ingest->set_label_sample_ids(kDefaultLabelSampleIds);

  if (config.graph().backend_case() == graphingest::runtime::config::GraphConfig::BACKEND_NOT_SET) {
    config.mutable_graph()->mutable_memory();
  }
  if (config.graph().has_neo4j()) {
    auto* neo4j = config.mutable_graph()->mutable_neo4j();
    if (neo4j->database().empty()) neo4j->set_database("neo4j");
    if (neo4j->request_timeout_ms() == 0) neo4j->set_request_timeout_ms(kDefaultRequestTimeoutMs);
  }
}

} // namespace graphingest::config
