#include "ingestion_service.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/csv/csv_reader.hpp"
#include "internal/csv/csv_validator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/graph/cypher/cypher_builder.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resolver/label_resolver.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace graphingest::service {

using namespace graphingest::v1;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

ServiceContext WithDefaults(ServiceContext ctx) {
  if (!ctx.repository || !ctx.graph) {
    throw std::invalid_argument("IngestionService: repository and graph store are required");
  }
  graphingest::runtime::config::RuntimeConfig config;
  *config.mutable_ingest() = ctx.ingest;
  config::ConfigLoader::ApplyDefaults(config);
  ctx.ingest = config.ingest();
  return ctx;
}

// Header-only classification; an unreadable file is left to validation.
FileKind ClassifyFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return FILE_KIND_ENTITY;
  }
  csv::CsvReader reader(in);
  csv::CsvRecord header;
  if (!reader.Next(header)) {
    return FILE_KIND_ENTITY;
  }
  return csv::AnalyzeHeader(header.fields).kind;
}

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

void SetNumber(google::protobuf::Struct& details, const std::string& key, std::uint64_t value) {
  (*details.mutable_fields())[key].set_number_value(static_cast<double>(value));
}

void SetString(google::protobuf::Struct& details, const std::string& key, const std::string& value) {
  (*details.mutable_fields())[key].set_string_value(value);
}

void AppendSkipSummary(std::vector<std::string>& warnings, std::uint64_t skipped) {
  if (skipped > 0) {
    warnings.push_back("Skipped " + std::to_string(skipped) + " rows due to validation errors.");
  }
}

TaskOutcome ToOutcome(const db::model::TaskRecord& task, std::string message, std::uint64_t skipped) {
  TaskOutcome outcome;
  outcome.task_id        = task.id;
  outcome.status         = task.status;
  outcome.message        = std::move(message);
  outcome.total_rows     = task.total_rows;
  outcome.processed_rows = task.processed_rows;
  outcome.skipped_rows   = skipped;
  outcome.warnings       = task.warnings;
  return outcome;
}

} // namespace

std::string SummarizeErrors(const std::vector<std::string>& errors) {
  if (errors.empty()) {
    return "Validation failed";
  }
  if (errors.size() == 1) {
    return errors.front();
  }
  std::string message = "Found " + std::to_string(errors.size()) + " issues: ";
  for (std::size_t i = 0; i < errors.size() && i < 3; ++i) {
    if (i > 0) {
      message += "; ";
    }
    message += errors[i];
  }
  if (errors.size() > 3) {
    message += "...";
  }
  return message;
}

IngestionService::IngestionService(ServiceContext ctx)
    : ctx_(WithDefaults(std::move(ctx))), lifecycle_(ctx_.repository, ctx_.notifier, ctx_.ingest.max_row_warnings()) {
}

// ------------------------------------------------------------------
// Datasets and submissions
// ------------------------------------------------------------------

db::model::DatasetRecord IngestionService::CreateDataset(const std::string& name, const std::string& description, bool cascade_delete) {
  if (name.empty()) {
    throw std::invalid_argument("dataset name is required");
  }
  auto dataset = db::RetryOnConflict("create dataset", [&] {
    db::model::DatasetRecord record;
    record.name           = name;
    record.description    = description;
    record.cascade_delete = cascade_delete;
    record.created_at_ms  = util::NowMillis();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->CreateDataset(*tx, record), "create dataset");
    tx->Commit();
    return record;
  });

  GRAPHINGEST_LOG_INFO("dataset created", {IntField("dataset_id", dataset.id), StringField("name", name), BoolField("cascade_delete", cascade_delete)});
  return dataset;
}

db::model::TaskRecord IngestionService::SubmitFile(const FileSubmission& submission) {
  const std::filesystem::path path(submission.path);

  db::model::TaskRecord task;
  task.dataset_id = submission.dataset_id;
  task.file_path  = submission.path;
  task.file_name  = path.filename().string();
  task.kind       = submission.kind ? *submission.kind : ClassifyFile(submission.path);
  task.label      = submission.label ? *submission.label : path.stem().string();
  if (task.kind == FILE_KIND_RELATIONSHIP) {
    task.source_label = submission.source_label.value_or("");
    task.target_label = submission.target_label.value_or("");
  }
  if (task.label.empty()) {
    throw std::invalid_argument("label or relationship type is required for " + submission.path);
  }

  task = db::RetryOnConflict("submit file", [&] {
    auto record          = task;
    record.created_at_ms = util::NowMillis();

    auto tx = ctx_.repository->Begin();
    if (!ctx_.repository->GetDataset(*tx, record.dataset_id)) {
      throw util::NotFound("dataset not found: " + std::to_string(record.dataset_id));
    }
    db::ThrowIfDbError(ctx_.repository->CreateTask(*tx, record), "create task");
    tx->Commit();
    return record;
  });

  lifecycle_.UpdateDataset(task.dataset_id, [](db::model::DatasetRecord& dataset) { ++dataset.total_files; });

  GRAPHINGEST_LOG_INFO("file submitted", {IntField("task_id", task.id), IntField("dataset_id", task.dataset_id), StringField("file", task.file_name),
                                          StringField("kind", FileKind_Name(task.kind)), StringField("label", task.label)});
  return task;
}

// ------------------------------------------------------------------
// Unit of work
// ------------------------------------------------------------------

TaskOutcome IngestionService::Run(std::int64_t task_id, const core::CancelCheck& cancelled) {
  const auto task = lifecycle_.Start(task_id);

  try {
    const auto dataset = GetDataset(task.dataset_id);
    if (!dataset) {
      throw util::NotFound("dataset not found: " + std::to_string(task.dataset_id));
    }
    switch (task.kind) {
      case FILE_KIND_ENTITY:
        return RunEntity(task, dataset->cascade_delete, cancelled);
      case FILE_KIND_RELATIONSHIP:
        return RunRelationship(task, dataset->cascade_delete, cancelled);
      default:
        throw util::InvalidState("task " + std::to_string(task_id) + " has no file kind");
    }
  } catch (const util::StructuralError& e) {
    return FailRun(task_id, {e.what(), e.errors(), e.warnings()});
  } catch (const std::exception& e) {
    return FailRun(task_id, {e.what(), {e.what()}, {}});
  }
}

// A step after the terminal transition (dataset aggregation) may throw; the
// task keeps its committed state.
TaskOutcome IngestionService::FailRun(std::int64_t task_id, const core::TaskFailure& failure) {
  const auto current = GetTask(task_id);
  if (current && model::IsTerminal(current->status)) {
    GRAPHINGEST_LOG_ERROR("post-completion step failed",
                          {IntField("task_id", task_id), StringField("status", TaskStatus_Name(current->status)), StringField("error", failure.message)});
    return ToOutcome(*current, current->status == TASK_STATUS_FAILED ? current->error_message : failure.message, 0);
  }
  const auto failed = lifecycle_.Fail(task_id, failure);
  return ToOutcome(failed, failed.error_message, 0);
}

csv::ParsedFile IngestionService::ValidateAndParse(const db::model::TaskRecord& task, std::vector<std::string>& warnings) {
  lifecycle_.Announce(task.id, model::kValidatingPercent, "Validating CSV file...");

  csv::ValidatorOptions validator_options;
  validator_options.row_limit     = ctx_.ingest.validation_row_limit();
  validator_options.expected_kind = task.kind;

  auto report = csv::CsvValidator(validator_options).ValidateFile(task.file_path);
  if (!report.valid) {
    throw util::StructuralError(SummarizeErrors(report.errors), report.errors, report.warnings);
  }
  warnings = report.warnings;

  lifecycle_.Announce(task.id, model::kParsedPercent, "Parsing CSV file...");

  csv::ParserOptions parser_options;
  parser_options.type_sample_size = ctx_.ingest.type_sample_size();

  auto parsed = csv::CsvParser(parser_options).ParseFile(task.file_path);
  if (parsed.rows.empty()) {
    throw util::StructuralError("CSV file contains no data", {"CSV file contains no data"}, warnings);
  }

  lifecycle_.Progress(task.id, model::kParsedPercent, "Parsed " + std::to_string(parsed.rows.size()) + " rows", 0, parsed.rows.size());
  return parsed;
}

TaskOutcome IngestionService::RunEntity(const db::model::TaskRecord& task, bool cascade, const core::CancelCheck& cancelled) {
  const auto label = graph::cypher::SanitizeIdentifier(task.label);

  std::vector<std::string> warnings;
  const auto               parsed = ValidateAndParse(task, warnings);

  core::PipelineOptions options;
  options.batch_size       = ctx_.ingest.batch_size();
  options.max_row_warnings = ctx_.ingest.max_row_warnings();

  core::EntityJob job;
  job.label      = label;
  job.dataset_id = task.dataset_id;
  job.cascade    = cascade;
  job.file       = &parsed;

  const auto result = core::IngestionPipeline(*ctx_.graph, options).IngestEntities(job, ProgressFor(task.id), cancelled);

  const auto skipped = result.skipped + parsed.malformed_rows.size();
  warnings.insert(warnings.end(), parsed.malformed_rows.begin(), parsed.malformed_rows.end());
  warnings.insert(warnings.end(), result.warnings.begin(), result.warnings.end());
  AppendSkipSummary(warnings, skipped);

  // deleted nodes take their relationships with them
  std::optional<std::uint64_t> relationships;
  if (result.deleted > 0) {
    relationships = ctx_.graph->CountRelationships(std::nullopt, task.dataset_id);
  }

  lifecycle_.UpdateDataset(task.dataset_id, [&](db::model::DatasetRecord& dataset) {
    const auto grown    = dataset.total_nodes + result.created;
    dataset.total_nodes = grown >= result.deleted ? grown - result.deleted : 0;
    if (relationships) {
      dataset.total_relationships = *relationships;
    }
  });

  core::TaskCompletion completion;
  completion.total_rows     = result.rows;
  completion.processed_rows = result.written;
  completion.message        = "Successfully created " + std::to_string(result.written) + " nodes";
  completion.warnings       = std::move(warnings);
  SetString(completion.details, "label", label);
  SetNumber(completion.details, "nodes_written", result.written);
  SetNumber(completion.details, "nodes_created", result.created);
  SetNumber(completion.details, "nodes_deleted", result.deleted);
  SetNumber(completion.details, "rows_skipped", skipped);

  const auto done = lifecycle_.Complete(task.id, completion);
  return ToOutcome(done, completion.message, skipped);
}

TaskOutcome IngestionService::RunRelationship(const db::model::TaskRecord& task, bool cascade, const core::CancelCheck& cancelled) {
  const auto type = graph::cypher::SanitizeIdentifier(task.label);

  std::vector<std::string> warnings;
  const auto               parsed = ValidateAndParse(task, warnings);
  const auto&              layout = parsed.layout;

  resolver::ResolutionInput input;
  input.relationship_type = type;
  input.dataset_id        = task.dataset_id;
  input.declared_source   = layout.DeclaredSourceLabel() ? layout.DeclaredSourceLabel() : NonEmpty(task.source_label);
  input.declared_target   = layout.DeclaredTargetLabel() ? layout.DeclaredTargetLabel() : NonEmpty(task.target_label);
  input.known_labels      = KnownLabels(task.dataset_id);
  input.source_sample     = resolver::SampleIdentifiers(parsed.rows, *layout.source_column, ctx_.ingest.label_sample_rows(), ctx_.ingest.label_sample_ids());
  input.target_sample     = resolver::SampleIdentifiers(parsed.rows, *layout.target_column, ctx_.ingest.label_sample_rows(), ctx_.ingest.label_sample_ids());

  const auto resolution = resolver::LabelResolver(*ctx_.graph).Resolve(input);

  GRAPHINGEST_LOG_INFO("relationship labels resolved",
                       {IntField("task_id", task.id), StringField("type", type), StringField("source", resolution.source_label),
                        StringField("source_strategy", resolver::StrategyName(resolution.source_strategy)), StringField("target", resolution.target_label),
                        StringField("target_strategy", resolver::StrategyName(resolution.target_strategy))});
  if (resolution.low_confidence) {
    warnings.push_back("Could not determine node labels for " + type + " reliably; using " + resolution.source_label + " -> " + resolution.target_label);
  }

  core::PipelineOptions options;
  options.batch_size       = ctx_.ingest.batch_size();
  options.max_row_warnings = ctx_.ingest.max_row_warnings();

  core::RelationshipJob job;
  job.shape.source_label = graph::cypher::SanitizeIdentifier(resolution.source_label);
  job.shape.target_label = graph::cypher::SanitizeIdentifier(resolution.target_label);
  job.shape.type         = type;
  job.dataset_id         = task.dataset_id;
  job.cascade            = cascade;
  job.file               = &parsed;

  const auto result = core::IngestionPipeline(*ctx_.graph, options).IngestRelationships(job, ProgressFor(task.id), cancelled);

  const auto skipped = result.skipped + parsed.malformed_rows.size();
  warnings.insert(warnings.end(), parsed.malformed_rows.begin(), parsed.malformed_rows.end());
  warnings.insert(warnings.end(), result.warnings.begin(), result.warnings.end());
  AppendSkipSummary(warnings, skipped);

  lifecycle_.UpdateDataset(task.dataset_id, [&](db::model::DatasetRecord& dataset) { dataset.total_relationships = result.dataset_count; });

  core::TaskCompletion completion;
  completion.source_label   = job.shape.source_label;
  completion.target_label   = job.shape.target_label;
  completion.total_rows     = result.rows;
  completion.processed_rows = result.written;
  completion.message        = "Successfully created " + std::to_string(result.written) + " relationships";
  completion.warnings       = std::move(warnings);
  SetString(completion.details, "relationship_type", type);
  SetString(completion.details, "source_label", job.shape.source_label);
  SetString(completion.details, "target_label", job.shape.target_label);
  SetNumber(completion.details, "relationships_written", result.written);
  SetNumber(completion.details, "relationships_created", result.created);
  SetNumber(completion.details, "relationships_purged", result.purged);
  SetNumber(completion.details, "relationship_type_total", result.type_count);
  SetNumber(completion.details, "rows_skipped", skipped);

  const auto done = lifecycle_.Complete(task.id, completion);
  return ToOutcome(done, completion.message, skipped);
}

std::vector<std::string> IngestionService::KnownLabels(std::int64_t dataset_id) {
  db::TaskFilter filter;
  filter.kind = FILE_KIND_ENTITY;

  std::vector<std::string> labels;
  for (const auto& task : ListTasks(dataset_id, filter)) {
    if (task.status != TASK_STATUS_COMPLETED && task.status != TASK_STATUS_PROCESSING) {
      continue;
    }
    if (!graph::cypher::IsValidIdentifier(task.label) || std::find(labels.begin(), labels.end(), task.label) != labels.end()) {
      continue;
    }
    labels.push_back(task.label);
  }

  if (labels.empty()) {
    labels = ctx_.graph->Schema(dataset_id).labels;
    GRAPHINGEST_LOG_DEBUG("no entity tasks in dataset, using graph schema labels",
                          {IntField("dataset_id", dataset_id), IntField("labels", static_cast<std::int64_t>(labels.size()))});
  }
  return labels;
}

core::ProgressCallback IngestionService::ProgressFor(std::int64_t task_id) {
  return [this, task_id](const core::PipelineProgress& progress) {
    lifecycle_.Progress(task_id, progress.percentage, progress.message, progress.processed, progress.total);
  };
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::optional<db::model::DatasetRecord> IngestionService::GetDataset(std::int64_t dataset_id) {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->GetDataset(*tx, dataset_id);
}

std::optional<db::model::TaskRecord> IngestionService::GetTask(std::int64_t task_id) {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->GetTask(*tx, task_id);
}

std::vector<db::model::TaskRecord> IngestionService::ListTasks(std::int64_t dataset_id, const db::TaskFilter& filter) {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->ListTasksByDataset(*tx, dataset_id, filter);
}

DatasetSummary IngestionService::DatasetMetadata(std::int64_t dataset_id) {
  const auto dataset = GetDataset(dataset_id);
  if (!dataset) {
    throw util::NotFound("dataset not found: " + std::to_string(dataset_id));
  }

  DatasetSummary summary;
  summary.dataset_id = dataset->id;
  summary.name       = dataset->name;

  auto schema = ctx_.graph->Schema(dataset_id);
  for (auto& label : schema.labels) {
    LabelSummary entry;
    entry.nodes = ctx_.graph->CountNodes(label, dataset_id);
    if (auto keys = schema.property_keys.find(label); keys != schema.property_keys.end()) {
      entry.property_keys = std::move(keys->second);
    }
    entry.label = std::move(label);
    summary.total_nodes += entry.nodes;
    summary.labels.push_back(std::move(entry));
  }
  for (auto& type : schema.relationship_types) {
    RelationshipTypeSummary entry;
    entry.relationships = ctx_.graph->CountRelationships(type, dataset_id);
    entry.type          = std::move(type);
    summary.total_relationships += entry.relationships;
    summary.relationship_types.push_back(std::move(entry));
  }
  return summary;
}

} // namespace graphingest::service
