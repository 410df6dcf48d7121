#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "graphingest/v1.hpp"
#include "internal/core/ingestion_pipeline.hpp"
#include "internal/core/task_lifecycle.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/dataset_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/service/service_context.hpp"

namespace graphingest::service {

struct FileSubmission {
  std::int64_t dataset_id = 0;
  std::string  path;

  // Classified from the header when unset.
  std::optional<graphingest::v1::FileKind> kind;

  // Entity label or relationship type; defaults to the file stem.
  std::optional<std::string> label;

  // Relationship files only; header declarations take precedence.
  std::optional<std::string> source_label;
  std::optional<std::string> target_label;
};

struct TaskOutcome {
  std::int64_t                task_id = 0;
  graphingest::v1::TaskStatus status  = graphingest::v1::TASK_STATUS_UNSPECIFIED;
  std::string                 message;
  std::uint64_t               total_rows     = 0;
  std::uint64_t               processed_rows = 0;
  std::uint64_t               skipped_rows   = 0;
  std::vector<std::string>    warnings;
};

struct LabelSummary {
  std::string              label;
  std::uint64_t            nodes = 0;
  std::vector<std::string> property_keys;
};

struct RelationshipTypeSummary {
  std::string   type;
  std::uint64_t relationships = 0;
};

// Live view of one dataset's graph, counted from the graph store.
struct DatasetSummary {
  std::int64_t                         dataset_id = 0;
  std::string                          name;
  std::vector<LabelSummary>            labels;
  std::vector<RelationshipTypeSummary> relationship_types;
  std::uint64_t                        total_nodes         = 0;
  std::uint64_t                        total_relationships = 0;
};

/*
  Dataset and file ingestion use cases.

  Run is the unit of work handed to the worker pool: it drives one task from
  pending to a terminal state. Any exception raised while the task is
  processing becomes the failed transition; Run itself only throws when the
  task cannot be started (missing or not pending).
*/
class IngestionService {
 public:
  explicit IngestionService(ServiceContext ctx);

  db::model::DatasetRecord CreateDataset(const std::string& name, const std::string& description, bool cascade_delete);

  db::model::TaskRecord SubmitFile(const FileSubmission& submission);

  TaskOutcome Run(std::int64_t task_id, const core::CancelCheck& cancelled = {});

  std::optional<db::model::DatasetRecord> GetDataset(std::int64_t dataset_id);
  std::optional<db::model::TaskRecord>    GetTask(std::int64_t task_id);
  std::vector<db::model::TaskRecord>      ListTasks(std::int64_t dataset_id, const db::TaskFilter& filter = {});

  // Throws util::NotFound for an unknown dataset.
  DatasetSummary DatasetMetadata(std::int64_t dataset_id);

 private:
  TaskOutcome RunEntity(const db::model::TaskRecord& task, bool cascade, const core::CancelCheck& cancelled);
  TaskOutcome RunRelationship(const db::model::TaskRecord& task, bool cascade, const core::CancelCheck& cancelled);

  TaskOutcome FailRun(std::int64_t task_id, const core::TaskFailure& failure);

  csv::ParsedFile ValidateAndParse(const db::model::TaskRecord& task, std::vector<std::string>& warnings);

  std::vector<std::string> KnownLabels(std::int64_t dataset_id);

  core::ProgressCallback ProgressFor(std::int64_t task_id);

  ServiceContext      ctx_;
  core::TaskLifecycle lifecycle_;
};

// "e1" for one error, "Found N issues: e1; e2; e3..." otherwise.
std::string SummarizeErrors(const std::vector<std::string>& errors);

} // namespace graphingest::service
