#include "ingestion_pipeline.hpp"

#include <algorithm>
#include <exception>
#include <set>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace graphingest::core {

using observability::IntField;
using observability::StringField;

namespace {

std::string RowPrefix(const csv::TypedRow& row) {
  return "Row " + std::to_string(row.record_number) + ": ";
}

// Every column except the excluded identifier columns, converted per its
// inferred type. Nulls are dropped.
graph::PropertyList ToProperties(const csv::TypedRow& row, const csv::ParsedFile& file, const std::set<std::size_t>& excluded) {
  graph::PropertyList properties;
  for (std::size_t i = 0; i < row.cells.size(); ++i) {
    if (excluded.count(i) != 0) {
      continue;
    }
    auto value = csv::ConvertValue(row.At(i), file.metadata.data_types[i]);
    if (model::IsNull(value)) {
      continue;
    }
    properties.emplace_back(row.cells[i].first, std::move(value));
  }
  return properties;
}

std::size_t BatchCount(std::size_t rows, std::size_t batch_size) {
  return (rows + batch_size - 1) / batch_size;
}

void ThrowIfCancelled(const CancelCheck& cancelled) {
  if (cancelled && cancelled()) {
    throw util::InvalidState("Ingestion cancelled");
  }
}

// Runs fn and rewrites any failure as "Error processing batch k: ...".
template <typename Fn>
auto RunBatch(std::size_t batch_number, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& e) {
    GRAPHINGEST_LOG_ERROR("batch failed", {IntField("batch", static_cast<std::int64_t>(batch_number)), StringField("error", e.what())});
    throw util::GraphStoreError("Error processing batch " + std::to_string(batch_number) + ": " + e.what());
  }
}

} // namespace

void RowWarnings::Add(std::string message) {
  if (messages_.size() < capacity_) {
    messages_.push_back(std::move(message));
  } else {
    ++dropped_;
  }
}

void RowWarnings::Skip(std::string message) {
  ++skipped_;
  Add(std::move(message));
}

IngestionPipeline::IngestionPipeline(graph::GraphStore& store, PipelineOptions options) : store_(store), options_(options) {
  if (options_.batch_size == 0) {
    options_.batch_size = 100;
  }
}

EntityResult IngestionPipeline::IngestEntities(const EntityJob& job, const ProgressCallback& progress, const CancelCheck& cancelled) const {
  const auto& file = *job.file;
  if (!file.layout.id_column) {
    throw util::StructuralError("Missing required column: 'id'", {"Missing required column: 'id'"});
  }
  const auto id_column = *file.layout.id_column;

  EntityResult result;
  RowWarnings  warnings(options_.max_row_warnings);
  result.rows = file.rows.size();

  std::vector<graph::NodeId> ids_in_file;
  ids_in_file.reserve(file.rows.size());

  const auto batches = BatchCount(file.rows.size(), options_.batch_size);
  for (std::size_t b = 0; b < batches; ++b) {
    ThrowIfCancelled(cancelled);

    const auto begin = b * options_.batch_size;
    const auto end   = std::min(begin + options_.batch_size, file.rows.size());

    std::vector<graph::NodeUpsert> nodes;
    nodes.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
      const auto& row = file.rows[i];
      auto        id  = csv::CoerceIdentifier(row.At(id_column));
      if (!id) {
        warnings.Skip(RowPrefix(row) + "Missing id value");
        continue;
      }
      ids_in_file.push_back(*id);
      nodes.push_back({std::move(*id), ToProperties(row, file, {id_column})});
    }

    const auto upserted = RunBatch(b + 1, [&] { return nodes.empty() ? graph::UpsertResult{} : store_.UpsertNodes(job.label, job.dataset_id, nodes); });
    result.written += upserted.written;
    result.created += upserted.created;

    GRAPHINGEST_LOG_DEBUG("entity batch written", {StringField("label", job.label), IntField("batch", static_cast<std::int64_t>(b + 1)),
                                                   IntField("written", static_cast<std::int64_t>(upserted.written)),
                                                   IntField("created", static_cast<std::int64_t>(upserted.created))});

    if (progress) {
      progress({model::BatchPercent(end, file.rows.size()), "Processing batch " + std::to_string(b + 1) + "/" + std::to_string(batches), end,
                file.rows.size()});
    }
  }

  if (job.cascade) {
    result.deleted = store_.DeleteNodesNotIn(job.label, job.dataset_id, ids_in_file);
    GRAPHINGEST_LOG_INFO("cascade sync removed nodes not in file", {StringField("label", job.label), IntField("dataset_id", job.dataset_id),
                                                                    IntField("deleted", static_cast<std::int64_t>(result.deleted))});
  }

  result.skipped  = warnings.Skipped();
  result.warnings = warnings.Messages();
  return result;
}

RelationshipResult IngestionPipeline::IngestRelationships(const RelationshipJob& job, const ProgressCallback& progress, const CancelCheck& cancelled) const {
  const auto& file = *job.file;
  if (!file.layout.source_column || !file.layout.target_column) {
    throw util::StructuralError("For relationship files required fields: source_id and target_id",
                                {"For relationship files required fields: source_id and target_id"});
  }
  const auto source_column = *file.layout.source_column;
  const auto target_column = *file.layout.target_column;
  const auto& shape        = job.shape;

  RelationshipResult result;
  RowWarnings        warnings(options_.max_row_warnings);
  result.rows = file.rows.size();

  if (job.cascade) {
    if (progress) {
      progress({model::kPurgedPercent, "Syncing to file (removing previous relationships)...", 0, file.rows.size()});
    }
    result.purged = store_.DeleteRelationshipsOfType(shape.type, job.dataset_id);
    GRAPHINGEST_LOG_INFO("cascade sync removed relationships", {StringField("type", shape.type), IntField("dataset_id", job.dataset_id),
                                                                IntField("deleted", static_cast<std::int64_t>(result.purged))});
  }

  const auto batches = BatchCount(file.rows.size(), options_.batch_size);
  for (std::size_t b = 0; b < batches; ++b) {
    ThrowIfCancelled(cancelled);

    const auto begin = b * options_.batch_size;
    const auto end   = std::min(begin + options_.batch_size, file.rows.size());

    struct Candidate {
      const csv::TypedRow* row;
      graph::NodeId        source;
      graph::NodeId        target;
    };
    std::vector<Candidate>     candidates;
    std::vector<graph::NodeId> source_ids;
    std::vector<graph::NodeId> target_ids;

    for (std::size_t i = begin; i < end; ++i) {
      const auto& row    = file.rows[i];
      auto        source = csv::CoerceIdentifier(row.At(source_column));
      auto        target = csv::CoerceIdentifier(row.At(target_column));
      if (!source || !target) {
        warnings.Skip(RowPrefix(row) + "Missing source_id or target_id");
        continue;
      }
      source_ids.push_back(*source);
      target_ids.push_back(*target);
      candidates.push_back({&row, std::move(*source), std::move(*target)});
    }

    const auto upserted = RunBatch(b + 1, [&] {
      std::set<graph::NodeId> existing_sources;
      std::set<graph::NodeId> existing_targets;
      if (!candidates.empty()) {
        for (auto& id : store_.FindExistingNodeIds(shape.source_label, job.dataset_id, source_ids)) existing_sources.insert(std::move(id));
        for (auto& id : store_.FindExistingNodeIds(shape.target_label, job.dataset_id, target_ids)) existing_targets.insert(std::move(id));
      }

      std::vector<graph::RelationshipUpsert> rows;
      rows.reserve(candidates.size());
      for (auto& candidate : candidates) {
        if (existing_sources.count(candidate.source) == 0) {
          warnings.Skip(RowPrefix(*candidate.row) + "Source node " + shape.source_label + ":" + model::ToDisplayString(candidate.source) + " does not exist");
          continue;
        }
        if (existing_targets.count(candidate.target) == 0) {
          warnings.Skip(RowPrefix(*candidate.row) + "Target node " + shape.target_label + ":" + model::ToDisplayString(candidate.target) + " does not exist");
          continue;
        }
        rows.push_back({std::move(candidate.source), std::move(candidate.target), ToProperties(*candidate.row, file, {source_column, target_column})});
      }

      if (rows.empty()) {
        GRAPHINGEST_LOG_WARN("no valid relationships in batch", {StringField("type", shape.type), IntField("batch", static_cast<std::int64_t>(b + 1))});
        return graph::UpsertResult{};
      }
      return store_.UpsertRelationships(shape, job.dataset_id, rows);
    });
    result.written += upserted.written;
    result.created += upserted.created;

    if (progress) {
      progress({model::BatchPercent(end, file.rows.size()), "Processing batch " + std::to_string(b + 1) + "/" + std::to_string(batches), end,
                file.rows.size()});
    }
  }

  result.type_count    = store_.CountRelationships(shape.type, job.dataset_id);
  result.dataset_count = store_.CountRelationships(std::nullopt, job.dataset_id);
  GRAPHINGEST_LOG_INFO("relationship count reconciled", {StringField("type", shape.type), IntField("written", static_cast<std::int64_t>(result.written)),
                                                         IntField("type_count", static_cast<std::int64_t>(result.type_count)),
                                                         IntField("dataset_count", static_cast<std::int64_t>(result.dataset_count))});

  if (warnings.Skipped() > 0) {
    GRAPHINGEST_LOG_WARN("Skipped " + std::to_string(warnings.Skipped()) + " rows due to validation errors. See validation_warnings for details.");
  }

  result.skipped  = warnings.Skipped();
  result.warnings = warnings.Messages();
  return result;
}

} // namespace graphingest::core
