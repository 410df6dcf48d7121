#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "internal/csv/csv_parser.hpp"
#include "internal/graph/graph_store.hpp"

namespace graphingest::core {

struct PipelineOptions {
  std::size_t batch_size       = 100;
  std::size_t max_row_warnings = 100;
};

// Emitted after each stage and each batch; percentage is the overall task
// percentage (10..90 while batches run).
struct PipelineProgress {
  int           percentage = 0;
  std::string   message;
  std::uint64_t processed = 0;
  std::uint64_t total     = 0;
};

using ProgressCallback = std::function<void(const PipelineProgress&)>;

// Polled between batches; true aborts with "Ingestion cancelled".
using CancelCheck = std::function<bool()>;

/*
  Bounded list of row-level warnings.

  Every skip is counted; only the first `capacity` messages are kept.
*/
class RowWarnings {
 public:
  explicit RowWarnings(std::size_t capacity) : capacity_(capacity) {
  }

  void Add(std::string message);
  void Skip(std::string message);

  const std::vector<std::string>& Messages() const {
    return messages_;
  }
  std::uint64_t Skipped() const {
    return skipped_;
  }
  std::uint64_t Dropped() const {
    return dropped_;
  }

 private:
  std::size_t              capacity_;
  std::vector<std::string> messages_;
  std::uint64_t            skipped_ = 0;
  std::uint64_t            dropped_ = 0;
};

struct EntityJob {
  std::string             label;
  std::int64_t            dataset_id = 0;
  bool                    cascade    = false;
  const csv::ParsedFile*  file       = nullptr;
};

struct EntityResult {
  std::uint64_t            rows    = 0;
  std::uint64_t            written = 0;
  std::uint64_t            created = 0;
  std::uint64_t            deleted = 0; // cascade sync
  std::uint64_t            skipped = 0;
  std::vector<std::string> warnings;
};

struct RelationshipJob {
  graph::RelationshipShape shape;
  std::int64_t             dataset_id = 0;
  bool                     cascade    = false;
  const csv::ParsedFile*   file       = nullptr;
};

struct RelationshipResult {
  std::uint64_t            rows    = 0;
  std::uint64_t            written = 0;
  std::uint64_t            created = 0;
  std::uint64_t            purged  = 0; // cascade sync
  std::uint64_t            skipped = 0;
  std::uint64_t            type_count    = 0; // store count of this type after ingestion
  std::uint64_t            dataset_count = 0; // store count of all types after ingestion
  std::vector<std::string> warnings;
};

/*
  Batched materialization of parsed rows into the graph store.

  Batches run strictly in order. Row defects (blank identifiers, missing
  endpoints) are skipped with a warning; any exception from the store aborts
  the job with "Error processing batch k: ..." and earlier batches stay
  written.
*/
class IngestionPipeline {
 public:
  IngestionPipeline(graph::GraphStore& store, PipelineOptions options);

  EntityResult       IngestEntities(const EntityJob& job, const ProgressCallback& progress, const CancelCheck& cancelled) const;
  RelationshipResult IngestRelationships(const RelationshipJob& job, const ProgressCallback& progress, const CancelCheck& cancelled) const;

 private:
  graph::GraphStore& store_;
  PipelineOptions    options_;
};

} // namespace graphingest::core
