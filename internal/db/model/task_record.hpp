#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "graphingest/v1.hpp"

namespace graphingest::db::model {

/*
  Persistent upload task row, one per submitted file.

  label is the entity label for entity files and the relationship type for
  relationship files. Timestamps are unix millis, 0 = not reached yet.
*/

struct TaskRecord {
  std::int64_t id         = 0;
  std::int64_t dataset_id = 0;

  std::string file_name;
  std::string file_path;

  graphingest::v1::FileKind kind = graphingest::v1::FILE_KIND_UNSPECIFIED;
  std::string               label;
  std::string               source_label;
  std::string               target_label;

  graphingest::v1::TaskStatus status = graphingest::v1::TASK_STATUS_PENDING;

  std::uint64_t total_rows          = 0;
  std::uint64_t processed_rows      = 0;
  double        progress_percentage = 0.0;

  std::string error_message;
  std::string error_details; // JSON object, empty when unset

  // Non-fatal row warnings, capped by ingest.max_row_warnings.
  std::vector<std::string> warnings;

  std::uint64_t created_at_ms   = 0;
  std::uint64_t started_at_ms   = 0;
  std::uint64_t completed_at_ms = 0;
};

} // namespace graphingest::db::model
