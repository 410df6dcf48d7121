#pragma once

#include <cstdint>
#include <string>

#include "graphingest/v1.hpp"

namespace graphingest::db::model {

/*
  Persistent dataset row.

  Aggregates are maintained by the ingestion service:
  - total_nodes moves by created minus cascade-deleted nodes
  - total_relationships is re-read from the graph store after each
    relationship file
  - status is recomputed from the dataset's tasks after every transition
*/

struct DatasetRecord {
  std::int64_t id = 0;
  std::string  name;
  std::string  description;

  // Re-upload makes the newest file authoritative for its label/type.
  bool cascade_delete = false;

  graphingest::v1::DatasetStatus status = graphingest::v1::DATASET_STATUS_PENDING;

  std::uint64_t total_files         = 0;
  std::uint64_t processed_files     = 0;
  std::uint64_t total_nodes         = 0;
  std::uint64_t total_relationships = 0;

  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;
};

} // namespace graphingest::db::model
