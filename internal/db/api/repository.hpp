#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/dataset_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace graphingest::db {

/*
  Task store abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Create* assigns a fresh, increasing id into the passed record

  The store is the source of truth for dataset aggregates and task
  lifecycle; the graph store is the source of truth for graph content.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Datasets
  // ---------------------------------------------------------------------

  virtual Result CreateDataset(Transaction&, model::DatasetRecord&) = 0;

  virtual std::optional<model::DatasetRecord> GetDataset(Transaction&, std::int64_t id) = 0;

  virtual Result UpdateDataset(Transaction&, const model::DatasetRecord&) = 0;

  virtual std::vector<model::DatasetRecord> ListDatasets(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Upload tasks
  // ---------------------------------------------------------------------

  virtual Result CreateTask(Transaction&, model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, std::int64_t id) = 0;

  virtual Result UpdateTask(Transaction&, const model::TaskRecord&) = 0;

  // Creation order (ascending id).
  virtual std::vector<model::TaskRecord> ListTasksByDataset(Transaction&, std::int64_t dataset_id, const TaskFilter& filter = {}) = 0;
};

} // namespace graphingest::db
