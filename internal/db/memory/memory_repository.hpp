#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace graphingest::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                              CreateDataset(Transaction&, model::DatasetRecord&) override;
  std::optional<model::DatasetRecord> GetDataset(Transaction&, std::int64_t id) override;
  Result                              UpdateDataset(Transaction&, const model::DatasetRecord&) override;
  std::vector<model::DatasetRecord>   ListDatasets(Transaction&) override;

  Result                           CreateTask(Transaction&, model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, std::int64_t id) override;
  Result                           UpdateTask(Transaction&, const model::TaskRecord&) override;
  std::vector<model::TaskRecord>   ListTasksByDataset(Transaction&, std::int64_t dataset_id, const TaskFilter& filter = {}) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::int64_t, model::DatasetRecord> datasets;
    std::map<std::int64_t, model::TaskRecord>    tasks;
    std::int64_t                                 next_dataset_id = 1;
    std::int64_t                                 next_task_id    = 1;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace graphingest::db::memory
