#include "memory_repository.hpp"

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace graphingest::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Datasets
// ------------------------------------------------------------------

Result MemoryRepository::CreateDataset(Transaction& t, model::DatasetRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_dataset_id++;
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
  r.updated_at_ms = r.created_at_ms;
  s.datasets[r.id] = r;
  return Result::Ok();
}

std::optional<model::DatasetRecord> MemoryRepository::GetDataset(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.datasets.find(id);
  if (it == s.datasets.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateDataset(Transaction& t, const model::DatasetRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.datasets.find(r.id);
  if (it == s.datasets.end()) return Result::Err(ErrorCode::NotFound, "dataset " + std::to_string(r.id));
  it->second               = r;
  it->second.updated_at_ms = util::NowMillis();
  return Result::Ok();
}

std::vector<model::DatasetRecord> MemoryRepository::ListDatasets(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::DatasetRecord> records;
  records.reserve(s.datasets.size());
  for (const auto& [_, record] : s.datasets) {
    records.push_back(record);
  }
  return records;
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result MemoryRepository::CreateTask(Transaction& t, model::TaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.datasets.contains(r.dataset_id)) return Result::Err(ErrorCode::NotFound, "dataset " + std::to_string(r.dataset_id));
  r.id = s.next_task_id++;
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
  s.tasks[r.id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tasks.find(r.id);
  if (it == s.tasks.end()) return Result::Err(ErrorCode::NotFound, "task " + std::to_string(r.id));
  it->second = r;
  return Result::Ok();
}

std::vector<model::TaskRecord> MemoryRepository::ListTasksByDataset(Transaction& t, std::int64_t dataset_id, const TaskFilter& filter) {
  const auto&                    s = TX(t).View();
  std::vector<model::TaskRecord> records;
  for (const auto& [_, record] : s.tasks) {
    if (record.dataset_id != dataset_id) continue;
    if (filter.kind && record.kind != *filter.kind) continue;
    if (filter.status && record.status != *filter.status) continue;
    records.push_back(record);
  }
  return records;
}

} // namespace graphingest::db::memory
