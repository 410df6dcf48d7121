#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "google/protobuf/struct.pb.h"
#include "graphingest/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/progress_notifier.hpp"

namespace graphingest::core {

struct TaskCompletion {
  // Resolved endpoint labels of a relationship file.
  std::optional<std::string> source_label;
  std::optional<std::string> target_label;

  std::uint64_t            total_rows     = 0;
  std::uint64_t            processed_rows = 0;
  std::string              message;
  std::vector<std::string> warnings;
  google::protobuf::Struct details;
};

struct TaskFailure {
  std::string              message;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

/*
  Task state machine.

  Every transition is persisted to the task store first and then published
  to the notifier, and every transition recomputes the owning dataset's
  aggregate status. Progress updates are persisted too but do not touch the
  dataset.

  Transitions out of order (e.g. completing a pending task) throw
  util::InvalidState; a missing task throws util::NotFound.
*/
class TaskLifecycle {
 public:
  using DatasetMutation = std::function<void(db::model::DatasetRecord&)>;

  TaskLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::ProgressNotifier> notifier, std::size_t max_warnings);

  // pending -> processing
  db::model::TaskRecord Start(std::int64_t task_id);

  void Progress(std::int64_t task_id, int percentage, const std::string& message, std::uint64_t processed, std::uint64_t total);

  // Status event without a state change ("Validating CSV file...").
  void Announce(std::int64_t task_id, int percentage, const std::string& message);

  // processing -> completed
  db::model::TaskRecord Complete(std::int64_t task_id, const TaskCompletion& completion);

  // processing -> failed; a pending task is failed too so that a job which
  // never started still reaches a terminal state.
  db::model::TaskRecord Fail(std::int64_t task_id, const TaskFailure& failure);

  /*
    Read-modify-write of the dataset record followed by status and
    processed_files recomputation from its tasks. Retried on
    util::TransactionConflict.
  */
  db::model::DatasetRecord UpdateDataset(std::int64_t dataset_id, const DatasetMutation& mutate = {});

  static std::string ErrorDetailsJson(const std::vector<std::string>& errors, const std::vector<std::string>& warnings);

 private:
  db::model::TaskRecord Transition(std::int64_t task_id, graphingest::v1::TaskStatus to, const std::function<void(db::model::TaskRecord&)>& apply);

  void Emit(const db::model::TaskRecord& task, graphingest::v1::EventType type, const std::string& message, int percentage,
            const google::protobuf::Struct* details);

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<notify::ProgressNotifier> notifier_;
  std::size_t                               max_warnings_;
};

} // namespace graphingest::core
