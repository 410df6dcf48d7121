#include "task_lifecycle.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "internal/db/api/retry.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace graphingest::core {

using namespace graphingest::v1;
using observability::IntField;
using observability::StringField;

namespace {

google::protobuf::Value ToListValue(const std::vector<std::string>& items) {
  google::protobuf::Value value;
  auto*                   list = value.mutable_list_value();
  for (const auto& item : items) {
    list->add_values()->set_string_value(item);
  }
  return value;
}

db::model::TaskRecord LoadTask(db::Repository& repository, db::Transaction& tx, std::int64_t task_id) {
  auto task = repository.GetTask(tx, task_id);
  if (!task) {
    throw util::NotFound("task not found: " + std::to_string(task_id));
  }
  return *task;
}

} // namespace

TaskLifecycle::TaskLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::ProgressNotifier> notifier, std::size_t max_warnings)
    : repository_(std::move(repository)), notifier_(std::move(notifier)), max_warnings_(max_warnings) {
  if (!repository_) {
    throw std::invalid_argument("TaskLifecycle: repository is required");
  }
}

std::string TaskLifecycle::ErrorDetailsJson(const std::vector<std::string>& errors, const std::vector<std::string>& warnings) {
  google::protobuf::Struct details;
  (*details.mutable_fields())["errors"]   = ToListValue(errors);
  (*details.mutable_fields())["warnings"] = ToListValue(warnings);

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(details, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode error details: " + status.ToString());
  }
  return json;
}

db::model::TaskRecord TaskLifecycle::Transition(std::int64_t task_id, TaskStatus to, const std::function<void(db::model::TaskRecord&)>& apply) {
  auto task = db::RetryOnConflict("task transition", [&] {
    auto tx     = repository_->Begin();
    auto record = LoadTask(*repository_, *tx, task_id);

    if (!model::CanTransition(record.status, to)) {
      throw util::InvalidState("task " + std::to_string(task_id) + " cannot move from " + TaskStatus_Name(record.status) + " to " +
                               TaskStatus_Name(to));
    }

    record.status = to;
    apply(record);
    db::ThrowIfDbError(repository_->UpdateTask(*tx, record), "update task");
    tx->Commit();
    return record;
  });

  GRAPHINGEST_LOG_INFO("task transition", {IntField("task_id", task.id), IntField("dataset_id", task.dataset_id), StringField("status", TaskStatus_Name(to))});
  return task;
}

db::model::TaskRecord TaskLifecycle::Start(std::int64_t task_id) {
  auto task = Transition(task_id, TASK_STATUS_PROCESSING, [](db::model::TaskRecord& t) {
    t.started_at_ms       = util::NowMillis();
    t.progress_percentage = 0.0;
  });
  UpdateDataset(task.dataset_id);
  Emit(task, EVENT_TYPE_STATUS, "Task started", 0, nullptr);
  return task;
}

void TaskLifecycle::Progress(std::int64_t task_id, int percentage, const std::string& message, std::uint64_t processed, std::uint64_t total) {
  const auto task = db::RetryOnConflict("task progress", [&] {
    auto tx     = repository_->Begin();
    auto record = LoadTask(*repository_, *tx, task_id);
    if (record.status != TASK_STATUS_PROCESSING) {
      throw util::InvalidState("progress on task " + std::to_string(task_id) + " in state " + TaskStatus_Name(record.status));
    }
    record.processed_rows      = processed;
    record.total_rows          = total;
    record.progress_percentage = static_cast<double>(percentage);
    db::ThrowIfDbError(repository_->UpdateTask(*tx, record), "update task progress");
    tx->Commit();
    return record;
  });

  GRAPHINGEST_LOG_DEBUG("task progress", {IntField("task_id", task_id), IntField("percentage", percentage), StringField("message", message)});

  ProgressEvent event;
  event.set_status(task.status);
  event.set_message(message);
  event.set_percentage(percentage);
  event.set_processed(static_cast<std::int64_t>(processed));
  event.set_total(static_cast<std::int64_t>(total));
  if (notifier_) {
    notifier_->Publish(task_id, EVENT_TYPE_PROGRESS, event);
  }
}

void TaskLifecycle::Announce(std::int64_t task_id, int percentage, const std::string& message) {
  const auto task = db::RetryOnConflict("task progress", [&] {
    auto tx     = repository_->Begin();
    auto record = LoadTask(*repository_, *tx, task_id);
    if (record.status == TASK_STATUS_PROCESSING && static_cast<int>(std::lround(record.progress_percentage)) != percentage) {
      record.progress_percentage = static_cast<double>(percentage);
      db::ThrowIfDbError(repository_->UpdateTask(*tx, record), "update task progress");
      tx->Commit();
    }
    return record;
  });
  GRAPHINGEST_LOG_INFO(message, {IntField("task_id", task_id), IntField("percentage", percentage)});
  Emit(task, EVENT_TYPE_STATUS, message, percentage, nullptr);
}

db::model::TaskRecord TaskLifecycle::Complete(std::int64_t task_id, const TaskCompletion& completion) {
  auto task = Transition(task_id, TASK_STATUS_COMPLETED, [&](db::model::TaskRecord& t) {
    t.completed_at_ms     = util::NowMillis();
    t.progress_percentage = static_cast<double>(model::kCompletedPercent);
    t.total_rows          = completion.total_rows;
    t.processed_rows      = completion.processed_rows;
    t.error_message.clear();
    if (completion.source_label) {
      t.source_label = *completion.source_label;
    }
    if (completion.target_label) {
      t.target_label = *completion.target_label;
    }
    t.warnings.assign(completion.warnings.begin(), completion.warnings.begin() + std::min(completion.warnings.size(), max_warnings_));
  });
  UpdateDataset(task.dataset_id);
  Emit(task, EVENT_TYPE_STATUS, completion.message, model::kCompletedPercent, &completion.details);
  return task;
}

db::model::TaskRecord TaskLifecycle::Fail(std::int64_t task_id, const TaskFailure& failure) {
  const auto details_json = ErrorDetailsJson(failure.errors, failure.warnings);

  const auto task = db::RetryOnConflict("task failure", [&] {
    auto tx     = repository_->Begin();
    auto record = LoadTask(*repository_, *tx, task_id);
    if (model::IsTerminal(record.status)) {
      throw util::InvalidState("task " + std::to_string(task_id) + " is already " + TaskStatus_Name(record.status));
    }
    record.status          = TASK_STATUS_FAILED;
    record.completed_at_ms = util::NowMillis();
    record.error_message   = failure.message;
    record.error_details   = details_json;
    record.warnings.assign(failure.warnings.begin(), failure.warnings.begin() + std::min(failure.warnings.size(), max_warnings_));
    db::ThrowIfDbError(repository_->UpdateTask(*tx, record), "update task");
    tx->Commit();
    return record;
  });

  GRAPHINGEST_LOG_ERROR("task failed", {IntField("task_id", task.id), IntField("dataset_id", task.dataset_id), StringField("error", failure.message)});
  UpdateDataset(task.dataset_id);

  google::protobuf::Struct details;
  (*details.mutable_fields())["errors"]   = ToListValue(failure.errors);
  (*details.mutable_fields())["warnings"] = ToListValue(failure.warnings);
  Emit(task, EVENT_TYPE_ERROR, failure.message, static_cast<int>(std::lround(task.progress_percentage)), &details);
  return task;
}

db::model::DatasetRecord TaskLifecycle::UpdateDataset(std::int64_t dataset_id, const DatasetMutation& mutate) {
  return db::RetryOnConflict("dataset update", [&] {
    auto tx      = repository_->Begin();
    auto dataset = repository_->GetDataset(*tx, dataset_id);
    if (!dataset) {
      throw util::NotFound("dataset not found: " + std::to_string(dataset_id));
    }
    if (mutate) {
      mutate(*dataset);
    }

    std::vector<TaskStatus> statuses;
    std::uint64_t           finished = 0;
    for (const auto& task : repository_->ListTasksByDataset(*tx, dataset_id)) {
      statuses.push_back(task.status);
      if (model::IsTerminal(task.status)) {
        ++finished;
      }
    }
    dataset->status          = model::AggregateDatasetStatus(statuses);
    dataset->processed_files = finished;
    dataset->updated_at_ms   = util::NowMillis();

    db::ThrowIfDbError(repository_->UpdateDataset(*tx, *dataset), "update dataset");
    tx->Commit();
    return *dataset;
  });
}

void TaskLifecycle::Emit(const db::model::TaskRecord& task, EventType type, const std::string& message, int percentage, const google::protobuf::Struct* details) {
  if (!notifier_) {
    return;
  }
  ProgressEvent event;
  event.set_status(task.status);
  event.set_message(message);
  event.set_percentage(percentage);
  event.set_processed(static_cast<std::int64_t>(task.processed_rows));
  event.set_total(static_cast<std::int64_t>(task.total_rows));
  if (details) {
    *event.mutable_details() = *details;
  }
  notifier_->Publish(task.id, type, event);
}

} // namespace graphingest::core
