#include "internal/core/task_lifecycle.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/progress_hub.hpp"
#include "internal/util/errors.hpp"

using namespace graphingest;
namespace v1 = graphingest::v1;

namespace {

struct Fixture {
  std::shared_ptr<db::Repository>      repository = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<notify::ProgressHub> hub        = std::make_shared<notify::ProgressHub>();
  std::vector<v1::ProgressEvent>       events;
  notify::Subscription                 subscription;
  core::TaskLifecycle                  lifecycle{repository, hub, 2};
  std::int64_t                         dataset_id = 0;

  Fixture() {
    subscription = hub->SubscribeAll([this](const v1::ProgressEvent& e) { events.push_back(e); });

    auto                     tx = repository->Begin();
    db::model::DatasetRecord dataset;
    dataset.name = "people";
    db::ThrowIfDbError(repository->CreateDataset(*tx, dataset), "create dataset");
    tx->Commit();
    dataset_id = dataset.id;
  }

  std::int64_t AddTask(const std::string& label) {
    auto                  tx = repository->Begin();
    db::model::TaskRecord task;
    task.dataset_id = dataset_id;
    task.kind       = v1::FILE_KIND_ENTITY;
    task.label      = label;
    task.file_name  = label + ".csv";
    db::ThrowIfDbError(repository->CreateTask(*tx, task), "create task");
    tx->Commit();
    lifecycle.UpdateDataset(dataset_id, [](db::model::DatasetRecord& d) { ++d.total_files; });
    return task.id;
  }

  db::model::TaskRecord Task(std::int64_t id) {
    auto tx = repository->Begin();
    return *repository->GetTask(*tx, id);
  }

  db::model::DatasetRecord Dataset() {
    auto tx = repository->Begin();
    return *repository->GetDataset(*tx, dataset_id);
  }
};

template <typename Fn>
bool ThrowsInvalidState(Fn&& fn) {
  try {
    fn();
  } catch (const util::InvalidState&) {
    return true;
  }
  return false;
}

void TestHappyPath() {
  Fixture    f;
  const auto id = f.AddTask("Person");
  assert(f.Dataset().status == v1::DATASET_STATUS_PROCESSING);

  const auto started = f.lifecycle.Start(id);
  assert(started.status == v1::TASK_STATUS_PROCESSING);
  assert(started.started_at_ms > 0);

  f.lifecycle.Announce(id, 5, "Validating CSV file...");
  f.lifecycle.Progress(id, 50, "Processing batch 1/2", 100, 200);
  assert(f.Task(id).processed_rows == 100);
  assert(f.Task(id).progress_percentage == 50.0);

  core::TaskCompletion completion;
  completion.total_rows     = 200;
  completion.processed_rows = 200;
  completion.message        = "Successfully created 200 nodes";
  completion.warnings       = {"w1", "w2", "w3"};
  (*completion.details.mutable_fields())["label"].set_string_value("Person");
  const auto done = f.lifecycle.Complete(id, completion);

  assert(done.status == v1::TASK_STATUS_COMPLETED);
  assert(done.progress_percentage == 100.0);
  assert(done.completed_at_ms >= done.started_at_ms);
  assert(done.warnings.size() == 2);

  const auto dataset = f.Dataset();
  assert(dataset.status == v1::DATASET_STATUS_COMPLETED);
  assert(dataset.processed_files == 1);
  assert(dataset.total_files == 1);

  assert(f.events.size() == 4);
  assert(f.events[0].type() == v1::EVENT_TYPE_STATUS && f.events[0].message() == "Task started");
  assert(f.events[1].message() == "Validating CSV file...");
  assert(f.events[2].type() == v1::EVENT_TYPE_PROGRESS && f.events[2].total() == 200);
  assert(f.events[3].percentage() == 100);
  assert(f.events[3].status() == v1::TASK_STATUS_COMPLETED);
  assert(f.events[3].details().fields().at("label").string_value() == "Person");
  for (const auto& event : f.events) {
    assert(event.task_id() == id);
  }
}

void TestFailureRecordsDetails() {
  Fixture    f;
  const auto id = f.AddTask("Person");
  f.lifecycle.Start(id);
  f.lifecycle.Progress(id, 30, "Processing batch 1/3", 10, 30);

  core::TaskFailure failure;
  failure.message  = "Error processing batch 2: connection refused";
  failure.errors   = {"connection refused"};
  failure.warnings = {"Row 3: Missing id value"};
  const auto failed = f.lifecycle.Fail(id, failure);

  assert(failed.status == v1::TASK_STATUS_FAILED);
  assert(failed.error_message == failure.message);
  assert(failed.error_details.find("\"errors\":[\"connection refused\"]") != std::string::npos);
  assert(failed.warnings.size() == 1);
  assert(failed.processed_rows == 10);

  assert(f.Dataset().status == v1::DATASET_STATUS_FAILED);
  assert(f.Dataset().processed_files == 1);

  const auto& last = f.events.back();
  assert(last.type() == v1::EVENT_TYPE_ERROR);
  assert(last.percentage() == 30);
  assert(last.details().fields().at("errors").list_value().values_size() == 1);
}

void TestPendingTaskCanFail() {
  Fixture    f;
  const auto id = f.AddTask("Person");
  f.lifecycle.Fail(id, {"never started", {}, {}});
  assert(f.Task(id).status == v1::TASK_STATUS_FAILED);
}

void TestIllegalTransitions() {
  Fixture    f;
  const auto id = f.AddTask("Person");

  assert(ThrowsInvalidState([&] { f.lifecycle.Complete(id, {}); }));
  assert(ThrowsInvalidState([&] { f.lifecycle.Progress(id, 10, "early", 0, 0); }));

  f.lifecycle.Start(id);
  assert(ThrowsInvalidState([&] { f.lifecycle.Start(id); }));

  f.lifecycle.Complete(id, {});
  assert(ThrowsInvalidState([&] { f.lifecycle.Fail(id, {"late", {}, {}}); }));
  assert(ThrowsInvalidState([&] { f.lifecycle.Start(id); }));
  assert(f.Task(id).status == v1::TASK_STATUS_COMPLETED);
}

void TestMissingTask() {
  Fixture f;
  bool    threw = false;
  try {
    f.lifecycle.Start(404);
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestDatasetAggregatesAcrossTasks() {
  Fixture    f;
  const auto a = f.AddTask("Person");
  const auto b = f.AddTask("Company");

  f.lifecycle.Start(a);
  f.lifecycle.Complete(a, {});
  assert(f.Dataset().status == v1::DATASET_STATUS_PROCESSING);
  assert(f.Dataset().processed_files == 1);

  f.lifecycle.Start(b);
  f.lifecycle.Complete(b, {});
  assert(f.Dataset().status == v1::DATASET_STATUS_COMPLETED);
  assert(f.Dataset().processed_files == 2);
  assert(f.Dataset().total_files == 2);
}

void TestErrorDetailsJson() {
  const auto json = core::TaskLifecycle::ErrorDetailsJson({"e1"}, {});
  assert(json.find("\"errors\":[\"e1\"]") != std::string::npos);
  assert(json.find("\"warnings\":[]") != std::string::npos);
}

void TestWorksWithoutNotifier() {
  auto                     repository = std::make_shared<db::memory::MemoryRepository>();
  core::TaskLifecycle      lifecycle(repository, nullptr, 10);
  auto                     tx = repository->Begin();
  db::model::DatasetRecord dataset;
  dataset.name = "quiet";
  db::ThrowIfDbError(repository->CreateDataset(*tx, dataset), "create dataset");
  db::model::TaskRecord task;
  task.dataset_id = dataset.id;
  db::ThrowIfDbError(repository->CreateTask(*tx, task), "create task");
  tx->Commit();

  lifecycle.Start(task.id);
  lifecycle.Progress(task.id, 50, "halfway", 1, 2);
  assert(lifecycle.Complete(task.id, {}).status == v1::TASK_STATUS_COMPLETED);
}

} // namespace

int main() {
  TestHappyPath();
  TestFailureRecordsDetails();
  TestPendingTaskCanFail();
  TestIllegalTransitions();
  TestMissingTask();
  TestDatasetAggregatesAcrossTasks();
  TestErrorDetailsJson();
  TestWorksWithoutNotifier();

  std::cout << "graph_ingest_unit_task_lifecycle: pass\n";
  return 0;
}
