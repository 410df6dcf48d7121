#include "internal/worker/ingest_worker_pool.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/memory/memory_graph_store.hpp"
#include "internal/service/ingestion_service.hpp"

using namespace graphingest;
namespace v1 = graphingest::v1;

namespace {

std::string WriteCsv(const std::string& file_name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "graph_ingest_worker_pool_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / file_name;
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
  out.close();

  return file_path.string();
}

// Holds the first node upsert until Release().
class GatedGraphStore : public graph::MemoryGraphStore {
 public:
  graph::UpsertResult UpsertNodes(const std::string& label, std::int64_t dataset_id, const std::vector<graph::NodeUpsert>& nodes) override {
    {
      std::unique_lock lock(mutex_);
      if (!entered_) {
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [&] { return released_; });
      }
    }
    return MemoryGraphStore::UpsertNodes(label, dataset_id, nodes);
  }

  void WaitEntered() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return entered_; });
  }

  void Release() {
    std::scoped_lock lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    entered_  = false;
  bool                    released_ = false;
};

std::shared_ptr<service::IngestionService> MakeService(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::GraphStore> graph,
                                                       std::uint32_t batch_size) {
  graphingest::runtime::config::IngestConfig ingest;
  ingest.set_batch_size(batch_size);
  return std::make_shared<service::IngestionService>(service::ServiceContext{std::move(repository), std::move(graph), nullptr, ingest});
}

std::int64_t Submit(service::IngestionService& ingestion, std::int64_t dataset_id, const std::string& path) {
  service::FileSubmission submission;
  submission.dataset_id = dataset_id;
  submission.path       = path;
  return ingestion.SubmitFile(submission).id;
}

void TestFilesRunConcurrently() {
  auto repository = std::make_shared<db::memory::MemoryRepository>();
  auto graph      = std::make_shared<graph::MemoryGraphStore>();
  auto ingestion  = MakeService(repository, graph, 2);
  auto dataset    = ingestion->CreateDataset("concurrent", "", false).id;

  std::vector<std::int64_t> tasks{
      Submit(*ingestion, dataset, WriteCsv("Person.csv", "id,name\n1,A\n2,B\n3,C\n")),
      Submit(*ingestion, dataset, WriteCsv("Company.csv", "id,name\nacme,Acme\nglobex,Globex\n")),
      Submit(*ingestion, dataset, WriteCsv("City.csv", "id,name\n10,Oslo\n")),
  };

  worker::IngestWorkerPool pool(std::make_shared<worker::IngestScheduler>(), ingestion, 2);
  pool.Start();
  for (const auto id : tasks) {
    pool.Enqueue(id);
  }
  pool.WaitIdle();
  assert(pool.Outstanding() == 0);
  pool.Stop();

  for (const auto id : tasks) {
    assert(ingestion->GetTask(id)->status == v1::TASK_STATUS_COMPLETED);
  }
  const auto record = ingestion->GetDataset(dataset);
  assert(record->status == v1::DATASET_STATUS_COMPLETED);
  assert(record->processed_files == 3);
  assert(record->total_nodes == 6);
}

void TestStopCancelsRunningAndLeavesQueuedPending() {
  auto repository = std::make_shared<db::memory::MemoryRepository>();
  auto graph      = std::make_shared<GatedGraphStore>();
  auto ingestion  = MakeService(repository, graph, 1);
  auto dataset    = ingestion->CreateDataset("cancel", "", false).id;

  const auto running = Submit(*ingestion, dataset, WriteCsv("Slow.csv", "id\n1\n2\n3\n"));
  const auto queued  = Submit(*ingestion, dataset, WriteCsv("Later.csv", "id\n1\n"));

  auto                     scheduler = std::make_shared<worker::IngestScheduler>();
  worker::IngestWorkerPool pool(scheduler, ingestion, 1);
  pool.Start();
  pool.Enqueue(running);
  pool.Enqueue(queued);
  graph->WaitEntered();

  std::thread stopper([&] { pool.Stop(); });
  // Shutdown drops the queued id after the cancel flag is raised.
  while (scheduler->Outstanding() != 1) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  graph->Release();
  stopper.join();

  const auto cancelled = ingestion->GetTask(running);
  assert(cancelled->status == v1::TASK_STATUS_FAILED);
  assert(cancelled->error_message == "Ingestion cancelled");
  assert(graph->CountNodes("Slow", dataset) == 1);

  assert(ingestion->GetTask(queued)->status == v1::TASK_STATUS_PENDING);
  assert(ingestion->GetDataset(dataset)->status == v1::DATASET_STATUS_FAILED);

  bool threw = false;
  try {
    pool.Enqueue(queued);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestStartFailureIsContained() {
  auto repository = std::make_shared<db::memory::MemoryRepository>();
  auto ingestion  = MakeService(repository, std::make_shared<graph::MemoryGraphStore>(), 10);

  worker::IngestWorkerPool pool(std::make_shared<worker::IngestScheduler>(), ingestion, 1);
  pool.Start();
  pool.Enqueue(404);
  pool.WaitIdle();
  assert(pool.Outstanding() == 0);
}

void TestRequiresCollaborators() {
  bool threw = false;
  try {
    worker::IngestWorkerPool pool(nullptr, nullptr, 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFilesRunConcurrently();
  TestStopCancelsRunningAndLeavesQueuedPending();
  TestStartFailureIsContained();
  TestRequiresCollaborators();

  std::cout << "graph_ingest_unit_ingest_worker_pool: pass\n";
  return 0;
}
