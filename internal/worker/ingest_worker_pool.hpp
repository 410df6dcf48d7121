#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "ingest_scheduler.hpp"

namespace graphingest::service {
class IngestionService;
}

namespace graphingest::worker {

/*
  Fixed set of threads executing IngestionService::Run for queued task ids.

  Files run concurrently, each on one thread. Stop() cancels running tasks
  between batches (they fail with "Ingestion cancelled") and leaves queued
  ones pending.
*/
class IngestWorkerPool {
 public:
  IngestWorkerPool(std::shared_ptr<IngestScheduler> scheduler, std::shared_ptr<service::IngestionService> service, std::size_t workers);
  ~IngestWorkerPool();

  IngestWorkerPool(const IngestWorkerPool&)            = delete;
  IngestWorkerPool& operator=(const IngestWorkerPool&) = delete;

  void Start();
  void Stop();

  void Enqueue(std::int64_t task_id);
  void WaitIdle();

  // Queued plus running jobs.
  std::size_t Outstanding() const;

 private:
  void Run(std::size_t index);

  std::shared_ptr<IngestScheduler>           scheduler_;
  std::shared_ptr<service::IngestionService> service_;
  std::size_t                                workers_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
  std::atomic<bool>        cancelled_{false};
};

} // namespace graphingest::worker
