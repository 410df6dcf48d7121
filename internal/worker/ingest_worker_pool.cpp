#include "ingest_worker_pool.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/service/ingestion_service.hpp"

namespace graphingest::worker {

using observability::IntField;
using observability::StringField;

IngestWorkerPool::IngestWorkerPool(std::shared_ptr<IngestScheduler> scheduler, std::shared_ptr<service::IngestionService> service, std::size_t workers)
    : scheduler_(std::move(scheduler)), service_(std::move(service)), workers_(workers == 0 ? 1 : workers) {
  if (!scheduler_ || !service_) {
    throw std::invalid_argument("IngestWorkerPool: scheduler and service are required");
  }
}

IngestWorkerPool::~IngestWorkerPool() {
  Stop();
}

void IngestWorkerPool::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < workers_; ++i) {
    threads_.emplace_back(&IngestWorkerPool::Run, this, i);
  }
  GRAPHINGEST_LOG_INFO("ingest workers started", {IntField("workers", static_cast<std::int64_t>(workers_))});
}

void IngestWorkerPool::Stop() {
  if (!running_.exchange(false)) return;

  cancelled_ = true;
  for (const auto task_id : scheduler_->Shutdown()) {
    GRAPHINGEST_LOG_WARN("task left pending at shutdown", {IntField("task_id", task_id)});
  }
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  GRAPHINGEST_LOG_INFO("ingest workers stopped");
}

void IngestWorkerPool::Enqueue(std::int64_t task_id) {
  scheduler_->Enqueue(task_id);
}

void IngestWorkerPool::WaitIdle() {
  scheduler_->WaitIdle();
}

std::size_t IngestWorkerPool::Outstanding() const {
  return scheduler_->Outstanding();
}

void IngestWorkerPool::Run(std::size_t index) {
  const auto cancelled = [this] { return cancelled_.load(); };

  while (true) {
    auto task_id = scheduler_->Dequeue();
    if (!task_id) break;

    try {
      const auto outcome = service_->Run(*task_id, cancelled);
      GRAPHINGEST_LOG_DEBUG("ingest job finished", {IntField("worker", static_cast<std::int64_t>(index)), IntField("task_id", *task_id),
                                                    StringField("status", graphingest::v1::TaskStatus_Name(outcome.status))});
    } catch (const std::exception& e) {
      GRAPHINGEST_LOG_ERROR("ingest job could not run", {IntField("task_id", *task_id), StringField("error", e.what())});
    }
    scheduler_->Done();
  }
}

} // namespace graphingest::worker
