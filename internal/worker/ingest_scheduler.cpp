#include "ingest_scheduler.hpp"

#include <stdexcept>

namespace graphingest::worker {

void IngestScheduler::Enqueue(std::int64_t task_id) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw std::runtime_error("ingest scheduler is shut down");
    }
    queue_.push_back(task_id);
    ++outstanding_;
  }
  cv_.notify_one();
}

std::optional<std::int64_t> IngestScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  const auto task_id = queue_.front();
  queue_.pop_front();
  return task_id;
}

void IngestScheduler::Done() {
  {
    std::lock_guard lock(mutex_);
    if (outstanding_ > 0) --outstanding_;
  }
  idle_cv_.notify_all();
}

void IngestScheduler::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return outstanding_ == 0; });
}

std::vector<std::int64_t> IngestScheduler::Shutdown() {
  std::vector<std::int64_t> dropped;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    dropped.assign(queue_.begin(), queue_.end());
    outstanding_ -= queue_.size();
    queue_.clear();
  }
  cv_.notify_all();
  idle_cv_.notify_all();
  return dropped;
}

std::size_t IngestScheduler::Outstanding() const {
  std::lock_guard lock(mutex_);
  return outstanding_;
}

} // namespace graphingest::worker
