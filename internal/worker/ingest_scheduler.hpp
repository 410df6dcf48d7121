#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace graphingest::worker {

/*
  Thread-safe blocking FIFO of task ids for ingest workers.

  Tracks outstanding work (queued plus running) so callers can wait for the
  queue to drain. Workers must call Done() once per dequeued id.
*/
class IngestScheduler {
 public:
  void Enqueue(std::int64_t task_id);

  // blocking wait; nullopt once shut down
  std::optional<std::int64_t> Dequeue();

  void Done();

  void WaitIdle();

  // Returns the ids that were never dispatched.
  std::vector<std::int64_t> Shutdown();

  std::size_t Outstanding() const;

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::condition_variable  idle_cv_;
  std::deque<std::int64_t> queue_;
  std::size_t              outstanding_ = 0;
  bool                     shutdown_    = false;
};

} // namespace graphingest::worker
