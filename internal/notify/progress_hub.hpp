#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/notify/progress_notifier.hpp"

namespace graphingest::notify {

class ProgressHub;

/*
  RAII subscription handle; unsubscribes on destruction.

  Must not outlive the hub that issued it.
*/
class Subscription {
 public:
  Subscription() = default;
  Subscription(ProgressHub* hub, std::uint64_t id);
  ~Subscription();

  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  void Reset();

  bool Active() const {
    return hub_ != nullptr;
  }

 private:
  ProgressHub*  hub_ = nullptr;
  std::uint64_t id_  = 0;
};

/*
  In-process publish/subscribe.

  Subscribers register for one task id or for every task. Callbacks run on
  the publishing thread, outside the hub lock; a throwing subscriber is
  logged and skipped.
*/
class ProgressHub final : public ProgressNotifier {
 public:
  using Callback = std::function<void(const graphingest::v1::ProgressEvent&)>;

  Subscription Subscribe(std::int64_t task_id, Callback callback);
  Subscription SubscribeAll(Callback callback);

  void Publish(std::int64_t task_id, graphingest::v1::EventType type, const graphingest::v1::ProgressEvent& event) override;

  std::size_t SubscriberCount() const;

 private:
  friend class Subscription;

  struct Entry {
    std::optional<std::int64_t> task_id; // nullopt = all tasks
    std::shared_ptr<Callback>   callback;
  };

  Subscription Add(std::optional<std::int64_t> task_id, Callback callback);
  void         Remove(std::uint64_t id);

  mutable std::mutex             mutex_;
  std::map<std::uint64_t, Entry> entries_;
  std::uint64_t                  next_id_ = 1;
};

} // namespace graphingest::notify
