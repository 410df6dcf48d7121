#include "progress_hub.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace graphingest::notify {

Subscription::Subscription(ProgressHub* hub, std::uint64_t id) : hub_(hub), id_(id) {
}

Subscription::~Subscription() {
  Reset();
}

Subscription::Subscription(Subscription&& other) noexcept : hub_(std::exchange(other.hub_, nullptr)), id_(other.id_) {
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Reset();
    hub_ = std::exchange(other.hub_, nullptr);
    id_  = other.id_;
  }
  return *this;
}

void Subscription::Reset() {
  if (hub_ != nullptr) {
    hub_->Remove(id_);
    hub_ = nullptr;
  }
}

Subscription ProgressHub::Subscribe(std::int64_t task_id, Callback callback) {
  return Add(task_id, std::move(callback));
}

Subscription ProgressHub::SubscribeAll(Callback callback) {
  return Add(std::nullopt, std::move(callback));
}

Subscription ProgressHub::Add(std::optional<std::int64_t> task_id, Callback callback) {
  std::scoped_lock lock(mutex_);
  const auto       id = next_id_++;
  entries_.emplace(id, Entry{task_id, std::make_shared<Callback>(std::move(callback))});
  return Subscription(this, id);
}

void ProgressHub::Remove(std::uint64_t id) {
  std::scoped_lock lock(mutex_);
  entries_.erase(id);
}

std::size_t ProgressHub::SubscriberCount() const {
  std::scoped_lock lock(mutex_);
  return entries_.size();
}

void ProgressHub::Publish(std::int64_t task_id, graphingest::v1::EventType type, const graphingest::v1::ProgressEvent& event) {
  auto stamped = event;
  stamped.set_task_id(task_id);
  stamped.set_type(type);
  if (!stamped.has_emitted_at()) {
    *stamped.mutable_emitted_at() = util::ToProto(util::Now());
  }

  std::vector<std::shared_ptr<Callback>> targets;
  {
    std::scoped_lock lock(mutex_);
    for (const auto& [_, entry] : entries_) {
      if (!entry.task_id || *entry.task_id == task_id) {
        targets.push_back(entry.callback);
      }
    }
  }

  for (const auto& callback : targets) {
    try {
      (*callback)(stamped);
    } catch (const std::exception& e) {
      GRAPHINGEST_LOG_WARN("progress subscriber failed", {observability::IntField("task_id", task_id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace graphingest::notify
