#include "internal/notify/progress_hub.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/notify/log_subscriber.hpp"

using namespace graphingest::notify;
namespace v1 = graphingest::v1;

namespace {

v1::ProgressEvent Event(const std::string& message, int percentage) {
  v1::ProgressEvent event;
  event.set_status(v1::TASK_STATUS_PROCESSING);
  event.set_message(message);
  event.set_percentage(percentage);
  return event;
}

void TestTaskScopedAndGlobalSubscribers() {
  ProgressHub              hub;
  std::vector<std::string> task_one;
  std::vector<std::string> all;

  auto one = hub.Subscribe(1, [&](const v1::ProgressEvent& e) { task_one.push_back(e.message()); });
  auto any = hub.SubscribeAll([&](const v1::ProgressEvent& e) { all.push_back(e.message()); });
  assert(hub.SubscriberCount() == 2);

  hub.Publish(1, v1::EVENT_TYPE_STATUS, Event("a", 0));
  hub.Publish(2, v1::EVENT_TYPE_PROGRESS, Event("b", 50));

  assert((task_one == std::vector<std::string>{"a"}));
  assert((all == std::vector<std::string>{"a", "b"}));
}

void TestPublishStampsEvent() {
  ProgressHub       hub;
  v1::ProgressEvent seen;
  auto sub = hub.Subscribe(9, [&](const v1::ProgressEvent& e) { seen = e; });

  hub.Publish(9, v1::EVENT_TYPE_ERROR, Event("boom", 30));
  assert(seen.task_id() == 9);
  assert(seen.type() == v1::EVENT_TYPE_ERROR);
  assert(seen.percentage() == 30);
  assert(seen.has_emitted_at());
  assert(seen.emitted_at().seconds() > 0);
}

void TestSubscriptionIsRaii() {
  ProgressHub hub;
  int         calls = 0;
  {
    auto sub = hub.SubscribeAll([&](const v1::ProgressEvent&) { ++calls; });
    assert(sub.Active());
    hub.Publish(1, v1::EVENT_TYPE_STATUS, Event("x", 0));
  }
  assert(hub.SubscriberCount() == 0);
  hub.Publish(1, v1::EVENT_TYPE_STATUS, Event("y", 0));
  assert(calls == 1);

  auto first = hub.SubscribeAll([&](const v1::ProgressEvent&) { ++calls; });
  Subscription moved(std::move(first));
  assert(!first.Active());
  assert(moved.Active());
  assert(hub.SubscriberCount() == 1);
  moved.Reset();
  assert(hub.SubscriberCount() == 0);
}

void TestThrowingSubscriberDoesNotStopDelivery() {
  ProgressHub hub;
  int         delivered = 0;
  auto bad  = hub.SubscribeAll([](const v1::ProgressEvent&) { throw std::runtime_error("subscriber down"); });
  auto good = hub.SubscribeAll([&](const v1::ProgressEvent&) { ++delivered; });

  hub.Publish(3, v1::EVENT_TYPE_PROGRESS, Event("z", 10));
  assert(delivered == 1);
}

void TestSubscriberMayUnsubscribeDuringPublish() {
  ProgressHub  hub;
  Subscription self;
  int          calls = 0;
  self = hub.SubscribeAll([&](const v1::ProgressEvent&) {
    ++calls;
    self.Reset();
  });

  hub.Publish(1, v1::EVENT_TYPE_STATUS, Event("once", 0));
  hub.Publish(1, v1::EVENT_TYPE_STATUS, Event("twice", 0));
  assert(calls == 1);
}

void TestLogSubscriberRender() {
  v1::ProgressEvent event = Event("Processing batch 1/2", 50);
  event.set_task_id(4);
  event.set_type(v1::EVENT_TYPE_PROGRESS);
  event.set_processed(100);
  event.set_total(200);

  const auto json = LogSubscriber::Render(event);
  assert(json.find("\"task_id\":\"4\"") != std::string::npos);
  assert(json.find("\"type\":\"EVENT_TYPE_PROGRESS\"") != std::string::npos);
  assert(json.find("\"message\":\"Processing batch 1/2\"") != std::string::npos);
  assert(json.find("\"percentage\":50") != std::string::npos);

  ProgressHub hub;
  {
    LogSubscriber logger(hub);
    assert(hub.SubscriberCount() == 1);
    hub.Publish(4, v1::EVENT_TYPE_PROGRESS, event);
  }
  assert(hub.SubscriberCount() == 0);
}

} // namespace

int main() {
  TestTaskScopedAndGlobalSubscribers();
  TestPublishStampsEvent();
  TestSubscriptionIsRaii();
  TestThrowingSubscriberDoesNotStopDelivery();
  TestSubscriberMayUnsubscribeDuringPublish();
  TestLogSubscriberRender();

  std::cout << "graph_ingest_unit_progress_hub: pass\n";
  return 0;
}
