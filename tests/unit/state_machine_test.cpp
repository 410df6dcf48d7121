#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>
#include <vector>

using namespace graphingest::model;
namespace v1 = graphingest::v1;

namespace {

void TestTransitions() {
  assert(CanTransition(v1::TASK_STATUS_PENDING, v1::TASK_STATUS_PROCESSING));
  assert(CanTransition(v1::TASK_STATUS_PROCESSING, v1::TASK_STATUS_COMPLETED));
  assert(CanTransition(v1::TASK_STATUS_PROCESSING, v1::TASK_STATUS_FAILED));

  assert(!CanTransition(v1::TASK_STATUS_PENDING, v1::TASK_STATUS_COMPLETED));
  assert(!CanTransition(v1::TASK_STATUS_PROCESSING, v1::TASK_STATUS_PENDING));
  assert(!CanTransition(v1::TASK_STATUS_COMPLETED, v1::TASK_STATUS_PROCESSING));
  assert(!CanTransition(v1::TASK_STATUS_FAILED, v1::TASK_STATUS_PROCESSING));
  assert(!CanTransition(v1::TASK_STATUS_COMPLETED, v1::TASK_STATUS_FAILED));

  static_assert(IsTerminal(v1::TASK_STATUS_COMPLETED));
  static_assert(IsTerminal(v1::TASK_STATUS_FAILED));
  static_assert(!IsTerminal(v1::TASK_STATUS_PROCESSING));
}

void TestDatasetAggregation() {
  assert(AggregateDatasetStatus({}) == v1::DATASET_STATUS_PENDING);
  assert(AggregateDatasetStatus({v1::TASK_STATUS_PENDING}) == v1::DATASET_STATUS_PROCESSING);
  assert(AggregateDatasetStatus({v1::TASK_STATUS_COMPLETED, v1::TASK_STATUS_PROCESSING}) == v1::DATASET_STATUS_PROCESSING);
  assert(AggregateDatasetStatus({v1::TASK_STATUS_COMPLETED, v1::TASK_STATUS_COMPLETED}) == v1::DATASET_STATUS_COMPLETED);
  assert(AggregateDatasetStatus({v1::TASK_STATUS_COMPLETED, v1::TASK_STATUS_FAILED}) == v1::DATASET_STATUS_FAILED);
  assert(AggregateDatasetStatus({v1::TASK_STATUS_PROCESSING, v1::TASK_STATUS_FAILED}) == v1::DATASET_STATUS_FAILED);
}

void TestBatchPercent() {
  static_assert(BatchPercent(0, 10) == kParsedPercent);
  static_assert(BatchPercent(5, 10) == 50);
  static_assert(BatchPercent(10, 10) == 90);
  static_assert(BatchPercent(20, 10) == 90);
  static_assert(BatchPercent(0, 0) == 90);

  int last = 0;
  for (std::uint64_t processed = 0; processed <= 250; processed += 100) {
    const int pct = BatchPercent(processed, 250);
    assert(pct >= last);
    last = pct;
  }
}

} // namespace

int main() {
  TestTransitions();
  TestDatasetAggregation();
  TestBatchPercent();

  std::cout << "graph_ingest_unit_state_machine: pass\n";
  return 0;
}
