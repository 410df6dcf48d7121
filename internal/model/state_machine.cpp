#include "state_machine.hpp"

namespace graphingest::model {

DatasetStatus AggregateDatasetStatus(const std::vector<TaskStatus>& tasks) {
  bool any_active = false;
  bool all_done   = !tasks.empty();

  for (const auto status : tasks) {
    if (status == graphingest::v1::TASK_STATUS_FAILED) {
      return graphingest::v1::DATASET_STATUS_FAILED;
    }
    if (status == graphingest::v1::TASK_STATUS_PENDING || status == graphingest::v1::TASK_STATUS_PROCESSING) {
      any_active = true;
    }
    if (status != graphingest::v1::TASK_STATUS_COMPLETED) {
      all_done = false;
    }
  }

  if (any_active) {
    return graphingest::v1::DATASET_STATUS_PROCESSING;
  }
  if (all_done) {
    return graphingest::v1::DATASET_STATUS_COMPLETED;
  }
  return graphingest::v1::DATASET_STATUS_PENDING;
}

} // namespace graphingest::model
