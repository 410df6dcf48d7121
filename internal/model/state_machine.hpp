#pragma once

#include <cstdint>
#include <vector>

#include "graphingest/v1.hpp"

namespace graphingest::model {

using graphingest::v1::DatasetStatus;
using graphingest::v1::TaskStatus;

constexpr bool IsTerminal(TaskStatus status) {
  return status == graphingest::v1::TASK_STATUS_COMPLETED || status == graphingest::v1::TASK_STATUS_FAILED;
}

// pending -> processing -> {completed | failed}; terminal states never move.
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  switch (from) {
    case graphingest::v1::TASK_STATUS_PENDING:
      return to == graphingest::v1::TASK_STATUS_PROCESSING;
    case graphingest::v1::TASK_STATUS_PROCESSING:
      return to == graphingest::v1::TASK_STATUS_COMPLETED || to == graphingest::v1::TASK_STATUS_FAILED;
    default:
      return false;
  }
}

/*
  Dataset status from its tasks:
    failed      if any task failed
    processing  if any task is pending or processing
    completed   if there is at least one task and all completed
    pending     otherwise (no tasks yet)
*/
DatasetStatus AggregateDatasetStatus(const std::vector<TaskStatus>& tasks);

// ------------------------------------------------------------------
// Progress
// ------------------------------------------------------------------
inline constexpr int kValidatingPercent = 5;
inline constexpr int kParsedPercent     = 10;
inline constexpr int kPurgedPercent     = 12;
inline constexpr int kIngestSpanPercent = 80;
inline constexpr int kCompletedPercent  = 100;

// 10..90 proportionally to processed rows.
constexpr int BatchPercent(std::uint64_t processed, std::uint64_t total) {
  if (total == 0) {
    return kParsedPercent + kIngestSpanPercent;
  }
  if (processed > total) {
    processed = total;
  }
  return kParsedPercent + static_cast<int>((processed * kIngestSpanPercent) / total);
}

} // namespace graphingest::model
