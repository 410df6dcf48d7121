#pragma once

#include <cstdint>

#include "graphingest/v1.hpp"

namespace graphingest::notify {

/*
  Live-update sink keyed by task id.

  Fire-and-forget: implementations must not throw back into the ingestion
  pipeline; delivery failures are logged and dropped.
*/
class ProgressNotifier {
 public:
  virtual ~ProgressNotifier() = default;

  virtual void Publish(std::int64_t task_id, graphingest::v1::EventType type, const graphingest::v1::ProgressEvent& event) = 0;
};

} // namespace graphingest::notify
