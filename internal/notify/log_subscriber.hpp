#pragma once

#include <string>

#include "internal/notify/progress_hub.hpp"

namespace graphingest::notify {

/*
  Renders every event of a hub as one JSON line at info level.
*/
class LogSubscriber {
 public:
  explicit LogSubscriber(ProgressHub& hub);

  static std::string Render(const graphingest::v1::ProgressEvent& event);

 private:
  Subscription subscription_;
};

} // namespace graphingest::notify
