#include "log_subscriber.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"

namespace graphingest::notify {

LogSubscriber::LogSubscriber(ProgressHub& hub)
    : subscription_(hub.SubscribeAll([](const graphingest::v1::ProgressEvent& event) { GRAPHINGEST_LOG_INFO(Render(event)); })) {
}

std::string LogSubscriber::Render(const graphingest::v1::ProgressEvent& event) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(event, &json, options);
  if (!status.ok()) {
    return "{\"task_id\":" + std::to_string(event.task_id()) + ",\"render_error\":\"" + status.ToString() + "\"}";
  }
  return json;
}

} // namespace graphingest::notify
