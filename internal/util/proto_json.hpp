#pragma once

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

namespace rackwise::util {

// Protobuf JSON is the byte form of every record kept in the coordination store.

template <typename Message>
std::string ToJson(const Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

// Unknown fields are ignored so older readers accept records from newer writers.
template <typename Message>
Message FromJson(const std::string& bytes) {
  Message                                  message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(bytes, &message, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to decode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return message;
}

} // namespace rackwise::util
