#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace rowcast::util {

google::protobuf::Struct ParseJsonObject(const std::string& json) {
  google::protobuf::Struct out;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &out);
  if (!status.ok()) {
    throw DecodeError(DecodeErrorCode::kMalformed, "payload is not a JSON object: " + std::string(status.message()));
  }
  return out;
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("json serialization failed: " + std::string(status.message()));
  }
  return json;
}

std::string ValueToText(const google::protobuf::Value& value) {
  if (value.kind_case() == google::protobuf::Value::kStringValue) {
    return value.string_value();
  }
  return ToJson(value);
}

} // namespace rowcast::util
