#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace rowcast::util {

/*
  JSON helpers on top of protobuf's JSON mapping.

  Payloads are held as google::protobuf::Struct so every value keeps
  its JSON type (null, number, string, bool, list, object).
*/

// Throws DecodeError(kMalformed) when the text is not a JSON object.
google::protobuf::Struct ParseJsonObject(const std::string& json);

std::string ToJson(const google::protobuf::Message& message);

// Compact JSON text of a single value; strings are returned unquoted.
std::string ValueToText(const google::protobuf::Value& value);

} // namespace rowcast::util
