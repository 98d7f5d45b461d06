#pragma once

#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace rowcast::filter {

// Comparison family a declared column type belongs to.
enum class TypeClass {
  kNumeric,
  kBoolean,
  kTimestamp,
  kDate,
  kText,
  kCaseInsensitiveText,
  kUuid,
  kOpaque,      // unknown scalar (enums, domains): equality only
  kUnsupported, // arrays, json, ranges
};

TypeClass ClassifyType(const std::string& declared_type);

/*
  Three-way comparison of a record value against a filter literal under
  the column's declared type.

  Returns nullopt when the record value is SQL NULL (no operator holds).
  Throws util::InvalidArgument for a literal that does not parse as the
  declared type, a record value of the wrong JSON shape, or an
  unsupported type. `ordering` requests a total order; types without one
  reject it.
*/
std::optional<int> CompareValue(const google::protobuf::Value& value, const std::string& literal, const std::string& declared_type, bool ordering);

} // namespace rowcast::filter
