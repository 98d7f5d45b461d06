#include "change_decoder.hpp"

#include <algorithm>
#include <set>
#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace rowcast::decoder {

using google::protobuf::Struct;
using google::protobuf::Value;
using model::ChangeKind;
using util::DecodeError;
using util::DecodeErrorCode;

namespace {

constexpr std::string_view kType            = "type";
constexpr std::string_view kSchema          = "schema";
constexpr std::string_view kTable           = "table";
constexpr std::string_view kCommitTimestamp = "commit_timestamp";
constexpr std::string_view kColumns         = "columns";
constexpr std::string_view kRecord          = "record";
constexpr std::string_view kOldRecord       = "old_record";

std::vector<std::string_view> AllowedFields(ChangeKind kind) {
  std::vector<std::string_view> fields = {kType, kSchema, kTable, kCommitTimestamp, kColumns};
  switch (kind) {
    case ChangeKind::kInsert:
      fields.push_back(kRecord);
      break;
    case ChangeKind::kUpdate:
      fields.push_back(kRecord);
      fields.push_back(kOldRecord);
      break;
    case ChangeKind::kDelete:
      fields.push_back(kOldRecord);
      break;
    case ChangeKind::kTruncate:
      break;
  }
  return fields;
}

// Reports the lexically first offending key so errors are stable.
void RejectUnknownKeys(const Struct& object, const std::vector<std::string_view>& allowed, const std::string& where) {
  std::vector<std::string> unexpected;
  for (const auto& [key, _] : object.fields()) {
    if (std::find(allowed.begin(), allowed.end(), key) == allowed.end()) {
      unexpected.push_back(key);
    }
  }
  if (!unexpected.empty()) {
    std::sort(unexpected.begin(), unexpected.end());
    throw DecodeError(DecodeErrorCode::kUnexpectedField, where + "." + unexpected.front());
  }
}

const Value& Require(const Struct& object, std::string_view key, const std::string& where) {
  auto it = object.fields().find(std::string(key));
  if (it == object.fields().end()) {
    throw DecodeError(DecodeErrorCode::kMissingField, where + "." + std::string(key));
  }
  return it->second;
}

std::string RequireString(const Struct& object, std::string_view key, const std::string& where) {
  const auto& value = Require(object, key, where);
  if (value.kind_case() != Value::kStringValue || value.string_value().empty()) {
    throw DecodeError(DecodeErrorCode::kInvalidValue, where + "." + std::string(key) + " must be a non-empty string");
  }
  return value.string_value();
}

std::vector<model::Column> DecodeColumns(const Value& value) {
  if (value.kind_case() != Value::kListValue) {
    throw DecodeError(DecodeErrorCode::kInvalidValue, "payload.columns must be a list");
  }

  static const std::vector<std::string_view> kColumnFields = {"name", "type"};

  std::vector<model::Column> columns;
  std::set<std::string>      seen;
  columns.reserve(value.list_value().values_size());
  for (int i = 0; i < value.list_value().values_size(); ++i) {
    const auto& entry = value.list_value().values(i);
    const auto  where = "payload.columns[" + std::to_string(i) + "]";
    if (entry.kind_case() != Value::kStructValue) {
      throw DecodeError(DecodeErrorCode::kInvalidValue, where + " must be an object");
    }
    RejectUnknownKeys(entry.struct_value(), kColumnFields, where);

    model::Column column;
    column.name = RequireString(entry.struct_value(), "name", where);
    column.type = RequireString(entry.struct_value(), "type", where);
    if (!seen.insert(column.name).second) {
      throw DecodeError(DecodeErrorCode::kInvalidValue, where + ": duplicate column '" + column.name + "'");
    }
    columns.push_back(std::move(column));
  }
  return columns;
}

model::Record DecodeRecord(const Value& value, std::string_view key, const std::vector<model::Column>& columns) {
  const auto where = "payload." + std::string(key);
  if (value.kind_case() != Value::kStructValue) {
    throw DecodeError(DecodeErrorCode::kInvalidValue, where + " must be an object");
  }

  // every carried value must belong to a declared column
  for (const auto& [name, _] : value.struct_value().fields()) {
    auto declared = std::find_if(columns.begin(), columns.end(), [&](const model::Column& c) { return c.name == name; });
    if (declared == columns.end()) {
      throw DecodeError(DecodeErrorCode::kUnexpectedField, where + "." + name + " is not a declared column");
    }
  }
  return value.struct_value();
}

} // namespace

model::ChangeEvent ChangeDecoder::Decode(const std::string& json) {
  return Decode(util::ParseJsonObject(json));
}

model::ChangeEvent ChangeDecoder::Decode(const model::Record& payload) {
  const auto& type = Require(payload, kType, "payload");
  if (type.kind_case() != Value::kStringValue) {
    throw DecodeError(DecodeErrorCode::kInvalidValue, "payload.type must be a string");
  }
  auto kind = model::ParseKind(type.string_value());
  if (!kind) {
    throw DecodeError(DecodeErrorCode::kUnknownKind, "'" + type.string_value() + "'");
  }

  const auto allowed = AllowedFields(*kind);
  RejectUnknownKeys(payload, allowed, "payload");
  for (auto field : allowed) {
    Require(payload, field, "payload");
  }

  model::ChangeEvent event;
  event.kind        = *kind;
  event.schema_name = RequireString(payload, kSchema, "payload");
  event.table       = RequireString(payload, kTable, "payload");

  const auto timestamp = RequireString(payload, kCommitTimestamp, "payload");
  auto       parsed    = util::ParseTimestamp(timestamp);
  if (!parsed) {
    throw DecodeError(DecodeErrorCode::kInvalidValue, "payload.commit_timestamp '" + timestamp + "' is not a timestamp");
  }
  event.commit_timestamp = *parsed;

  event.columns = DecodeColumns(payload.fields().at(std::string(kColumns)));

  if (*kind == ChangeKind::kInsert || *kind == ChangeKind::kUpdate) {
    event.record = DecodeRecord(payload.fields().at(std::string(kRecord)), kRecord, event.columns);
  }
  if (*kind == ChangeKind::kUpdate || *kind == ChangeKind::kDelete) {
    event.old_record = DecodeRecord(payload.fields().at(std::string(kOldRecord)), kOldRecord, event.columns);
  }

  return event;
}

} // namespace rowcast::decoder
