#include "change_event.hpp"

#include <google/protobuf/util/message_differencer.h>

namespace rowcast::model {

namespace {

bool SameRecord(const std::optional<Record>& a, const std::optional<Record>& b) {
  if (a.has_value() != b.has_value()) return false;
  if (!a) return true;
  return google::protobuf::util::MessageDifferencer::Equals(*a, *b);
}

} // namespace

const char* KindName(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kInsert:
      return "INSERT";
    case ChangeKind::kUpdate:
      return "UPDATE";
    case ChangeKind::kDelete:
      return "DELETE";
    case ChangeKind::kTruncate:
      return "TRUNCATE";
  }
  return "UNKNOWN";
}

std::optional<ChangeKind> ParseKind(std::string_view name) {
  if (name == "INSERT") return ChangeKind::kInsert;
  if (name == "UPDATE") return ChangeKind::kUpdate;
  if (name == "DELETE") return ChangeKind::kDelete;
  if (name == "TRUNCATE") return ChangeKind::kTruncate;
  return std::nullopt;
}

bool operator==(const ChangeEvent& a, const ChangeEvent& b) {
  return a.kind == b.kind && a.schema_name == b.schema_name && a.table == b.table && a.commit_timestamp == b.commit_timestamp &&
         a.columns == b.columns && SameRecord(a.record, b.record) && SameRecord(a.old_record, b.old_record) && a.position == b.position;
}

} // namespace rowcast::model
