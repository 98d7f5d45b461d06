#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/util/lsn.hpp"
#include "internal/util/time.hpp"

namespace rowcast::model {

enum class ChangeKind {
  kInsert,
  kUpdate,
  kDelete,
  kTruncate,
};

const char*               KindName(ChangeKind kind);
std::optional<ChangeKind> ParseKind(std::string_view name);

struct Column {
  std::string name;
  // Declared type exactly as the source reported it ("int8", "_text", ...).
  std::string type;

  bool operator==(const Column&) const = default;
};

// Column name -> JSON-typed value.
using Record = google::protobuf::Struct;

/*
  Canonical change event.

  Shape invariants (enforced by the decoder):
    INSERT    record
    UPDATE    record + old_record (identity columns only)
    DELETE    old_record (identity columns only)
    TRUNCATE  neither
*/
struct ChangeEvent {
  ChangeKind          kind = ChangeKind::kInsert;
  std::string         schema_name;
  std::string         table;
  util::TimePoint     commit_timestamp{};
  std::vector<Column> columns;

  std::optional<Record> record;
  std::optional<Record> old_record;

  // Position of the change in the source stream; 0 when not read from a stream.
  util::Lsn position = 0;

  std::string EntityName() const {
    return schema_name + "." + table;
  }

  // Row the visibility decision is made against.
  const Record* SubjectRow() const {
    if (record) return &*record;
    if (old_record) return &*old_record;
    return nullptr;
  }
};

bool operator==(const ChangeEvent& a, const ChangeEvent& b);

} // namespace rowcast::model
