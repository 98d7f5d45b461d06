#pragma once

#include <optional>
#include <string>

#include "internal/model/change_event.hpp"

namespace rowcast::decoder {

/*
  Wal2JsonTranslator

  Converts one wal2json (format-version 2) message into the canonical
  payload understood by ChangeDecoder:

    action I/U/D/T  -> type INSERT/UPDATE/DELETE/TRUNCATE
    timestamp       -> commit_timestamp
    columns         -> columns {name,type} + record
    identity        -> old_record (falls back to pk values for UPDATE)

  Type names are mapped from format_type() spelling to pg_type names
  ("bigint" -> "int8", "text[]" -> "_text") and array literals are
  expanded into JSON lists.

  Returns nullopt for messages that carry no row change (B, C, M).
  Shape violations throw util::DecodeError.
*/
class Wal2JsonTranslator {
 public:
  static std::optional<model::Record> Translate(const model::Record& message);
  static std::optional<model::Record> Translate(const std::string& json);

  // True when the object looks like a wal2json message rather than a canonical payload.
  static bool IsWal2Json(const model::Record& message);

  static std::string NormalizeTypeName(const std::string& type);
};

} // namespace rowcast::decoder
