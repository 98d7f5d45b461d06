#pragma once

#include <string>

#include "internal/model/change_event.hpp"

namespace rowcast::decoder {

/*
  Strict-shape decoder for canonical change payloads.

  Every kind has an explicit allow-list of top-level fields:

    common    type, schema, table, commit_timestamp, columns
    INSERT    + record
    UPDATE    + record, old_record
    DELETE    + old_record
    TRUNCATE  (nothing else)

  Anything outside the allow-list is rejected with UnexpectedField,
  a missing required field with MissingField. Declared column types
  are carried through untouched.

  All failures throw util::DecodeError.
*/
class ChangeDecoder {
 public:
  static model::ChangeEvent Decode(const std::string& json);
  static model::ChangeEvent Decode(const model::Record& payload);
};

} // namespace rowcast::decoder
