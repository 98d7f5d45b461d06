#include <cassert>
#include <iostream>
#include <string>

#include "internal/decoder/change_decoder.hpp"
#include "internal/redaction/column_redactor.hpp"

namespace {

using rowcast::model::ErrorCategory;
using rowcast::model::TableSecurity;
using rowcast::redaction::ColumnRedactor;

rowcast::model::ChangeEvent UpdateWithDummyColumn() {
  return rowcast::decoder::ChangeDecoder::Decode(
      R"({"type":"UPDATE","schema":"public","table":"note","commit_timestamp":"2021-12-01T10:00:00Z",
          "columns":[{"name":"id","type":"int8"},{"name":"user_id","type":"uuid"},{"name":"body","type":"text"},{"name":"dummy","type":"text"}],
          "record":{"id":1,"user_id":"u1","body":"bbb","dummy":"secret"},
          "old_record":{"id":1,"dummy":"old secret"}})");
}

TableSecurity GrantedWithoutDummy() {
  TableSecurity security;
  security.schema_name     = "public";
  security.table           = "note";
  security.role            = "authenticated";
  security.is_rls_enabled  = true;
  security.granted_columns = std::set<std::string>{"id", "user_id", "body", "arr_text", "arr_int"};
  return security;
}

void TestUngrantedColumnNeverSurfaces() {
  ColumnRedactor redactor("authenticated");
  auto           outcome = redactor.Redact(UpdateWithDummyColumn(), GrantedWithoutDummy());

  assert(!outcome.error.has_value());
  assert(outcome.event.columns.size() == 3);
  for (const auto& column : outcome.event.columns) {
    assert(column.name != "dummy");
  }
  assert(!outcome.event.record->fields().contains("dummy"));
  assert(!outcome.event.old_record->fields().contains("dummy"));
  assert(outcome.event.record->fields().at("body").string_value() == "bbb");
  assert(outcome.event.old_record->fields().at("id").number_value() == 1);
}

void TestRedactionIsIdempotent() {
  ColumnRedactor redactor("authenticated");
  const auto     security = GrantedWithoutDummy();

  auto once  = redactor.Redact(UpdateWithDummyColumn(), security);
  auto twice = redactor.Redact(once.event, security);
  assert(twice.event == once.event);
}

void TestMissingMetadataRedactsEverything() {
  ColumnRedactor redactor("authenticated");
  TableSecurity  missing;
  missing.schema_name = "public";
  missing.table       = "note";
  missing.role        = "authenticated";

  auto outcome = redactor.Redact(UpdateWithDummyColumn(), missing);
  assert(outcome.error.has_value());
  assert(outcome.error->category == ErrorCategory::kRedaction);
  assert(outcome.event.columns.empty());
  assert(outcome.event.record->fields().empty());
  assert(outcome.event.old_record->fields().empty());
}

void TestMetadataForAnotherRoleIsNotUsed() {
  ColumnRedactor redactor("authenticated");
  auto           security = GrantedWithoutDummy();
  security.role           = "service_role";

  auto outcome = redactor.Redact(UpdateWithDummyColumn(), security);
  assert(outcome.error.has_value());
  assert(outcome.event.columns.empty());
}

} // namespace

int main() {
  TestUngrantedColumnNeverSurfaces();
  TestRedactionIsIdempotent();
  TestMissingMetadataRedactsEverything();
  TestMetadataForAnotherRoleIsNotUsed();

  std::cout << "rowcast_unit_column_redactor: pass\n";
  return 0;
}
