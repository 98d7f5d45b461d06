#include <cassert>
#include <iostream>
#include <string>

#include "internal/decoder/change_decoder.hpp"
#include "internal/decoder/payload_decoder.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using rowcast::decoder::ChangeDecoder;
using rowcast::model::ChangeKind;
using rowcast::util::DecodeError;
using rowcast::util::DecodeErrorCode;

constexpr const char* kColumns = R"([{"name":"id","type":"int8"},{"name":"user_id","type":"uuid"},{"name":"body","type":"text"}])";

std::string Payload(const std::string& type, const std::string& extra) {
  return std::string(R"({"type":")") + type + R"(","schema":"public","table":"note","commit_timestamp":"2021-12-01T10:00:00Z","columns":)" +
         kColumns + extra + "}";
}

DecodeErrorCode DecodeFailure(const std::string& json) {
  try {
    (void)ChangeDecoder::Decode(json);
  } catch (const DecodeError& e) {
    return e.code();
  }
  assert(false && "payload must be rejected");
  return DecodeErrorCode::kMalformed;
}

void TestInsertCarriesRecordOnly() {
  auto event = ChangeDecoder::Decode(Payload("INSERT", R"(,"record":{"id":1,"user_id":"u1","body":"bbb"})"));

  assert(event.kind == ChangeKind::kInsert);
  assert(event.EntityName() == "public.note");
  assert(event.columns.size() == 3);
  assert(event.columns[0].type == "int8");
  assert(event.record.has_value());
  assert(!event.old_record.has_value());
  assert(event.record->fields().at("body").string_value() == "bbb");
  assert(event.commit_timestamp == *rowcast::util::ParseTimestamp("2021-12-01T10:00:00Z"));
}

void TestUpdateCarriesBothRecords() {
  auto event = ChangeDecoder::Decode(Payload("UPDATE", R"(,"record":{"id":99,"body":"x"},"old_record":{"id":1})"));

  assert(event.kind == ChangeKind::kUpdate);
  assert(event.record->fields().at("id").number_value() == 99);
  assert(event.old_record->fields().at("id").number_value() == 1);
}

void TestDeleteCarriesOldRecordOnly() {
  auto event = ChangeDecoder::Decode(Payload("DELETE", R"(,"old_record":{"id":1})"));

  assert(event.kind == ChangeKind::kDelete);
  assert(!event.record.has_value());
  assert(event.old_record.has_value());
}

void TestTruncateCarriesNoRecords() {
  auto event = ChangeDecoder::Decode(Payload("TRUNCATE", ""));

  assert(event.kind == ChangeKind::kTruncate);
  assert(!event.record.has_value());
  assert(!event.old_record.has_value());
}

void TestShapeViolationsAreRejected() {
  // fields outside the per-kind allow-list
  assert(DecodeFailure(Payload("INSERT", R"(,"record":{"id":1},"old_record":{"id":1})")) == DecodeErrorCode::kUnexpectedField);
  assert(DecodeFailure(Payload("DELETE", R"(,"old_record":{"id":1},"record":{"id":1})")) == DecodeErrorCode::kUnexpectedField);
  assert(DecodeFailure(Payload("TRUNCATE", R"(,"record":{"id":1})")) == DecodeErrorCode::kUnexpectedField);
  assert(DecodeFailure(Payload("INSERT", R"(,"record":{"id":1},"extra":true)")) == DecodeErrorCode::kUnexpectedField);

  // required fields
  assert(DecodeFailure(Payload("INSERT", "")) == DecodeErrorCode::kMissingField);
  assert(DecodeFailure(Payload("UPDATE", R"(,"record":{"id":1})")) == DecodeErrorCode::kMissingField);
  assert(DecodeFailure(R"({"type":"INSERT","schema":"public","table":"note","columns":[],"record":{}})") == DecodeErrorCode::kMissingField);

  // values
  assert(DecodeFailure(Payload("UPSERT", "")) == DecodeErrorCode::kUnknownKind);
  assert(DecodeFailure(Payload("INSERT", R"(,"record":{"nope":1})")) == DecodeErrorCode::kUnexpectedField);
  assert(DecodeFailure(R"({"type":"INSERT","schema":"public","table":"note","commit_timestamp":"yesterday","columns":[],"record":{}})") ==
         DecodeErrorCode::kInvalidValue);
  assert(DecodeFailure(R"({"type":"INSERT","schema":"public","table":"note","commit_timestamp":"2021-12-01T10:00:00Z","columns":[{"name":"id"}],"record":{}})") ==
         DecodeErrorCode::kMissingField);
  assert(DecodeFailure(R"({"type":"INSERT","schema":"public","table":"note","commit_timestamp":"2021-12-01T10:00:00Z","columns":[{"name":"id","type":"int8","x":1}],"record":{}})") ==
         DecodeErrorCode::kUnexpectedField);

  assert(DecodeFailure("not json") == DecodeErrorCode::kMalformed);
  assert(DecodeFailure("[1,2]") == DecodeErrorCode::kMalformed);
}

void TestPayloadDecoderAcceptsBothFormats() {
  auto canonical = rowcast::decoder::DecodePayload(Payload("INSERT", R"(,"record":{"id":1})"), 7);
  assert(canonical.has_value());
  assert(canonical->position == 7);

  auto wal2json = rowcast::decoder::DecodePayload(
      R"({"action":"I","schema":"public","table":"note","timestamp":"2021-12-01 10:00:00.123456+00","columns":[{"name":"id","type":"bigint","value":1}]})", 9);
  assert(wal2json.has_value());
  assert(wal2json->kind == ChangeKind::kInsert);
  assert(wal2json->columns[0].type == "int8");
  assert(wal2json->position == 9);

  assert(!rowcast::decoder::DecodePayload(R"({"action":"B"})").has_value());
  assert(!rowcast::decoder::DecodePayload(R"({"action":"C"})").has_value());
}

} // namespace

int main() {
  TestInsertCarriesRecordOnly();
  TestUpdateCarriesBothRecords();
  TestDeleteCarriesOldRecordOnly();
  TestTruncateCarriesNoRecords();
  TestShapeViolationsAreRejected();
  TestPayloadDecoderAcceptsBothFormats();

  std::cout << "rowcast_unit_change_decoder: pass\n";
  return 0;
}
