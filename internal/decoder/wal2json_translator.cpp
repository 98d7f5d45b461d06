#include "wal2json_translator.hpp"

#include <cstdlib>
#include <map>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace rowcast::decoder {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;
using util::DecodeError;
using util::DecodeErrorCode;

namespace {

const std::map<std::string, std::string>& TypeAliases() {
  static const std::map<std::string, std::string> kAliases = {
      {"bigint", "int8"},
      {"integer", "int4"},
      {"smallint", "int2"},
      {"boolean", "bool"},
      {"real", "float4"},
      {"double precision", "float8"},
      {"character varying", "varchar"},
      {"character", "bpchar"},
      {"timestamp with time zone", "timestamptz"},
      {"timestamp without time zone", "timestamp"},
      {"time with time zone", "timetz"},
      {"time without time zone", "time"},
      {"bit varying", "varbit"},
  };
  return kAliases;
}

bool IsNumericType(const std::string& type) {
  return type == "int2" || type == "int4" || type == "int8" || type == "float4" || type == "float8" || type == "numeric" || type == "oid";
}

Value ConvertArrayElement(const std::string& text, bool quoted, const std::string& element_type) {
  Value out;
  if (!quoted && text == "NULL") {
    out.set_null_value(google::protobuf::NULL_VALUE);
    return out;
  }
  if (IsNumericType(element_type)) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0' && !text.empty()) {
      out.set_number_value(number);
      return out;
    }
  }
  if (element_type == "bool" && (text == "t" || text == "f")) {
    out.set_bool_value(text == "t");
    return out;
  }
  out.set_string_value(text);
  return out;
}

// PostgreSQL caps arrays at MAXDIM dimensions.
constexpr int kMaxArrayDepth = 6;

/*
  Minimal parser for PostgreSQL array output syntax:
    {a,b}  {"x y","q\"uote"}  {{1,2},{3,4}}  {NULL}
*/
class ArrayLiteralParser {
 public:
  ArrayLiteralParser(std::string_view text, std::string element_type) : text_(text), element_type_(std::move(element_type)) {
  }

  Value Parse() {
    Value value = ParseArray(1);
    if (pos_ != text_.size()) {
      Fail("trailing characters");
    }
    return value;
  }

 private:
  Value ParseArray(int depth) {
    if (depth > kMaxArrayDepth) {
      Fail("nesting exceeds " + std::to_string(kMaxArrayDepth) + " dimensions");
    }
    Expect('{');
    Value      value;
    ListValue* list = value.mutable_list_value();
    if (Peek() == '}') {
      ++pos_;
      return value;
    }
    for (;;) {
      if (Peek() == '{') {
        *list->add_values() = ParseArray(depth + 1);
      } else {
        *list->add_values() = ParseElement();
      }
      const char c = Next();
      if (c == '}') break;
      if (c != ',') Fail("expected ',' or '}'");
    }
    return value;
  }

  Value ParseElement() {
    std::string out;
    if (Peek() == '"') {
      ++pos_;
      for (;;) {
        char c = Next();
        if (c == '"') break;
        if (c == '\\') c = Next();
        out.push_back(c);
      }
      return ConvertArrayElement(out, true, element_type_);
    }
    while (pos_ < text_.size() && text_[pos_] != ',' && text_[pos_] != '}') {
      out.push_back(text_[pos_++]);
    }
    return ConvertArrayElement(out, false, element_type_);
  }

  char Peek() const {
    if (pos_ >= text_.size()) Fail("unexpected end of array literal");
    return text_[pos_];
  }

  char Next() {
    char c = Peek();
    ++pos_;
    return c;
  }

  void Expect(char c) {
    if (Next() != c) Fail(std::string("expected '") + c + "'");
  }

  [[noreturn]] void Fail(const std::string& what) const {
    throw DecodeError(DecodeErrorCode::kInvalidValue, "array literal '" + std::string(text_) + "': " + what);
  }

  std::string_view text_;
  std::string      element_type_;
  std::size_t      pos_ = 0;
};

std::string RequireString(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end()) {
    throw DecodeError(DecodeErrorCode::kMissingField, "wal2json." + key);
  }
  if (it->second.kind_case() != Value::kStringValue) {
    throw DecodeError(DecodeErrorCode::kInvalidValue, "wal2json." + key + " must be a string");
  }
  return it->second.string_value();
}

const ListValue* OptionalList(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end()) {
    return nullptr;
  }
  if (it->second.kind_case() != Value::kListValue) {
    throw DecodeError(DecodeErrorCode::kInvalidValue, "wal2json." + key + " must be a list");
  }
  return &it->second.list_value();
}

struct TupleColumn {
  std::string name;
  std::string type;
  Value       value;
  bool        has_value = false;
};

std::vector<TupleColumn> ReadTuple(const ListValue* list, const std::string& key) {
  std::vector<TupleColumn> out;
  if (!list) return out;

  for (int i = 0; i < list->values_size(); ++i) {
    const auto& entry = list->values(i);
    if (entry.kind_case() != Value::kStructValue) {
      throw DecodeError(DecodeErrorCode::kInvalidValue, "wal2json." + key + "[" + std::to_string(i) + "] must be an object");
    }
    const auto& object = entry.struct_value();

    TupleColumn column;
    column.name = RequireString(object, "name");
    column.type = Wal2JsonTranslator::NormalizeTypeName(RequireString(object, "type"));

    auto value_it = object.fields().find("value");
    if (value_it != object.fields().end()) {
      column.has_value = true;
      const auto& raw  = value_it->second;
      if (column.type.starts_with("_") && raw.kind_case() == Value::kStringValue) {
        column.value = ArrayLiteralParser(raw.string_value(), column.type.substr(1)).Parse();
      } else {
        column.value = raw;
      }
    }
    out.push_back(std::move(column));
  }
  return out;
}

void AppendColumns(Struct& payload, const std::vector<TupleColumn>& tuple) {
  auto* columns = (*payload.mutable_fields())["columns"].mutable_list_value();
  for (const auto& column : tuple) {
    auto* entry = columns->add_values()->mutable_struct_value();
    (*entry->mutable_fields())["name"].set_string_value(column.name);
    (*entry->mutable_fields())["type"].set_string_value(column.type);
  }
}

Struct ToRecord(const std::vector<TupleColumn>& tuple) {
  Struct record;
  for (const auto& column : tuple) {
    if (column.has_value) {
      (*record.mutable_fields())[column.name] = column.value;
    }
  }
  return record;
}

} // namespace

std::string Wal2JsonTranslator::NormalizeTypeName(const std::string& type) {
  std::string base = type;

  bool is_array = false;
  if (base.size() > 2 && base.ends_with("[]")) {
    is_array = true;
    base.resize(base.size() - 2);
  }

  // drop typmod: "character varying(255)" -> "character varying"
  if (auto paren = base.find('('); paren != std::string::npos) {
    auto close = base.find(')', paren);
    base.erase(paren, close == std::string::npos ? std::string::npos : close - paren + 1);
  }
  while (!base.empty() && base.back() == ' ') {
    base.pop_back();
  }

  auto alias = TypeAliases().find(base);
  if (alias != TypeAliases().end()) {
    base = alias->second;
  }
  return is_array ? "_" + base : base;
}

bool Wal2JsonTranslator::IsWal2Json(const model::Record& message) {
  return message.fields().contains("action");
}

std::optional<model::Record> Wal2JsonTranslator::Translate(const std::string& json) {
  return Translate(util::ParseJsonObject(json));
}

std::optional<model::Record> Wal2JsonTranslator::Translate(const model::Record& message) {
  const auto action = RequireString(message, "action");
  if (action == "B" || action == "C" || action == "M") {
    return std::nullopt;
  }

  std::string type;
  if (action == "I") {
    type = "INSERT";
  } else if (action == "U") {
    type = "UPDATE";
  } else if (action == "D") {
    type = "DELETE";
  } else if (action == "T") {
    type = "TRUNCATE";
  } else {
    throw DecodeError(DecodeErrorCode::kUnknownKind, "wal2json action '" + action + "'");
  }

  Struct payload;
  auto&  fields = *payload.mutable_fields();
  fields["type"].set_string_value(type);
  fields["schema"].set_string_value(RequireString(message, "schema"));
  fields["table"].set_string_value(RequireString(message, "table"));
  fields["commit_timestamp"].set_string_value(RequireString(message, "timestamp"));

  const auto columns  = ReadTuple(OptionalList(message, "columns"), "columns");
  const auto identity = ReadTuple(OptionalList(message, "identity"), "identity");
  const auto pk       = ReadTuple(OptionalList(message, "pk"), "pk");

  if (action == "I" || action == "U") {
    if (columns.empty()) {
      throw DecodeError(DecodeErrorCode::kMissingField, "wal2json.columns");
    }
    AppendColumns(payload, columns);
    fields["record"].mutable_struct_value()->CopyFrom(ToRecord(columns));
  }

  if (action == "U") {
    Struct old_record;
    if (!identity.empty()) {
      old_record = ToRecord(identity);
    } else {
      // key unchanged: the identity is the pk part of the new tuple
      for (const auto& key : pk) {
        for (const auto& column : columns) {
          if (column.name == key.name && column.has_value) {
            (*old_record.mutable_fields())[column.name] = column.value;
          }
        }
      }
    }
    fields["old_record"].mutable_struct_value()->CopyFrom(old_record);
  }

  if (action == "D") {
    if (identity.empty()) {
      throw DecodeError(DecodeErrorCode::kMissingField, "wal2json.identity");
    }
    AppendColumns(payload, identity);
    fields["old_record"].mutable_struct_value()->CopyFrom(ToRecord(identity));
  }

  if (action == "T") {
    AppendColumns(payload, pk);
  }

  // TRUNCATE without pk info still carries an (empty) column list
  if (!fields.contains("columns")) {
    fields["columns"].mutable_list_value();
  }
  return payload;
}

} // namespace rowcast::decoder
