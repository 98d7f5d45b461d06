#include "value_compare.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <set>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rowcast::filter {

using google::protobuf::Value;
using util::InvalidArgument;

namespace {

template <typename T>
int ThreeWay(const T& a, const T& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

// PostgreSQL numeric input: [+-]digits[.digits][e[+-]digits] or [+-].digits[...].
// No whitespace, hex, inf or nan; the result must be finite.
bool IsDecimalLiteral(const std::string& text) {
  std::size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;

  std::size_t digits = 0;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
    ++i;
    ++digits;
  }
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
      ++i;
      ++digits;
    }
  }
  if (digits == 0) return false;

  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;
    std::size_t exponent_digits = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
      ++i;
      ++exponent_digits;
    }
    if (exponent_digits == 0) return false;
  }
  return i == text.size();
}

std::optional<double> ParseNumber(const std::string& text) {
  if (!IsDecimalLiteral(text)) {
    return std::nullopt;
  }
  char*        end   = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end == nullptr || *end != '\0' || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<bool> ParseBool(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
  if (text == "t" || text == "true" || text == "yes" || text == "on" || text == "1") return true;
  if (text == "f" || text == "false" || text == "no" || text == "off" || text == "0") return false;
  return std::nullopt;
}

bool IsDate(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) continue;
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  return true;
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
  return text;
}

const std::string& RequireString(const Value& value, const std::string& declared_type) {
  if (value.kind_case() != Value::kStringValue) {
    throw InvalidArgument("record value is not a string for column of type " + declared_type);
  }
  return value.string_value();
}

} // namespace

TypeClass ClassifyType(const std::string& declared_type) {
  static const std::set<std::string> kNumeric = {"int2", "int4", "int8", "float4", "float8", "numeric", "oid"};
  static const std::set<std::string> kText    = {"text", "varchar", "bpchar", "char", "name"};
  static const std::set<std::string> kUnsupported = {"json", "jsonb", "xml", "bytea", "tsvector", "int4range", "int8range", "numrange",
                                                      "tsrange", "tstzrange", "daterange"};

  if (declared_type.starts_with("_")) return TypeClass::kUnsupported;
  if (kNumeric.contains(declared_type)) return TypeClass::kNumeric;
  if (declared_type == "bool") return TypeClass::kBoolean;
  if (declared_type == "timestamp" || declared_type == "timestamptz") return TypeClass::kTimestamp;
  if (declared_type == "date") return TypeClass::kDate;
  if (kText.contains(declared_type)) return TypeClass::kText;
  if (declared_type == "citext") return TypeClass::kCaseInsensitiveText;
  if (declared_type == "uuid") return TypeClass::kUuid;
  if (kUnsupported.contains(declared_type)) return TypeClass::kUnsupported;
  return TypeClass::kOpaque;
}

std::optional<int> CompareValue(const Value& value, const std::string& literal, const std::string& declared_type, bool ordering) {
  const auto type_class = ClassifyType(declared_type);
  if (type_class == TypeClass::kUnsupported) {
    throw InvalidArgument("filters are not supported on columns of type " + declared_type);
  }
  if (ordering && (type_class == TypeClass::kOpaque || type_class == TypeClass::kUuid)) {
    throw InvalidArgument("ordering comparison is not defined for type " + declared_type);
  }
  if (value.kind_case() == Value::kNullValue) {
    return std::nullopt;
  }

  switch (type_class) {
    case TypeClass::kNumeric: {
      auto rhs = ParseNumber(literal);
      if (!rhs) {
        throw InvalidArgument("literal '" + literal + "' is not a valid " + declared_type);
      }
      double lhs = 0;
      if (value.kind_case() == Value::kNumberValue) {
        lhs = value.number_value();
        if (!std::isfinite(lhs)) {
          throw InvalidArgument("record value is not a finite " + declared_type);
        }
      } else if (auto parsed = ParseNumber(RequireString(value, declared_type))) {
        lhs = *parsed;
      } else {
        throw InvalidArgument("record value is not a valid " + declared_type);
      }
      return ThreeWay(lhs, *rhs);
    }

    case TypeClass::kBoolean: {
      auto rhs = ParseBool(literal);
      if (!rhs) {
        throw InvalidArgument("literal '" + literal + "' is not a valid bool");
      }
      if (value.kind_case() != Value::kBoolValue) {
        throw InvalidArgument("record value is not a bool");
      }
      return ThreeWay(value.bool_value(), *rhs);
    }

    case TypeClass::kTimestamp: {
      auto rhs = util::ParseTimestamp(literal);
      if (!rhs) {
        throw InvalidArgument("literal '" + literal + "' is not a valid " + declared_type);
      }
      auto lhs = util::ParseTimestamp(RequireString(value, declared_type));
      if (!lhs) {
        throw InvalidArgument("record value is not a valid " + declared_type);
      }
      return ThreeWay(*lhs, *rhs);
    }

    case TypeClass::kDate: {
      if (!IsDate(literal)) {
        throw InvalidArgument("literal '" + literal + "' is not a valid date");
      }
      const auto& lhs = RequireString(value, declared_type);
      if (!IsDate(lhs)) {
        throw InvalidArgument("record value is not a valid date");
      }
      return ThreeWay(lhs, literal);
    }

    case TypeClass::kCaseInsensitiveText:
      return ThreeWay(Lower(RequireString(value, declared_type)), Lower(literal));

    case TypeClass::kUuid:
      return ThreeWay(Lower(RequireString(value, declared_type)), Lower(literal));

    case TypeClass::kText:
    case TypeClass::kOpaque:
      return ThreeWay(RequireString(value, declared_type), literal);

    case TypeClass::kUnsupported:
      break;
  }
  throw InvalidArgument("filters are not supported on columns of type " + declared_type);
}

} // namespace rowcast::filter
