#include "subscription.hpp"

namespace rowcast::model {

const char* FilterOpName(FilterOp op) {
  switch (op) {
    case FilterOp::kEq:
      return "eq";
    case FilterOp::kNeq:
      return "neq";
    case FilterOp::kLt:
      return "lt";
    case FilterOp::kLte:
      return "lte";
    case FilterOp::kGt:
      return "gt";
    case FilterOp::kGte:
      return "gte";
  }
  return "unknown";
}

std::optional<FilterOp> ParseFilterOp(std::string_view name) {
  if (name == "eq") return FilterOp::kEq;
  if (name == "neq") return FilterOp::kNeq;
  if (name == "lt") return FilterOp::kLt;
  if (name == "lte") return FilterOp::kLte;
  if (name == "gt") return FilterOp::kGt;
  if (name == "gte") return FilterOp::kGte;
  return std::nullopt;
}

} // namespace rowcast::model
