#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rowcast::model {

enum class FilterOp {
  kEq,
  kNeq,
  kLt,
  kLte,
  kGt,
  kGte,
};

const char*             FilterOpName(FilterOp op);
std::optional<FilterOp> ParseFilterOp(std::string_view name);

// (column, op, literal); the literal is interpreted under the column's declared type.
struct UserFilter {
  std::string column;
  FilterOp    op = FilterOp::kEq;
  std::string value;
};

/*
  Subscription as read from the registry.

  filters are conjunctive; an empty list matches every row.
*/
struct Subscription {
  int64_t                 id = 0;
  std::string             user_id;
  std::string             entity;
  std::vector<UserFilter> filters;
};

} // namespace rowcast::model
