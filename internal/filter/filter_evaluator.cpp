#include "filter_evaluator.hpp"

#include <algorithm>
#include <map>

#include "internal/filter/value_compare.hpp"
#include "internal/util/errors.hpp"

namespace rowcast::filter {

using model::ChangeKind;
using model::FilterOp;

FilterEvaluator::FilterEvaluator(FilterOptions options) : options_(options) {
}

bool FilterEvaluator::Matches(const model::Record& row, const std::vector<model::Column>& columns, const model::UserFilter& filter) {
  auto column = std::find_if(columns.begin(), columns.end(), [&](const model::Column& c) { return c.name == filter.column; });
  if (column == columns.end()) {
    throw util::InvalidArgument("filter column '" + filter.column + "' is not available on this event");
  }
  auto value = row.fields().find(filter.column);
  if (value == row.fields().end()) {
    throw util::InvalidArgument("filter column '" + filter.column + "' is not present in the row");
  }

  const bool ordering = filter.op != FilterOp::kEq && filter.op != FilterOp::kNeq;
  const auto cmp      = CompareValue(value->second, filter.value, column->type, ordering);
  if (!cmp) {
    return false;
  }

  switch (filter.op) {
    case FilterOp::kEq:
      return *cmp == 0;
    case FilterOp::kNeq:
      return *cmp != 0;
    case FilterOp::kLt:
      return *cmp < 0;
    case FilterOp::kLte:
      return *cmp <= 0;
    case FilterOp::kGt:
      return *cmp > 0;
    case FilterOp::kGte:
      return *cmp >= 0;
  }
  return false;
}

void FilterEvaluator::Apply(const model::ChangeEvent& event, const std::vector<model::Subscription>& subscriptions, std::set<std::string>& admitted,
                            std::vector<model::VisibilityError>& errors) const {
  if (event.kind == ChangeKind::kTruncate) {
    return;
  }

  const model::Record* row = nullptr;
  if (event.kind == ChangeKind::kDelete) {
    if (options_.delete_filters == DeleteFilterMode::kIgnore) {
      return;
    }
    row = event.old_record ? &*event.old_record : nullptr;
  } else {
    row = event.record ? &*event.record : nullptr;
  }

  // user_id -> any subscription passed
  std::map<std::string, bool> passed;
  for (const auto& subscription : subscriptions) {
    if (!admitted.contains(subscription.user_id)) {
      continue;
    }
    auto& user_passed = passed[subscription.user_id];
    if (subscription.filters.empty()) {
      user_passed = true;
      continue;
    }
    if (event.kind == ChangeKind::kDelete && options_.delete_filters == DeleteFilterMode::kExclude) {
      continue;
    }
    if (row == nullptr) {
      errors.push_back({model::ErrorCategory::kFilter, subscription.user_id, "event carries no row to filter"});
      continue;
    }

    try {
      const bool all_hold = std::all_of(subscription.filters.begin(), subscription.filters.end(),
                                        [&](const model::UserFilter& filter) { return Matches(*row, event.columns, filter); });
      if (all_hold) {
        user_passed = true;
      }
    } catch (const util::InvalidArgument& e) {
      errors.push_back({model::ErrorCategory::kFilter, subscription.user_id, e.what()});
    }
  }

  std::erase_if(admitted, [&](const std::string& user_id) {
    auto it = passed.find(user_id);
    return it == passed.end() || !it->second;
  });
}

} // namespace rowcast::filter
