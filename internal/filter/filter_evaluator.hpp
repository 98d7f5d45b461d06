#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/model/change_event.hpp"
#include "internal/model/subscription.hpp"
#include "internal/model/visibility_result.hpp"

namespace rowcast::filter {

// Filters on DELETE can only see replica identity columns.
enum class DeleteFilterMode {
  kEvaluateIdentity, // evaluate against old_record; a missing column is an error
  kIgnore,           // filters do not apply to deletes
  kExclude,          // subscriptions that carry filters never see deletes
};

struct FilterOptions {
  DeleteFilterMode delete_filters = DeleteFilterMode::kEvaluateIdentity;
};

/*
  FilterEvaluator

  Narrows the row-security admitted set with each subscription's own
  predicates. Filters of one subscription are conjunctive; a user with
  several subscriptions on the entity is admitted when any of them
  passes.

  A predicate that cannot be evaluated (unknown column, malformed
  literal, unsupported type) excludes that subscription and is recorded
  as a filter error. TRUNCATE bypasses filters.
*/
class FilterEvaluator {
 public:
  explicit FilterEvaluator(FilterOptions options = {});

  void Apply(const model::ChangeEvent& event, const std::vector<model::Subscription>& subscriptions, std::set<std::string>& admitted,
             std::vector<model::VisibilityError>& errors) const;

  // Throws util::InvalidArgument when the filter cannot be evaluated.
  static bool Matches(const model::Record& row, const std::vector<model::Column>& columns, const model::UserFilter& filter);

 private:
  FilterOptions options_;
};

} // namespace rowcast::filter
