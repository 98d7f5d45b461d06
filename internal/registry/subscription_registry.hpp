#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/subscription.hpp"
#include "internal/model/visibility_result.hpp"

namespace rowcast::registry {

struct SubscriptionLookup {
  std::vector<model::Subscription>     subscriptions;
  std::vector<model::VisibilityError> errors;
};

/*
  SubscriptionRegistry

  Facade over the repository's subscription rows. Stored filters are
  JSON text:

    [{"column": "body", "op": "eq", "value": "bbb"}]

  A row whose filters do not parse is left out of the lookup and
  reported as a filter error for its user; it is never treated as an
  unfiltered subscription.
*/
class SubscriptionRegistry {
 public:
  explicit SubscriptionRegistry(std::shared_ptr<db::Repository> repository);

  SubscriptionLookup ForEntity(const std::string& entity) const;

  // Returns the stored subscription id.
  int64_t Subscribe(const std::string& user_id, const std::string& entity, const std::vector<model::UserFilter>& filters);

  void UnsubscribeUser(const std::string& user_id);

  // Throws util::InvalidArgument on malformed input.
  static std::vector<model::UserFilter> ParseFilters(const std::string& json);
  static std::string                    FormatFilters(const std::vector<model::UserFilter>& filters);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace rowcast::registry
