#include "subscription_registry.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace rowcast::registry {

namespace {

const google::protobuf::Value& RequireField(const google::protobuf::Struct& object, const char* key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end()) {
    throw util::InvalidArgument(std::string("filter is missing '") + key + "'");
  }
  return it->second;
}

} // namespace

SubscriptionRegistry::SubscriptionRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<model::UserFilter> SubscriptionRegistry::ParseFilters(const std::string& json) {
  google::protobuf::ListValue list;
  if (!google::protobuf::util::JsonStringToMessage(json, &list).ok()) {
    throw util::InvalidArgument("filters are not a JSON array");
  }

  std::vector<model::UserFilter> filters;
  filters.reserve(list.values_size());
  for (const auto& item : list.values()) {
    if (item.kind_case() != google::protobuf::Value::kStructValue) {
      throw util::InvalidArgument("filter entries must be objects");
    }
    const auto& object = item.struct_value();

    const auto& column = RequireField(object, "column");
    const auto& op     = RequireField(object, "op");
    const auto& value  = RequireField(object, "value");
    if (column.kind_case() != google::protobuf::Value::kStringValue || column.string_value().empty()) {
      throw util::InvalidArgument("filter column must be a non-empty string");
    }
    if (op.kind_case() != google::protobuf::Value::kStringValue) {
      throw util::InvalidArgument("filter op must be a string");
    }
    auto parsed_op = model::ParseFilterOp(op.string_value());
    if (!parsed_op) {
      throw util::InvalidArgument("unknown filter op '" + op.string_value() + "'");
    }
    if (value.kind_case() == google::protobuf::Value::kNullValue || value.kind_case() == google::protobuf::Value::kStructValue ||
        value.kind_case() == google::protobuf::Value::kListValue) {
      throw util::InvalidArgument("filter value must be a scalar");
    }

    filters.push_back({column.string_value(), *parsed_op, util::ValueToText(value)});
  }
  return filters;
}

std::string SubscriptionRegistry::FormatFilters(const std::vector<model::UserFilter>& filters) {
  google::protobuf::ListValue list;
  for (const auto& filter : filters) {
    auto& fields = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["column"].set_string_value(filter.column);
    fields["op"].set_string_value(model::FilterOpName(filter.op));
    fields["value"].set_string_value(filter.value);
  }
  return util::ToJson(list);
}

SubscriptionLookup SubscriptionRegistry::ForEntity(const std::string& entity) const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListSubscriptions(*tx, entity);
  tx->Commit();

  SubscriptionLookup lookup;
  lookup.subscriptions.reserve(records.size());
  for (auto& record : records) {
    std::vector<model::UserFilter> filters;
    try {
      filters = ParseFilters(record.filters_json);
    } catch (const util::InvalidArgument& e) {
      ROWCAST_LOG_WARN("subscription has malformed filters",
                       {observability::IntField("subscription_id", record.id), observability::StringField("entity", entity),
                        observability::StringField("error", e.what())});
      lookup.errors.push_back({model::ErrorCategory::kFilter, record.user_id, std::string("stored filters are malformed: ") + e.what()});
      continue;
    }
    lookup.subscriptions.push_back({record.id, std::move(record.user_id), std::move(record.entity), std::move(filters)});
  }
  return lookup;
}

int64_t SubscriptionRegistry::Subscribe(const std::string& user_id, const std::string& entity, const std::vector<model::UserFilter>& filters) {
  if (user_id.empty()) {
    throw util::InvalidArgument("subscribe: user_id is required");
  }
  if (entity.find('.') == std::string::npos) {
    throw util::InvalidArgument("subscribe: entity must be schema-qualified, got '" + entity + "'");
  }

  db::model::SubscriptionRecord record;
  record.user_id       = user_id;
  record.entity        = entity;
  record.filters_json  = FormatFilters(filters);
  record.created_at_ms = util::ToUnixMillis(util::Now());

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->InsertSubscription(*tx, record), "subscribe");
  tx->Commit();
  return record.id;
}

void SubscriptionRegistry::UnsubscribeUser(const std::string& user_id) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->DeleteSubscriptionsForUser(*tx, user_id), "unsubscribe");
  tx->Commit();
}

} // namespace rowcast::registry
