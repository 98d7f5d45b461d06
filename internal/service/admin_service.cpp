#include "admin_service.hpp"

#include <algorithm>
#include <chrono>

#include "internal/decoder/payload_decoder.hpp"
#include "internal/engine/visibility_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/subscription_registry.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/stream/stream_cursor.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/lsn.hpp"

namespace rowcast::service {

using namespace rowcast::v1;

namespace {

constexpr std::size_t kDefaultPeek = 10;
constexpr std::size_t kMaxPeek     = 1000;

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

template <typename Fn>
auto AdminService::Instrumented(std::string_view route, Fn&& fn) {
  rowcast::observability::SpanScope span(route);
  const auto                        started_at = std::chrono::steady_clock::now();
  auto&                             metrics    = rowcast::observability::Metrics::Instance();

  try {
    auto resp = fn(span);
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ROWCAST_LOG_ERROR("RPC failed", {rowcast::observability::StringField("route", route), rowcast::observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

PeekResponse AdminService::Peek(const PeekRequest& req) {
  return Instrumented("AdminService.Peek", [&](rowcast::observability::SpanScope& span) {
    std::size_t max = req.max_changes() == 0 ? kDefaultPeek : std::min<std::size_t>(req.max_changes(), kMaxPeek);
    span.SetAttribute("rowcast.max_changes", static_cast<std::int64_t>(max));

    PeekResponse resp;
    for (const auto& change : ctx_.cursor->Peek(max)) {
      auto* out = resp.add_changes();
      out->set_position(util::FormatLsn(change.position));
      out->set_payload(change.payload);
    }
    return resp;
  });
}

PositionResponse AdminService::GetPosition(const GetPositionRequest&) {
  return Instrumented("AdminService.GetPosition", [&](rowcast::observability::SpanScope&) {
    PositionResponse resp;
    resp.set_position(util::FormatLsn(ctx_.cursor->Position()));
    return resp;
  });
}

EvaluateResponse AdminService::Evaluate(const EvaluateRequest& req) {
  return Instrumented("AdminService.Evaluate", [&](rowcast::observability::SpanScope& span) {
    auto event = decoder::DecodePayload(req.payload());
    if (!event) {
      throw util::InvalidArgument("payload carries no row change");
    }
    span.SetAttribute("rowcast.entity", event->EntityName());

    const auto result = ctx_.engine->Evaluate(*event);

    EvaluateResponse resp;
    *resp.mutable_event() = ToProto(result.event);
    resp.set_is_rls_enabled(result.is_rls_enabled);
    for (const auto& user_id : result.visible_subscribers) {
      resp.add_visible_subscribers(user_id);
    }
    for (const auto& error : result.errors) {
      *resp.add_errors() = ToProto(error);
    }
    return resp;
  });
}

AddSubscriptionResponse AdminService::AddSubscription(const AddSubscriptionRequest& req) {
  return Instrumented("AdminService.AddSubscription", [&](rowcast::observability::SpanScope& span) {
    const auto filters = registry::SubscriptionRegistry::ParseFilters(req.filters().empty() ? "[]" : req.filters());
    const auto id      = ctx_.registry->Subscribe(req.user_id(), req.entity(), filters);
    span.SetAttribute("rowcast.subscription_id", static_cast<std::int64_t>(id));

    ROWCAST_LOG_INFO("subscription added", {rowcast::observability::IntField("id", id), rowcast::observability::StringField("user_id", req.user_id()),
                                            rowcast::observability::StringField("entity", req.entity())});

    AddSubscriptionResponse resp;
    resp.set_id(id);
    return resp;
  });
}

RemoveSubscriptionsResponse AdminService::RemoveSubscriptions(const RemoveSubscriptionsRequest& req) {
  return Instrumented("AdminService.RemoveSubscriptions", [&](rowcast::observability::SpanScope&) {
    if (req.user_id().empty()) {
      throw util::InvalidArgument("user_id is required");
    }
    ctx_.registry->UnsubscribeUser(req.user_id());
    ROWCAST_LOG_INFO("subscriptions removed", {rowcast::observability::StringField("user_id", req.user_id())});
    return RemoveSubscriptionsResponse{};
  });
}

ListSubscriptionsResponse AdminService::ListSubscriptions(const ListSubscriptionsRequest& req) {
  return Instrumented("AdminService.ListSubscriptions", [&](rowcast::observability::SpanScope&) {
    if (req.entity().empty()) {
      throw util::InvalidArgument("entity is required");
    }

    auto lookup = ctx_.registry->ForEntity(req.entity());

    ListSubscriptionsResponse resp;
    for (const auto& subscription : lookup.subscriptions) {
      auto* out = resp.add_subscriptions();
      out->set_id(subscription.id);
      out->set_user_id(subscription.user_id);
      out->set_entity(subscription.entity);
      out->set_filters(registry::SubscriptionRegistry::FormatFilters(subscription.filters));
    }
    for (const auto& error : lookup.errors) {
      *resp.add_errors() = ToProto(error);
    }
    return resp;
  });
}

}
