#pragma once

#include <string_view>

#include "rowcast/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace rowcast::service {

/*
  Operator surface: inspect the stream, dry-run visibility, manage
  subscriptions. Nothing here dispatches or moves the cursor.
*/
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  rowcast::v1::PeekResponse Peek(const rowcast::v1::PeekRequest& req);

  rowcast::v1::PositionResponse GetPosition(const rowcast::v1::GetPositionRequest& req);

  // Throws util::DecodeError, or util::InvalidArgument when the payload carries no row change.
  rowcast::v1::EvaluateResponse Evaluate(const rowcast::v1::EvaluateRequest& req);

  rowcast::v1::AddSubscriptionResponse AddSubscription(const rowcast::v1::AddSubscriptionRequest& req);

  rowcast::v1::RemoveSubscriptionsResponse RemoveSubscriptions(const rowcast::v1::RemoveSubscriptionsRequest& req);

  rowcast::v1::ListSubscriptionsResponse ListSubscriptions(const rowcast::v1::ListSubscriptionsRequest& req);

private:
  template <typename Fn>
  auto Instrumented(std::string_view route, Fn&& fn);

  ServiceContext ctx_;
};

}
