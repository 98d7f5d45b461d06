#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "rowcast/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace rowcast::grpc {

class AdminServer final : public rowcast::v1::RowcastAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<rowcast::service::AdminService> svc);

  ::grpc::Status Peek(::grpc::ServerContext*, const rowcast::v1::PeekRequest*, rowcast::v1::PeekResponse*) override;

  ::grpc::Status GetPosition(::grpc::ServerContext*, const rowcast::v1::GetPositionRequest*, rowcast::v1::PositionResponse*) override;

  ::grpc::Status Evaluate(::grpc::ServerContext*, const rowcast::v1::EvaluateRequest*, rowcast::v1::EvaluateResponse*) override;

  ::grpc::Status AddSubscription(::grpc::ServerContext*, const rowcast::v1::AddSubscriptionRequest*,
                                 rowcast::v1::AddSubscriptionResponse*) override;

  ::grpc::Status RemoveSubscriptions(::grpc::ServerContext*, const rowcast::v1::RemoveSubscriptionsRequest*,
                                     rowcast::v1::RemoveSubscriptionsResponse*) override;

  ::grpc::Status ListSubscriptions(::grpc::ServerContext*, const rowcast::v1::ListSubscriptionsRequest*,
                                   rowcast::v1::ListSubscriptionsResponse*) override;

private:
  std::shared_ptr<rowcast::service::AdminService> service_;
};

}
