#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "rowcast/v1.hpp"

namespace rowcast::grpc {

AdminServer::AdminServer(std::shared_ptr<rowcast::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Peek(::grpc::ServerContext*, const rowcast::v1::PeekRequest* req, rowcast::v1::PeekResponse* resp) {
  try {
    *resp = service_->Peek(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetPosition(::grpc::ServerContext*, const rowcast::v1::GetPositionRequest* req, rowcast::v1::PositionResponse* resp) {
  try {
    *resp = service_->GetPosition(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Evaluate(::grpc::ServerContext*, const rowcast::v1::EvaluateRequest* req, rowcast::v1::EvaluateResponse* resp) {
  try {
    *resp = service_->Evaluate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::AddSubscription(::grpc::ServerContext*, const rowcast::v1::AddSubscriptionRequest* req,
                                            rowcast::v1::AddSubscriptionResponse* resp) {
  try {
    *resp = service_->AddSubscription(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RemoveSubscriptions(::grpc::ServerContext*, const rowcast::v1::RemoveSubscriptionsRequest* req,
                                                rowcast::v1::RemoveSubscriptionsResponse* resp) {
  try {
    *resp = service_->RemoveSubscriptions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListSubscriptions(::grpc::ServerContext*, const rowcast::v1::ListSubscriptionsRequest* req,
                                              rowcast::v1::ListSubscriptionsResponse* resp) {
  try {
    *resp = service_->ListSubscriptions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace rowcast::grpc
