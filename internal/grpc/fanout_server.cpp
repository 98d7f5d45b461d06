#include "fanout_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/proto_convert.hpp"
#include "rowcast/v1.hpp"

namespace rowcast::grpc {

FanoutServer::FanoutServer(std::shared_ptr<rowcast::dispatch::FanoutHub> hub, std::chrono::milliseconds poll_interval)
    : hub_(std::move(hub)), poll_interval_(poll_interval) {
}

::grpc::Status FanoutServer::Subscribe(::grpc::ServerContext* context, const rowcast::v1::SubscribeRequest* req,
                                       ::grpc::ServerWriter<rowcast::v1::Delivery>* writer) {
  std::shared_ptr<rowcast::dispatch::SubscriberChannel> channel;
  try {
    std::optional<std::string> entity;
    if (!req->entity().empty()) entity = req->entity();
    channel = hub_->Connect(req->user_id(), std::move(entity));
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  ::grpc::Status status = ::grpc::Status::OK;
  while (!context->IsCancelled()) {
    auto delivery = channel->Next(poll_interval_);
    if (!delivery) {
      if (channel->IsClosed()) {
        status = ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "server shutting down");
        break;
      }
      continue;
    }
    if (!writer->Write(rowcast::service::ToProto(*delivery))) {
      break;
    }
  }

  hub_->Disconnect(channel);
  ROWCAST_LOG_INFO("subscriber disconnected", {rowcast::observability::StringField("user_id", req->user_id())});
  return status;
}

} // namespace rowcast::grpc
