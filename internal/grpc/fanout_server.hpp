#pragma once

#include <chrono>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/dispatch/fanout_hub.hpp"
#include "rowcast/v1/fanout_service.grpc.pb.h"

namespace rowcast::grpc {

/*
  Streams a user's deliveries from a FanoutHub channel until the client
  cancels or the hub is closed.
*/
class FanoutServer final : public rowcast::v1::RowcastFanoutService::Service {
public:
  explicit FanoutServer(std::shared_ptr<rowcast::dispatch::FanoutHub> hub,
                        std::chrono::milliseconds                       poll_interval = std::chrono::milliseconds(200));

  ::grpc::Status Subscribe(::grpc::ServerContext*, const rowcast::v1::SubscribeRequest*,
                           ::grpc::ServerWriter<rowcast::v1::Delivery>*) override;

private:
  std::shared_ptr<rowcast::dispatch::FanoutHub> hub_;
  std::chrono::milliseconds                     poll_interval_;
};

} // namespace rowcast::grpc
