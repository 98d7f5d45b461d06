#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <google/protobuf/util/json_util.h>

#include "rowcast/v1.hpp"

using namespace rowcast::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  rowcastctl <addr> peek [n]\n"
            << "  rowcastctl <addr> position\n"
            << "  rowcastctl <addr> evaluate <payload.json>\n"
            << "  rowcastctl <addr> subscribe <user_id> [schema.table]\n"
            << "  rowcastctl <addr> add-subscription <user_id> <schema.table> [filters_json]\n"
            << "  rowcastctl <addr> remove-subscriptions <user_id>\n"
            << "  rowcastctl <addr> list-subscriptions <schema.table>\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto admin_stub  = RowcastAdminService::NewStub(channel);
  auto fanout_stub = RowcastFanoutService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "peek") {
    PeekRequest req;
    if (argc >= 4) req.set_max_changes(static_cast<uint32_t>(std::stoul(argv[3])));

    PeekResponse resp;
    auto         status = admin_stub->Peek(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& change : resp.changes()) {
      std::cout << change.position() << "\t" << change.payload() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "position") {
    GetPositionRequest req;
    PositionResponse   resp;

    auto status = admin_stub->GetPosition(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.position() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "evaluate") {
    if (argc < 4) return 1;

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    EvaluateRequest req;
    req.set_payload(buffer.str());

    EvaluateResponse resp;
    auto             status = admin_stub->Evaluate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "subscribe") {
    if (argc < 4) return 1;

    SubscribeRequest req;
    req.set_user_id(argv[3]);
    if (argc >= 5) req.set_entity(argv[4]);

    auto     reader = fanout_stub->Subscribe(&ctx, req);
    Delivery delivery;
    while (reader->Read(&delivery)) {
      std::cout << ToJson(delivery) << std::endl;
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-subscription") {
    if (argc < 5) return 1;

    AddSubscriptionRequest req;
    req.set_user_id(argv[3]);
    req.set_entity(argv[4]);
    if (argc >= 6) req.set_filters(argv[5]);

    AddSubscriptionResponse resp;
    auto                    status = admin_stub->AddSubscription(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "id=" << resp.id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "remove-subscriptions") {
    if (argc < 4) return 1;

    RemoveSubscriptionsRequest req;
    req.set_user_id(argv[3]);

    RemoveSubscriptionsResponse resp;
    auto                        status = admin_stub->RemoveSubscriptions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "removed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list-subscriptions") {
    if (argc < 4) return 1;

    ListSubscriptionsRequest req;
    req.set_entity(argv[3]);

    ListSubscriptionsResponse resp;
    auto                      status = admin_stub->ListSubscriptions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& subscription : resp.subscriptions()) {
      std::cout << subscription.id() << "\t" << subscription.user_id() << "\t" << subscription.filters() << "\n";
    }
    for (const auto& error : resp.errors()) {
      std::cerr << "error\t" << error.user_id() << "\t" << error.message() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
