#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/visibility_engine.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/security/policy_admission_evaluator.hpp"
#include "internal/service/service_context.hpp"
#include "internal/stream/memory_change_source.hpp"
#include "internal/stream/stream_cursor.hpp"
#include "rowcast/v1.hpp"

namespace {

using rowcast::grpc::ToStatus;

struct Harness {
  std::shared_ptr<rowcast::stream::MemoryChangeSource>      source = std::make_shared<rowcast::stream::MemoryChangeSource>("admin");
  rowcast::service::ServiceContext                          ctx;
  std::unique_ptr<rowcast::grpc::AdminServer>               server;

  Harness() {
    auto repository = std::make_shared<rowcast::db::memory::MemoryRepository>();
    auto catalog    = std::make_shared<rowcast::registry::SecurityCatalog>(repository, "authenticated");

    rowcast::model::TableSecurity security;
    security.schema_name     = "public";
    security.table           = "note";
    security.is_rls_enabled  = true;
    security.granted_columns = std::set<std::string>{"id", "user_id"};
    catalog->Register(security);

    auto policies = std::make_shared<rowcast::security::PolicyAdmissionEvaluator>();
    policies->AddPolicy("public.note", rowcast::security::PolicyAdmissionEvaluator::OwnerColumnPolicy("user_id"));
    auto rls = std::make_shared<rowcast::security::RlsVisibilityEvaluator>(policies, rowcast::security::VisibilityOptions{});

    ctx.cursor   = std::make_shared<rowcast::stream::StreamCursor>(source, repository);
    ctx.registry = std::make_shared<rowcast::registry::SubscriptionRegistry>(repository);
    ctx.engine   = std::make_shared<rowcast::engine::VisibilityEngine>(catalog, ctx.registry, rls, rowcast::filter::FilterEvaluator{});
    server       = std::make_unique<rowcast::grpc::AdminServer>(std::make_shared<rowcast::service::AdminService>(ctx));
  }
};

const char* kNoteInsert = R"({"type":"INSERT","schema":"public","table":"note","commit_timestamp":"2021-12-01T10:00:00Z",
  "columns":[{"name":"id","type":"int8"},{"name":"user_id","type":"uuid"},{"name":"secret","type":"text"}],
  "record":{"id":1,"user_id":"user-a","secret":"s"}})";

void TestExceptionMapping() {
  using rowcast::util::DecodeErrorCode;
  assert(ToStatus(rowcast::util::DecodeError(DecodeErrorCode::kMalformed, "x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(rowcast::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(rowcast::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(rowcast::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(rowcast::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(rowcast::util::AdmissionTimeout("x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(rowcast::util::AdmissionError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(rowcast::util::Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(rowcast::util::NotFound("missing table")).error_message() == "missing table");
}

void TestPeekAndPositionDoNotMoveCursor() {
  Harness harness;
  harness.source->Append(kNoteInsert);
  harness.source->AppendAt(0x100000000ull, kNoteInsert);

  rowcast::v1::PeekRequest  req;
  rowcast::v1::PeekResponse resp;
  ::grpc::ServerContext     grpc_ctx;
  assert(harness.server->Peek(&grpc_ctx, &req, &resp).ok());
  assert(resp.changes_size() == 2);
  assert(resp.changes(0).position() == "0/1");
  assert(resp.changes(1).position() == "1/0");

  rowcast::v1::GetPositionRequest position_req;
  rowcast::v1::PositionResponse   position_resp;
  ::grpc::ServerContext           position_ctx;
  assert(harness.server->GetPosition(&position_ctx, &position_req, &position_resp).ok());
  assert(position_resp.position() == "0/0");
}

void TestEvaluateDryRun() {
  Harness harness;
  harness.ctx.registry->Subscribe("user-a", "public.note", {});
  harness.ctx.registry->Subscribe("user-b", "public.note", {});

  rowcast::v1::EvaluateRequest  req;
  rowcast::v1::EvaluateResponse resp;
  req.set_payload(kNoteInsert);
  ::grpc::ServerContext grpc_ctx;
  assert(harness.server->Evaluate(&grpc_ctx, &req, &resp).ok());

  assert(resp.is_rls_enabled());
  assert(resp.visible_subscribers_size() == 1);
  assert(resp.visible_subscribers(0) == "user-a");
  assert(resp.event().kind() == rowcast::v1::CHANGE_KIND_INSERT);
  assert(resp.event().columns_size() == 2);
  assert(!resp.event().record().fields().contains("secret"));
}

void TestEvaluateRejectsBadPayloads() {
  Harness harness;
  ::grpc::ServerContext grpc_ctx;

  rowcast::v1::EvaluateRequest  req;
  rowcast::v1::EvaluateResponse resp;
  req.set_payload(R"({"type":"UPSERT","schema":"public","table":"note"})");
  assert(harness.server->Evaluate(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_payload(R"({"action":"B"})");
  assert(harness.server->Evaluate(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestSubscriptionManagement() {
  Harness harness;

  rowcast::v1::AddSubscriptionRequest  add;
  rowcast::v1::AddSubscriptionResponse added;
  add.set_user_id("user-a");
  add.set_entity("public.note");
  add.set_filters(R"([{"column":"id","op":"gt","value":"0"}])");
  ::grpc::ServerContext add_ctx;
  assert(harness.server->AddSubscription(&add_ctx, &add, &added).ok());
  assert(added.id() > 0);

  add.set_filters(R"([{"column":"id","op":"like","value":"0"}])");
  ::grpc::ServerContext bad_ctx;
  assert(harness.server->AddSubscription(&bad_ctx, &add, &added).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  rowcast::v1::ListSubscriptionsRequest  list;
  rowcast::v1::ListSubscriptionsResponse listed;
  list.set_entity("public.note");
  ::grpc::ServerContext list_ctx;
  assert(harness.server->ListSubscriptions(&list_ctx, &list, &listed).ok());
  assert(listed.subscriptions_size() == 1);
  assert(listed.subscriptions(0).user_id() == "user-a");
  assert(listed.subscriptions(0).filters().find("\"gt\"") != std::string::npos);

  rowcast::v1::RemoveSubscriptionsRequest  remove;
  rowcast::v1::RemoveSubscriptionsResponse removed;
  ::grpc::ServerContext                    empty_ctx;
  assert(harness.server->RemoveSubscriptions(&empty_ctx, &remove, &removed).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  remove.set_user_id("user-a");
  ::grpc::ServerContext remove_ctx;
  assert(harness.server->RemoveSubscriptions(&remove_ctx, &remove, &removed).ok());

  listed.Clear();
  ::grpc::ServerContext relist_ctx;
  assert(harness.server->ListSubscriptions(&relist_ctx, &list, &listed).ok());
  assert(listed.subscriptions_size() == 0);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestPeekAndPositionDoNotMoveCursor();
  TestEvaluateDryRun();
  TestEvaluateRejectsBadPayloads();
  TestSubscriptionManagement();

  std::cout << "rowcast_unit_grpc_status: pass\n";
  return 0;
}
