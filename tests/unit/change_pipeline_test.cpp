#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/fanout_hub.hpp"
#include "internal/engine/visibility_engine.hpp"
#include "internal/pipeline/change_pipeline.hpp"
#include "internal/security/policy_admission_evaluator.hpp"
#include "internal/stream/memory_change_source.hpp"

namespace {

using namespace std::chrono_literals;

struct Fixture {
  std::shared_ptr<rowcast::db::memory::MemoryRepository>   repository = std::make_shared<rowcast::db::memory::MemoryRepository>();
  std::shared_ptr<rowcast::stream::MemoryChangeSource>     source     = std::make_shared<rowcast::stream::MemoryChangeSource>("test");
  std::shared_ptr<rowcast::stream::StreamCursor>           cursor;
  std::shared_ptr<rowcast::registry::SubscriptionRegistry> subscriptions;
  std::shared_ptr<rowcast::dispatch::FanoutHub>            hub;
  std::unique_ptr<rowcast::pipeline::ChangePipeline>       change_pipeline;

  explicit Fixture(std::size_t queue_capacity = 16, std::size_t batch_size = 10) {
    cursor = std::make_shared<rowcast::stream::StreamCursor>(source, repository);

    auto catalog  = std::make_shared<rowcast::registry::SecurityCatalog>(repository, "authenticated");
    subscriptions = std::make_shared<rowcast::registry::SubscriptionRegistry>(repository);

    rowcast::model::TableSecurity security;
    security.schema_name     = "public";
    security.table           = "note";
    security.role            = "authenticated";
    security.is_rls_enabled  = true;
    security.granted_columns = std::set<std::string>{"id", "user_id", "body"};
    catalog->Register(security);

    auto policies = std::make_shared<rowcast::security::PolicyAdmissionEvaluator>();
    policies->AddPolicy("public.note", rowcast::security::PolicyAdmissionEvaluator::OwnerColumnPolicy("user_id"));
    auto rls = std::make_shared<rowcast::security::RlsVisibilityEvaluator>(policies, rowcast::security::VisibilityOptions{});

    auto visibility_engine = std::make_shared<rowcast::engine::VisibilityEngine>(catalog, subscriptions, rls, rowcast::filter::FilterEvaluator{});
    hub                    = std::make_shared<rowcast::dispatch::FanoutHub>(queue_capacity);
    change_pipeline        = std::make_unique<rowcast::pipeline::ChangePipeline>(cursor, visibility_engine, hub, batch_size);
  }
};

std::string NoteInsert(int id, const std::string& owner) {
  return R"({"type":"INSERT","schema":"public","table":"note","commit_timestamp":"2021-12-01T10:00:00Z",
             "columns":[{"name":"id","type":"int8"},{"name":"user_id","type":"uuid"},{"name":"body","type":"text"}],
             "record":{"id":)" +
         std::to_string(id) + R"(,"user_id":")" + owner + R"(","body":"x"}})";
}

void TestDeliversInOrderAndAdvances() {
  Fixture fixture;
  fixture.subscriptions->Subscribe("user-a", "public.note", {});
  fixture.subscriptions->Subscribe("user-b", "public.note", {});
  auto a = fixture.hub->Connect("user-a");
  auto b = fixture.hub->Connect("user-b");

  const auto first  = fixture.source->Append(NoteInsert(1, "user-a"));
  const auto second = fixture.source->Append(NoteInsert(2, "user-b"));
  const auto third  = fixture.source->Append(NoteInsert(3, "user-a"));

  auto stats = fixture.change_pipeline->RunOnce();
  assert(stats.processed == 3);
  assert(stats.failed == 0);
  assert(fixture.cursor->Position() == third);

  auto delivery = a->Next(0ms);
  assert(delivery.has_value() && delivery->position == first);
  assert(delivery->is_rls_enabled);
  assert(a->Next(0ms)->position == third);
  assert(!a->Next(0ms).has_value());
  assert(b->Next(0ms)->position == second);

  // nothing left
  stats = fixture.change_pipeline->RunOnce();
  assert(stats.processed == 0 && stats.failed == 0);
}

void TestDecodeErrorHoldsCursor() {
  Fixture fixture;
  const auto good = fixture.source->Append(NoteInsert(1, "user-a"));
  fixture.source->Append("{not json");
  fixture.source->Append(NoteInsert(2, "user-a"));

  auto stats = fixture.change_pipeline->RunOnce();
  assert(stats.processed == 1);
  assert(stats.failed == 1);
  assert(fixture.cursor->Position() == good);

  // retried on every pass
  stats = fixture.change_pipeline->RunOnce();
  assert(stats.processed == 0 && stats.failed == 1);
  assert(fixture.cursor->Position() == good);
}

void TestRejectedDispatchIsRedelivered() {
  Fixture fixture(1);
  fixture.subscriptions->Subscribe("user-a", "public.note", {});
  auto a = fixture.hub->Connect("user-a");

  const auto first  = fixture.source->Append(NoteInsert(1, "user-a"));
  const auto second = fixture.source->Append(NoteInsert(2, "user-a"));

  auto stats = fixture.change_pipeline->RunOnce();
  assert(stats.processed == 1);
  assert(stats.failed == 1);
  assert(fixture.cursor->Position() == first);

  assert(a->Next(0ms)->position == first);
  stats = fixture.change_pipeline->RunOnce();
  assert(stats.processed == 1 && stats.failed == 0);
  assert(fixture.cursor->Position() == second);
  assert(a->Next(0ms)->position == second);
}

void TestTransactionMarkersAreSkipped() {
  Fixture fixture;
  fixture.subscriptions->Subscribe("user-a", "public.note", {});
  auto a = fixture.hub->Connect("user-a");

  fixture.source->Append(R"({"action":"B"})");
  const auto row = fixture.source->Append(
      R"({"action":"I","schema":"public","table":"note","timestamp":"2021-12-01 10:00:00.000000+00",
          "columns":[{"name":"id","type":"bigint","value":1},{"name":"user_id","type":"uuid","value":"user-a"},
                     {"name":"body","type":"text","value":"x"}]})");
  const auto commit = fixture.source->Append(R"({"action":"C"})");

  auto stats = fixture.change_pipeline->RunOnce();
  assert(stats.failed == 0);
  assert(fixture.cursor->Position() == commit);
  assert(a->Pending() == 1);
  assert(a->Next(0ms)->position == row);
}

void TestBatchSizeBoundsOnePass() {
  Fixture fixture(16, 2);
  for (int i = 0; i < 5; ++i) {
    fixture.source->Append(NoteInsert(i, "user-a"));
  }
  assert(fixture.change_pipeline->RunOnce().processed == 2);
  assert(fixture.change_pipeline->RunOnce().processed == 2);
  assert(fixture.change_pipeline->RunOnce().processed == 1);
  assert(fixture.cursor->Position() == 5);
}

} // namespace

int main() {
  TestDeliversInOrderAndAdvances();
  TestDecodeErrorHoldsCursor();
  TestRejectedDispatchIsRedelivered();
  TestTransactionMarkersAreSkipped();
  TestBatchSizeBoundsOnePass();

  std::cout << "rowcast_unit_change_pipeline: pass\n";
  return 0;
}
