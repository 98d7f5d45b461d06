#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <thread>

#include "internal/dispatch/fanout_hub.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using rowcast::dispatch::FanoutHub;
using rowcast::model::VisibilityResult;

VisibilityResult Result(rowcast::util::Lsn position, std::set<std::string> users, const std::string& table = "note") {
  VisibilityResult result;
  result.event.schema_name    = "public";
  result.event.table          = table;
  result.event.position       = position;
  result.is_rls_enabled       = true;
  result.visible_subscribers  = std::move(users);
  return result;
}

void TestDeliversInCommitOrderToVisibleUsersOnly() {
  FanoutHub hub(16);
  auto      a = hub.Connect("a");
  auto      b = hub.Connect("b");

  hub.Accept(Result(1, {"a"}));
  hub.Accept(Result(2, {"a", "b"}));
  hub.Accept(Result(3, {"a"}));

  assert(a->Pending() == 3);
  assert(b->Pending() == 1);
  for (rowcast::util::Lsn expected = 1; expected <= 3; ++expected) {
    auto delivery = a->Next(0ms);
    assert(delivery.has_value());
    assert(delivery->position == expected);
    assert(delivery->is_rls_enabled);
  }
  assert(b->Next(0ms)->position == 2);
  assert(!b->Next(0ms).has_value());
}

void TestRedeliveryIsDeduplicated() {
  FanoutHub hub(16);
  auto      a = hub.Connect("a");

  hub.Accept(Result(5, {"a"}));
  hub.Accept(Result(5, {"a"}));
  hub.Accept(Result(4, {"a"}));
  assert(a->Pending() == 1);

  // not stream-backed: never deduplicated
  hub.Accept(Result(0, {"a"}));
  hub.Accept(Result(0, {"a"}));
  assert(a->Pending() == 3);
}

void TestFullQueueRejectsWholeEvent() {
  FanoutHub hub(2);
  auto      a = hub.Connect("a");
  auto      b = hub.Connect("b");

  hub.Accept(Result(1, {"a"}));
  hub.Accept(Result(2, {"a"}));

  bool threw = false;
  try {
    hub.Accept(Result(3, {"a", "b"}));
  } catch (const rowcast::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
  // nothing enqueued anywhere
  assert(a->Pending() == 2);
  assert(b->Pending() == 0);

  // after draining, the same event is accepted
  (void)a->Next(0ms);
  hub.Accept(Result(3, {"a", "b"}));
  assert(a->Pending() == 2);
  assert(b->Pending() == 1);
}

void TestEntityNarrowingAndMultipleChannels() {
  FanoutHub hub(16);
  auto      notes_only = hub.Connect("a", std::string("public.note"));
  auto      everything = hub.Connect("a");
  assert(hub.ConnectedCount() == 2);

  hub.Accept(Result(1, {"a"}, "note"));
  hub.Accept(Result(2, {"a"}, "todo"));

  assert(notes_only->Pending() == 1);
  assert(everything->Pending() == 2);
}

void TestDisconnectedUsersMissEvents() {
  FanoutHub hub(16);
  auto      a = hub.Connect("a");
  hub.Disconnect(a);
  assert(hub.ConnectedCount() == 0);
  assert(a->IsClosed());

  hub.Accept(Result(1, {"a"}));
  assert(a->Pending() == 0);

  bool threw = false;
  try {
    (void)hub.Connect("");
  } catch (const rowcast::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestNextWakesOnAcceptAndClose() {
  FanoutHub hub(16);
  auto      a = hub.Connect("a");

  std::thread producer([&] {
    std::this_thread::sleep_for(20ms);
    hub.Accept(Result(1, {"a"}));
  });
  auto delivery = a->Next(5s);
  producer.join();
  assert(delivery.has_value() && delivery->position == 1);

  std::thread closer([&] {
    std::this_thread::sleep_for(20ms);
    hub.CloseAll();
  });
  auto none = a->Next(5s);
  closer.join();
  assert(!none.has_value());
  assert(a->IsClosed());
}

} // namespace

int main() {
  TestDeliversInCommitOrderToVisibleUsersOnly();
  TestRedeliveryIsDeduplicated();
  TestFullQueueRejectsWholeEvent();
  TestEntityNarrowingAndMultipleChannels();
  TestDisconnectedUsersMissEvents();
  TestNextWakesOnAcceptAndClose();

  std::cout << "rowcast_unit_fanout_hub: pass\n";
  return 0;
}
