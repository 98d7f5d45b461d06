#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/registry/security_catalog.hpp"
#include "internal/registry/subscription_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using rowcast::model::FilterOp;
using rowcast::registry::SubscriptionRegistry;

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const rowcast::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestParseFilters() {
  auto filters = SubscriptionRegistry::ParseFilters(R"([{"column":"body","op":"eq","value":"bbb"},{"column":"id","op":"gte","value":5}])");
  assert(filters.size() == 2);
  assert(filters[0].column == "body");
  assert(filters[0].op == FilterOp::kEq);
  assert(filters[0].value == "bbb");
  assert(filters[1].op == FilterOp::kGte);
  assert(filters[1].value == "5");

  assert(SubscriptionRegistry::ParseFilters("[]").empty());
}

void TestParseFiltersRejectsMalformedInput() {
  assert(ThrowsInvalidArgument([] { SubscriptionRegistry::ParseFilters("not json"); }));
  assert(ThrowsInvalidArgument([] { SubscriptionRegistry::ParseFilters(R"({"column":"a"})"); }));
  assert(ThrowsInvalidArgument([] { SubscriptionRegistry::ParseFilters(R"(["eq"])"); }));
  assert(ThrowsInvalidArgument([] { SubscriptionRegistry::ParseFilters(R"([{"column":"a","op":"eq"}])"); }));
  assert(ThrowsInvalidArgument([] { SubscriptionRegistry::ParseFilters(R"([{"column":"","op":"eq","value":"x"}])"); }));
  assert(ThrowsInvalidArgument([] { SubscriptionRegistry::ParseFilters(R"([{"column":"a","op":"like","value":"x"}])"); }));
  assert(ThrowsInvalidArgument([] { SubscriptionRegistry::ParseFilters(R"([{"column":"a","op":"eq","value":null}])"); }));
  assert(ThrowsInvalidArgument([] { SubscriptionRegistry::ParseFilters(R"([{"column":"a","op":"eq","value":[1]}])"); }));
}

void TestFormatFiltersIsReadBack() {
  const std::vector<rowcast::model::UserFilter> filters = {{"body", FilterOp::kNeq, "a\"b"}, {"id", FilterOp::kLt, "10"}};
  auto parsed = SubscriptionRegistry::ParseFilters(SubscriptionRegistry::FormatFilters(filters));
  assert(parsed.size() == 2);
  assert(parsed[0].op == FilterOp::kNeq);
  assert(parsed[0].value == "a\"b");
  assert(parsed[1].column == "id");
}

void TestSubscribeAndUnsubscribe() {
  auto repository = std::make_shared<rowcast::db::memory::MemoryRepository>();
  SubscriptionRegistry registry(repository);

  const auto first  = registry.Subscribe("user-a", "public.note", {{"body", FilterOp::kEq, "bbb"}});
  const auto second = registry.Subscribe("user-b", "public.note", {});
  registry.Subscribe("user-a", "public.todo", {});
  assert(first != second);

  auto notes = registry.ForEntity("public.note");
  assert(notes.subscriptions.size() == 2);
  assert(notes.errors.empty());

  registry.UnsubscribeUser("user-a");
  notes = registry.ForEntity("public.note");
  assert(notes.subscriptions.size() == 1);
  assert(notes.subscriptions[0].user_id == "user-b");
  assert(registry.ForEntity("public.todo").subscriptions.empty());

  assert(ThrowsInvalidArgument([&] { registry.Subscribe("", "public.note", {}); }));
  assert(ThrowsInvalidArgument([&] { registry.Subscribe("user-a", "note", {}); }));
}

void TestCatalogFailsClosedWithoutMetadata() {
  auto repository = std::make_shared<rowcast::db::memory::MemoryRepository>();
  rowcast::registry::SecurityCatalog catalog(repository, "authenticated");

  auto unknown = catalog.Resolve("public", "note");
  assert(unknown.is_rls_enabled);
  assert(!unknown.granted_columns.has_value());
  assert(unknown.role == "authenticated");

  rowcast::model::TableSecurity security;
  security.schema_name     = "public";
  security.table           = "note";
  security.is_rls_enabled  = false;
  security.granted_columns = std::set<std::string>{"id"};
  catalog.Register(security);

  auto known = catalog.Resolve("public", "note");
  assert(!known.is_rls_enabled);
  assert(known.granted_columns == std::set<std::string>{"id"});

  // a different role sees nothing
  rowcast::registry::SecurityCatalog anon(repository, "anon");
  assert(!anon.Resolve("public", "note").granted_columns.has_value());
}

} // namespace

int main() {
  TestParseFilters();
  TestParseFiltersRejectsMalformedInput();
  TestFormatFiltersIsReadBack();
  TestSubscribeAndUnsubscribe();
  TestCatalogFailsClosedWithoutMetadata();

  std::cout << "rowcast_unit_subscription_registry: pass\n";
  return 0;
}
