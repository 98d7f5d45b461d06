#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/stream/memory_change_source.hpp"
#include "internal/stream/stream_cursor.hpp"

#if ROWCAST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ROWCAST_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using rowcast::db::ErrorCode;
using rowcast::db::Repository;
using rowcast::db::memory::MemoryRepository;
using rowcast::db::model::CursorPositionRecord;
using rowcast::db::model::SubscriptionRecord;
using rowcast::db::model::TableSecurityRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // postgres derives table security from its catalog
  bool stores_table_security = true;
};

SubscriptionRecord MakeSubscription(const std::string& user_id, const std::string& entity, const std::string& filters = "[]") {
  SubscriptionRecord record;
  record.user_id       = user_id;
  record.entity        = entity;
  record.filters_json  = filters;
  record.created_at_ms = NowMs();
  return record;
}

void VerifySubscriptions(Repository& repo, const std::string& prefix) {
  const auto entity = "public." + prefix + "_note";

  auto tx = repo.Begin();
  auto a  = MakeSubscription(prefix + "-a", entity, R"([{"column":"body","op":"eq","value":"bbb"}])");
  auto b  = MakeSubscription(prefix + "-b", entity);
  auto c  = MakeSubscription(prefix + "-a", entity + "_other");
  assert(repo.InsertSubscription(*tx, a));
  assert(repo.InsertSubscription(*tx, b));
  assert(repo.InsertSubscription(*tx, c));
  assert(a.id != 0 && b.id != 0 && a.id != b.id);

  auto listed = repo.ListSubscriptions(*tx, entity);
  assert(listed.size() == 2);
  assert(listed[0].id < listed[1].id);
  assert(listed[0].user_id == prefix + "-a");
  assert(listed[0].filters_json.find("bbb") != std::string::npos);
  tx->Commit();

  auto del_tx = repo.Begin();
  assert(repo.DeleteSubscriptionsForUser(*del_tx, prefix + "-a"));
  auto remaining = repo.ListSubscriptions(*del_tx, entity);
  assert(remaining.size() == 1);
  assert(remaining[0].user_id == prefix + "-b");
  assert(repo.ListSubscriptions(*del_tx, entity + "_other").empty());
  assert(repo.DeleteSubscriptionsForUser(*del_tx, prefix + "-b"));
  del_tx->Commit();
}

void VerifyTableSecurity(Repository& repo, const std::string& prefix, bool stores_table_security) {
  TableSecurityRecord record;
  record.schema_name     = "public";
  record.table           = prefix + "_secure";
  record.role            = "authenticated";
  record.is_rls_enabled  = true;
  record.granted_columns = std::set<std::string>{"id", "user_id"};

  auto tx     = repo.Begin();
  auto result = repo.UpsertTableSecurity(*tx, record);
  if (!stores_table_security) {
    assert(!result);
    assert(result.code == ErrorCode::Unsupported);
    tx->Rollback();
    return;
  }
  assert(result);

  auto read = repo.GetTableSecurity(*tx, "public", record.table, "authenticated");
  assert(read.has_value());
  assert(read->is_rls_enabled);
  assert(read->granted_columns == record.granted_columns);

  // another role has no metadata
  assert(!repo.GetTableSecurity(*tx, "public", record.table, "anon").has_value());

  record.is_rls_enabled  = false;
  record.granted_columns = std::set<std::string>{};
  assert(repo.UpsertTableSecurity(*tx, record));
  read = repo.GetTableSecurity(*tx, "public", record.table, "authenticated");
  assert(read.has_value());
  assert(!read->is_rls_enabled);
  assert(read->granted_columns.has_value() && read->granted_columns->empty());
  tx->Commit();
}

void VerifyCursorPositions(Repository& repo, const std::string& prefix) {
  const auto slot = prefix + "_slot";

  auto tx = repo.Begin();
  assert(!repo.GetCursorPosition(*tx, slot).has_value());

  // full 64-bit range survives storage
  assert(repo.CommitCursorPosition(*tx, {slot, 0xFFFFFFFF00000001ull, NowMs()}));
  auto read = repo.GetCursorPosition(*tx, slot);
  assert(read.has_value());
  assert(read->position == 0xFFFFFFFF00000001ull);

  assert(repo.CommitCursorPosition(*tx, {slot, 42, NowMs()}));
  assert(repo.GetCursorPosition(*tx, slot)->position == 42);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto entity = "public." + prefix + "_rollback";
  {
    auto tx  = repo.Begin();
    auto sub = MakeSubscription(prefix + "-r", entity);
    assert(repo.InsertSubscription(*tx, sub));
    assert(repo.CommitCursorPosition(*tx, {prefix + "_rollback_slot", 7, NowMs()}));
    tx->Rollback();
  }
  {
    // destructor rolls back as well
    auto tx  = repo.Begin();
    auto sub = MakeSubscription(prefix + "-r", entity);
    assert(repo.InsertSubscription(*tx, sub));
  }

  auto tx = repo.Begin();
  assert(repo.ListSubscriptions(*tx, entity).empty());
  assert(!repo.GetCursorPosition(*tx, prefix + "_rollback_slot").has_value());
  tx->Commit();
}

void VerifyCursorResumesAfterRestart(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto source = std::make_shared<rowcast::stream::MemoryChangeSource>(prefix + "_restart");
  for (int i = 0; i < 4; ++i) {
    source->Append("{}");
  }

  auto repo = backend.make_repository();
  {
    rowcast::stream::StreamCursor cursor(source, repo);
    assert(cursor.Consume(2).size() == 2);
    assert(cursor.Position() == 2);

    auto tx  = repo->Begin();
    auto sub = MakeSubscription(prefix + "-durable", "public." + prefix + "_durable");
    assert(repo->InsertSubscription(*tx, sub));
    tx->Commit();
  }

  backend.restart(repo);

  rowcast::stream::StreamCursor resumed(source, repo);
  assert(resumed.Position() == 2);
  auto pending = resumed.Peek(10);
  assert(pending.size() == 2);
  assert(pending[0].position == 3);

  auto tx = repo->Begin();
  assert(repo->ListSubscriptions(*tx, "public." + prefix + "_durable").size() == 1);
  assert(repo->DeleteSubscriptionsForUser(*tx, prefix + "-durable"));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                  = "memory",
      .make_repository       = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart      = []() { return false; },
      .restart               = [](std::shared_ptr<Repository>&) {},
      .cleanup               = []() {},
      .stores_table_security = true,
  };
}

#if ROWCAST_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("rowcast_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<rowcast::db::sqlite::SqliteDB>(db_path);
    db->Bootstrap();
    return std::make_shared<rowcast::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                  = "sqlite",
      .make_repository       = make_repo,
      .supports_restart      = []() { return true; },
      .restart               = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup               = [db_path]() { std::filesystem::remove(db_path); },
      .stores_table_security = true,
  };
}
#endif

#if ROWCAST_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ROWCAST_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ROWCAST_TEST_PG_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    rowcast::db::postgres::PgRepository::BootstrapSchema(conninfo);
    return std::make_shared<rowcast::db::postgres::PgRepository>(std::make_shared<rowcast::db::postgres::PgPool>(conninfo, 4));
  };

  return BackendFactory{
      .name                  = "postgres",
      .make_repository       = make_repo,
      .supports_restart      = []() { return true; },
      .restart               = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup               = []() {},
      .stores_table_security = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo   = backend.make_repository();
  const auto prefix = backend.name + std::to_string(NowMs());

  VerifySubscriptions(*repo, prefix);
  VerifyTableSecurity(*repo, prefix, backend.stores_table_security);
  VerifyCursorPositions(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);

  repo.reset();
  VerifyCursorResumesAfterRestart(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ROWCAST_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ROWCAST_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "rowcast_integration_repository_parity: pass\n";
  return 0;
}
