#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/decoder/change_decoder.hpp"
#include "internal/registry/security_catalog.hpp"
#include "internal/security/pg_admission_evaluator.hpp"
#include "internal/util/errors.hpp"

namespace {

constexpr const char* kRole   = "rowcast_it_reader";
constexpr const char* kClaims = "request.jwt.claim.sub";

void PrepareSchema(const std::string& conninfo) {
  rowcast::db::postgres::PgRepository::BootstrapSchema(conninfo);

  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);
  tx.exec("DO $$ BEGIN IF NOT EXISTS (SELECT 1 FROM pg_roles WHERE rolname = 'rowcast_it_reader') THEN CREATE ROLE rowcast_it_reader; END IF; END $$;");
  tx.exec("DROP TABLE IF EXISTS public.rowcast_it_note;");
  tx.exec("CREATE TABLE public.rowcast_it_note (id bigint PRIMARY KEY, user_id text NOT NULL, body text, secret text);");
  tx.exec("ALTER TABLE public.rowcast_it_note ENABLE ROW LEVEL SECURITY;");
  tx.exec(
      "CREATE POLICY owner_reads ON public.rowcast_it_note FOR SELECT TO rowcast_it_reader "
      "USING (user_id = current_setting('request.jwt.claim.sub', true));");
  tx.exec("GRANT SELECT (id, user_id, body) ON public.rowcast_it_note TO rowcast_it_reader;");
  tx.commit();
}

rowcast::model::ChangeEvent NoteInsert(const std::string& owner) {
  return rowcast::decoder::ChangeDecoder::Decode(
      R"({"type":"INSERT","schema":"public","table":"rowcast_it_note","commit_timestamp":"2021-12-01T10:00:00Z",
          "columns":[{"name":"id","type":"int8"},{"name":"user_id","type":"text"},{"name":"body","type":"text"}],
          "record":{"id":1,"user_id":")" +
      owner + R"(","body":"bbb"}})");
}

void TestCatalogDerivedSecurity(const std::shared_ptr<rowcast::db::postgres::PgPool>& pool) {
  auto                               repository = std::make_shared<rowcast::db::postgres::PgRepository>(pool);
  rowcast::registry::SecurityCatalog catalog(repository, kRole);

  auto security = catalog.Resolve("public", "rowcast_it_note");
  assert(security.is_rls_enabled);
  assert(security.granted_columns.has_value());
  assert(security.granted_columns->contains("body"));
  assert(!security.granted_columns->contains("secret"));
}

void TestAdmitsOnlyTheOwner(const std::shared_ptr<rowcast::db::postgres::PgPool>& pool) {
  rowcast::security::PgAdmissionEvaluator evaluator(pool, kRole, kClaims);

  const auto event    = NoteInsert("user-a");
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  auto       result   = evaluator.Admit(event, *event.record, {"user-a", "user-b", "user-c"}, deadline);

  assert(result.errors.empty());
  assert(result.admitted == std::set<std::string>{"user-a"});

  auto none = evaluator.Admit(event, *event.record, {"user-b"}, deadline);
  assert(none.admitted.empty());
}

// Each identity is checked under its own claim, whatever its position in the batch.
void TestEachIdentityUsesItsOwnClaim(const std::shared_ptr<rowcast::db::postgres::PgPool>& pool) {
  rowcast::security::PgAdmissionEvaluator evaluator(pool, kRole, kClaims);
  const auto                              deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

  const auto owned_by_b = NoteInsert("user-b");
  auto       b_result   = evaluator.Admit(owned_by_b, *owned_by_b.record, {"user-a", "user-b"}, deadline);
  assert(b_result.admitted == std::set<std::string>{"user-b"});

  const auto owned_by_a = NoteInsert("user-a");
  auto       a_result   = evaluator.Admit(owned_by_a, *owned_by_a.record, {"user-a", "user-b"}, deadline);
  assert(a_result.admitted == std::set<std::string>{"user-a"});

  auto reversed = evaluator.Admit(owned_by_a, *owned_by_a.record, {"user-b", "user-a"}, deadline);
  assert(reversed.admitted == std::set<std::string>{"user-a"});
}

void TestExpiredDeadline(const std::shared_ptr<rowcast::db::postgres::PgPool>& pool) {
  rowcast::security::PgAdmissionEvaluator evaluator(pool, kRole, kClaims);

  const auto event = NoteInsert("user-a");
  bool       threw = false;
  try {
    (void)evaluator.Admit(event, *event.record, {"user-a"}, std::chrono::steady_clock::now() - std::chrono::seconds(1));
  } catch (const rowcast::util::AdmissionTimeout&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  const char* uri = std::getenv("ROWCAST_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    std::cout << "skipping pg admission suite: ROWCAST_TEST_PG_URI is not set\n";
    return 0;
  }

  PrepareSchema(uri);
  auto pool = std::make_shared<rowcast::db::postgres::PgPool>(uri, 2);

  TestCatalogDerivedSecurity(pool);
  TestAdmitsOnlyTheOwner(pool);
  TestEachIdentityUsesItsOwnClaim(pool);
  TestExpiredDeadline(pool);

  std::cout << "rowcast_integration_pg_admission: pass\n";
  return 0;
}
