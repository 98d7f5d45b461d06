#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace rowcast::db::sqlite {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSubscription(Transaction& t, model::SubscriptionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               r.id == 0 ? "INSERT INTO subscription(user_id,entity,filters,created_at_ms) VALUES(?,?,?,?);"
                         : "INSERT INTO subscription(user_id,entity,filters,created_at_ms,id) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.user_id);
  BindText(st.get(), 2, r.entity);
  BindText(st.get(), 3, r.filters_json);
  BindI64(st.get(), 4, static_cast<int64_t>(r.created_at_ms));
  if (r.id != 0) BindI64(st.get(), 5, r.id);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "subscription " + std::to_string(r.id));
  }
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (r.id == 0) r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::vector<model::SubscriptionRecord> SqliteRepository::ListSubscriptions(Transaction& t, const std::string& entity) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,user_id,entity,filters,created_at_ms FROM subscription WHERE entity=? ORDER BY id;");
  if (!st) throw std::runtime_error(Translate(db, SQLITE_ERROR).ToString());

  BindText(st.get(), 1, entity);

  std::vector<model::SubscriptionRecord> out;
  int                                    rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::SubscriptionRecord r;
    r.id            = ColI64(st.get(), 0);
    r.user_id       = ColText(st.get(), 1);
    r.entity        = ColText(st.get(), 2);
    r.filters_json  = ColText(st.get(), 3);
    r.created_at_ms = static_cast<uint64_t>(ColI64(st.get(), 4));
    out.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(Translate(db, rc).ToString());
  return out;
}

Result SqliteRepository::DeleteSubscriptionsForUser(Transaction& t, const std::string& user_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM subscription WHERE user_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, user_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Table security
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTableSecurity(Transaction& t, const model::TableSecurityRecord& r) {
  auto* db = TX(t).Handle();

  {
    Statement st(db,
                 "INSERT INTO table_security(schema_name,table_name,role,is_rls_enabled,has_grants) VALUES(?,?,?,?,?) "
                 "ON CONFLICT(schema_name,table_name,role) DO UPDATE SET is_rls_enabled=excluded.is_rls_enabled,has_grants=excluded.has_grants;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, r.schema_name);
    BindText(st.get(), 2, r.table);
    BindText(st.get(), 3, r.role);
    BindI64(st.get(), 4, r.is_rls_enabled ? 1 : 0);
    BindI64(st.get(), 5, r.granted_columns ? 1 : 0);
    if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;
  }

  {
    Statement st(db, "DELETE FROM column_grant WHERE schema_name=? AND table_name=? AND role=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, r.schema_name);
    BindText(st.get(), 2, r.table);
    BindText(st.get(), 3, r.role);
    if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;
  }

  if (!r.granted_columns) return Result::Ok();

  Statement st(db, "INSERT INTO column_grant(schema_name,table_name,role,column_name) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  for (const auto& column : *r.granted_columns) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, r.schema_name);
    BindText(st.get(), 2, r.table);
    BindText(st.get(), 3, r.role);
    BindText(st.get(), 4, column);
    if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;
  }
  return Result::Ok();
}

std::optional<model::TableSecurityRecord> SqliteRepository::GetTableSecurity(Transaction& t, const std::string& schema_name, const std::string& table,
                                                                             const std::string& role) {
  auto* db = TX(t).Handle();

  model::TableSecurityRecord r;
  bool                       has_grants = false;
  {
    Statement st(db, "SELECT is_rls_enabled,has_grants FROM table_security WHERE schema_name=? AND table_name=? AND role=?;");
    if (!st) throw std::runtime_error(Translate(db, SQLITE_ERROR).ToString());
    BindText(st.get(), 1, schema_name);
    BindText(st.get(), 2, table);
    BindText(st.get(), 3, role);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw std::runtime_error(Translate(db, rc).ToString());

    r.schema_name    = schema_name;
    r.table          = table;
    r.role           = role;
    r.is_rls_enabled = ColI64(st.get(), 0) != 0;
    has_grants       = ColI64(st.get(), 1) != 0;
  }
  if (!has_grants) return r;

  Statement st(db, "SELECT column_name FROM column_grant WHERE schema_name=? AND table_name=? AND role=?;");
  if (!st) throw std::runtime_error(Translate(db, SQLITE_ERROR).ToString());
  BindText(st.get(), 1, schema_name);
  BindText(st.get(), 2, table);
  BindText(st.get(), 3, role);

  r.granted_columns.emplace();
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    r.granted_columns->insert(ColText(st.get(), 0));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(Translate(db, rc).ToString());
  return r;
}

// ------------------------------------------------------------------
// Cursor positions
// ------------------------------------------------------------------

Result SqliteRepository::CommitCursorPosition(Transaction& t, const model::CursorPositionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO cursor_position(slot_name,position,updated_at_ms) VALUES(?,?,?) "
               "ON CONFLICT(slot_name) DO UPDATE SET position=excluded.position,updated_at_ms=excluded.updated_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.slot_name);
  // sqlite integers are signed; positions round-trip through the bit pattern
  BindI64(st.get(), 2, static_cast<int64_t>(r.position));
  BindI64(st.get(), 3, static_cast<int64_t>(r.updated_at_ms));
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CursorPositionRecord> SqliteRepository::GetCursorPosition(Transaction& t, const std::string& slot_name) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT slot_name,position,updated_at_ms FROM cursor_position WHERE slot_name=?;");
  if (!st) throw std::runtime_error(Translate(db, SQLITE_ERROR).ToString());
  BindText(st.get(), 1, slot_name);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(Translate(db, rc).ToString());

  model::CursorPositionRecord r;
  r.slot_name     = ColText(st.get(), 0);
  r.position      = static_cast<uint64_t>(ColI64(st.get(), 1));
  r.updated_at_ms = static_cast<uint64_t>(ColI64(st.get(), 2));
  return r;
}

} // namespace rowcast::db::sqlite
