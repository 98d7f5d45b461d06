#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace rowcast::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets the admin RPCs read while the pipeline commits positions
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

void SqliteDB::Bootstrap() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS subscription (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id TEXT NOT NULL, entity TEXT NOT NULL, filters TEXT "
      "NOT NULL DEFAULT '[]', created_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS subscription_entity_idx ON subscription(entity);",
      "CREATE TABLE IF NOT EXISTS table_security (schema_name TEXT NOT NULL, table_name TEXT NOT NULL, role TEXT NOT NULL, is_rls_enabled INTEGER "
      "NOT NULL, has_grants INTEGER NOT NULL, PRIMARY KEY (schema_name, table_name, role));",
      "CREATE TABLE IF NOT EXISTS column_grant (schema_name TEXT NOT NULL, table_name TEXT NOT NULL, role TEXT NOT NULL, column_name TEXT NOT NULL, "
      "PRIMARY KEY (schema_name, table_name, role, column_name), FOREIGN KEY (schema_name, table_name, role) REFERENCES "
      "table_security(schema_name, table_name, role) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS cursor_position (slot_name TEXT PRIMARY KEY, position INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }
}

Statement::Statement(sqlite3* db, const char* sql) {
  if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  sqlite3_finalize(stmt_);
}

} // namespace rowcast::db::sqlite
