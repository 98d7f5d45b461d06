#include "pg_repository.hpp"

namespace rowcast::db::postgres {

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);

  tx.exec("CREATE SCHEMA IF NOT EXISTS realtime;");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS realtime.subscription (id BIGSERIAL PRIMARY KEY, user_id TEXT NOT NULL, entity TEXT NOT NULL, "
      "filters JSONB NOT NULL DEFAULT '[]'::jsonb, created_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS subscription_entity_idx ON realtime.subscription(entity);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS realtime.cursor_positions (slot_name TEXT PRIMARY KEY, position NUMERIC(20,0) NOT NULL, "
      "updated_at_ms BIGINT NOT NULL);");
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e); sql && sql->sqlstate() == "40001") {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertSubscription(Transaction& t, model::SubscriptionRecord& r) {
  try {
    if (r.id == 0) {
      auto res = TX(t).Work().exec_prepared1("insert_subscription", r.user_id, r.entity, r.filters_json, r.created_at_ms);
      r.id     = res[0].as<int64_t>();
    } else {
      TX(t).Work().exec_prepared("insert_subscription_with_id", r.id, r.user_id, r.entity, r.filters_json, r.created_at_ms);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SubscriptionRecord> PgRepository::ListSubscriptions(Transaction& t, const std::string& entity) {
  auto res = TX(t).Work().exec_prepared("list_subscriptions", entity);

  std::vector<model::SubscriptionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::SubscriptionRecord r;
    r.id            = row[0].as<int64_t>();
    r.user_id       = row[1].c_str();
    r.entity        = row[2].c_str();
    r.filters_json  = row[3].is_null() ? "[]" : row[3].c_str();
    r.created_at_ms = row[4].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteSubscriptionsForUser(Transaction& t, const std::string& user_id) {
  try {
    TX(t).Work().exec_prepared("delete_subscriptions_for_user", user_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertTableSecurity(Transaction&, const model::TableSecurityRecord& r) {
  return Result::Err(ErrorCode::Unsupported, "table security for " + r.schema_name + "." + r.table + " is read from the postgres catalog");
}

std::optional<model::TableSecurityRecord> PgRepository::GetTableSecurity(Transaction& t, const std::string& schema_name, const std::string& table,
                                                                         const std::string& role) {
  auto res = TX(t).Work().exec_prepared("get_table_security", schema_name, table, role);
  if (res.empty()) {
    return std::nullopt;
  }

  model::TableSecurityRecord r;
  r.schema_name    = schema_name;
  r.table          = table;
  r.role           = role;
  r.is_rls_enabled = res[0][0].as<bool>();
  r.granted_columns.emplace();
  for (const auto& row : res) {
    if (!row[1].is_null() && row[2].as<bool>()) {
      r.granted_columns->insert(row[1].c_str());
    }
  }
  return r;
}

Result PgRepository::CommitCursorPosition(Transaction& t, const model::CursorPositionRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_cursor_position", r.slot_name, r.position, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CursorPositionRecord> PgRepository::GetCursorPosition(Transaction& t, const std::string& slot_name) {
  auto res = TX(t).Work().exec_prepared("get_cursor_position", slot_name);
  if (res.empty()) {
    return std::nullopt;
  }

  model::CursorPositionRecord r;
  r.slot_name     = res[0][0].c_str();
  r.position      = res[0][1].as<uint64_t>();
  r.updated_at_ms = res[0][2].as<uint64_t>();
  return r;
}

} // namespace rowcast::db::postgres
