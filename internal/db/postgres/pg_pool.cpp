#include "pg_pool.hpp"

namespace rowcast::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, bool prepare_statements)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      prepare_statements_(prepare_statements) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        std::unique_ptr<pqxx::connection> conn;
        try {
          conn = std::make_unique<pqxx::connection>(conninfo_);
          if (prepare_statements_) {
            PrepareStatements(*conn);
          }
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
        return Wrap(conn.release());
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_subscription",
               "INSERT INTO realtime.subscription(user_id, entity, filters, created_at_ms) "
               "VALUES($1, $2, $3::jsonb, $4) RETURNING id");

  conn.prepare("insert_subscription_with_id",
               "INSERT INTO realtime.subscription(id, user_id, entity, filters, created_at_ms) "
               "VALUES($1, $2, $3, $4::jsonb, $5)");

  conn.prepare("list_subscriptions",
               "SELECT id, user_id, entity, filters::text, created_at_ms "
               "FROM realtime.subscription WHERE entity = $1 ORDER BY id");

  conn.prepare("delete_subscriptions_for_user", "DELETE FROM realtime.subscription WHERE user_id = $1");

  // one row per live column; attname is NULL for a table without columns
  conn.prepare("get_table_security",
               "SELECT c.relrowsecurity, a.attname::text, "
               "       CASE WHEN a.attnum IS NULL THEN false "
               "            ELSE has_column_privilege($3::name, c.oid, a.attnum, 'SELECT') END "
               "FROM pg_class c "
               "JOIN pg_namespace n ON n.oid = c.relnamespace "
               "LEFT JOIN pg_attribute a ON a.attrelid = c.oid AND a.attnum > 0 AND NOT a.attisdropped "
               "WHERE n.nspname = $1 AND c.relname = $2 "
               "  AND EXISTS (SELECT 1 FROM pg_roles r WHERE r.rolname = $3) "
               "ORDER BY a.attnum");

  conn.prepare("upsert_cursor_position",
               "INSERT INTO realtime.cursor_positions(slot_name, position, updated_at_ms) VALUES($1, $2, $3) "
               "ON CONFLICT (slot_name) DO UPDATE SET position = EXCLUDED.position, updated_at_ms = EXCLUDED.updated_at_ms");

  conn.prepare("get_cursor_position", "SELECT slot_name, position, updated_at_ms FROM realtime.cursor_positions WHERE slot_name = $1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      // broken connections are not reused
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace rowcast::db::postgres
