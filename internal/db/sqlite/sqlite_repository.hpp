#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace rowcast::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                                 InsertSubscription(Transaction&, model::SubscriptionRecord&) override;
  std::vector<model::SubscriptionRecord> ListSubscriptions(Transaction&, const std::string& entity) override;
  Result                                 DeleteSubscriptionsForUser(Transaction&, const std::string& user_id) override;

  Result                                    UpsertTableSecurity(Transaction&, const model::TableSecurityRecord&) override;
  std::optional<model::TableSecurityRecord> GetTableSecurity(Transaction&, const std::string& schema_name, const std::string& table,
                                                             const std::string& role) override;

  Result                                     CommitCursorPosition(Transaction&, const model::CursorPositionRecord&) override;
  std::optional<model::CursorPositionRecord> GetCursorPosition(Transaction&, const std::string& slot_name) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace rowcast::db::sqlite
