#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace rowcast::db::postgres {

/*
  Repository over the host database.

  Subscriptions and cursor positions live in the realtime schema.
  Table security is read live from the catalog (pg_class.relrowsecurity
  and has_column_privilege), so UpsertTableSecurity is Unsupported.
*/
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // Creates the realtime schema objects when missing. Uses its own
  // connection because pooled connections prepare against these tables.
  static void BootstrapSchema(const std::string& conninfo);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace rowcast::db::postgres
