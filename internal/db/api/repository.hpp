#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cursor_position_record.hpp"
#include "internal/db/model/subscription_record.hpp"
#include "internal/db/model/table_security_record.hpp"

namespace rowcast::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A committed cursor position survives restart (sqlite/postgres)

  The DB is the source of truth for:
    subscriptions
    table security metadata
    durable cursor positions
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Subscriptions
  // ---------------------------------------------------------------------

  // Assigns record.id when it is 0.
  virtual Result InsertSubscription(Transaction&, model::SubscriptionRecord& record) = 0;

  // Ordered by id.
  virtual std::vector<model::SubscriptionRecord> ListSubscriptions(Transaction&, const std::string& entity) = 0;

  virtual Result DeleteSubscriptionsForUser(Transaction&, const std::string& user_id) = 0;

  // ---------------------------------------------------------------------
  // Table security
  // ---------------------------------------------------------------------

  virtual Result UpsertTableSecurity(Transaction&, const model::TableSecurityRecord&) = 0;

  virtual std::optional<model::TableSecurityRecord> GetTableSecurity(Transaction&, const std::string& schema_name, const std::string& table,
                                                                     const std::string& role) = 0;

  // ---------------------------------------------------------------------
  // Cursor positions
  // ---------------------------------------------------------------------

  virtual Result CommitCursorPosition(Transaction&, const model::CursorPositionRecord&) = 0;

  virtual std::optional<model::CursorPositionRecord> GetCursorPosition(Transaction&, const std::string& slot_name) = 0;
};

} // namespace rowcast::db
