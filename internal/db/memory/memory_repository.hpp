#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace rowcast::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::SubscriptionRecord>      subscriptions;
    std::map<std::string, model::TableSecurityRecord> table_security; // schema.table#role
    std::map<std::string, model::CursorPositionRecord> cursor_positions;
    int64_t                                            next_subscription_id = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace rowcast::db::memory
