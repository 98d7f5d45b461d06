#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace rowcast::db::memory {

namespace {

std::string SecurityKey(const std::string& schema_name, const std::string& table, const std::string& role) {
  return schema_name + "." + table + "#" + role;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertSubscription(Transaction& t, model::SubscriptionRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) {
    r.id = s.next_subscription_id++;
  } else if (s.subscriptions.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "subscription " + std::to_string(r.id));
  } else {
    s.next_subscription_id = std::max(s.next_subscription_id, r.id + 1);
  }
  s.subscriptions[r.id] = r;
  return Result::Ok();
}

std::vector<model::SubscriptionRecord> MemoryRepository::ListSubscriptions(Transaction& t, const std::string& entity) {
  std::vector<model::SubscriptionRecord> out;
  for (const auto& [_, record] : TX(t).View().subscriptions) {
    if (record.entity == entity) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteSubscriptionsForUser(Transaction& t, const std::string& user_id) {
  std::erase_if(TX(t).Mutable().subscriptions, [&](const auto& entry) { return entry.second.user_id == user_id; });
  return Result::Ok();
}

Result MemoryRepository::UpsertTableSecurity(Transaction& t, const model::TableSecurityRecord& r) {
  TX(t).Mutable().table_security[SecurityKey(r.schema_name, r.table, r.role)] = r;
  return Result::Ok();
}

std::optional<model::TableSecurityRecord> MemoryRepository::GetTableSecurity(Transaction& t, const std::string& schema_name, const std::string& table,
                                                                             const std::string& role) {
  const auto& s  = TX(t).View();
  auto        it = s.table_security.find(SecurityKey(schema_name, table, role));
  if (it == s.table_security.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CommitCursorPosition(Transaction& t, const model::CursorPositionRecord& r) {
  TX(t).Mutable().cursor_positions[r.slot_name] = r;
  return Result::Ok();
}

std::optional<model::CursorPositionRecord> MemoryRepository::GetCursorPosition(Transaction& t, const std::string& slot_name) {
  const auto& s  = TX(t).View();
  auto        it = s.cursor_positions.find(slot_name);
  if (it == s.cursor_positions.end()) return std::nullopt;
  return it->second;
}

} // namespace rowcast::db::memory
