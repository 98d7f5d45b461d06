#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/stream/change_source.hpp"
#include "internal/stream/publication.hpp"

namespace rowcast::stream {

struct PgSlotOptions {
  std::string slot_name   = "realtime";
  std::string publication = "supabase_realtime";
  bool        create_slot = false;
};

/*
  PgSlotSource

  wal2json logical replication slot. Peek reads with
  pg_logical_slot_peek_changes (the slot is not moved), Advance moves
  the slot with pg_replication_slot_advance.

  The slot replays whole transactions from its confirmed position, so
  Peek drops entries at or before `from` itself. wal2json options are
  derived from the publication on every Peek; a publication that
  captures nothing yields no changes.
*/
class PgSlotSource final : public ChangeSource {
 public:
  PgSlotSource(std::shared_ptr<db::postgres::PgPool> pool, PgSlotOptions options);

  // Creates the slot when create_slot is set and the slot is missing.
  void EnsureSlot();

  std::vector<PendingChange> Peek(util::Lsn from, std::size_t max) override;
  void                       Advance(util::Lsn to) override;
  std::string                Name() const override {
    return options_.slot_name;
  }

  static Publication LoadPublication(pqxx::transaction_base& tx, const std::string& name);

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
  PgSlotOptions                         options_;
};

} // namespace rowcast::stream
