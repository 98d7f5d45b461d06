#include "pg_slot_source.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rowcast::stream {

namespace {

// peek_changes stops at the first transaction boundary after
// upto_nchanges; entries at or before `from` are re-read until the slot
// moves, so the window grows until enough new entries are seen.
constexpr std::size_t kMaxPeekWindow = 1 << 20;

} // namespace

PgSlotSource::PgSlotSource(std::shared_ptr<db::postgres::PgPool> pool, PgSlotOptions options)
    : pool_(std::move(pool)), options_(std::move(options)) {
}

Publication PgSlotSource::LoadPublication(pqxx::transaction_base& tx, const std::string& name) {
  Publication publication;
  publication.name = name;

  auto pub = tx.exec_params(
      "SELECT bool_or(puballtables), bool_or(pubinsert), bool_or(pubupdate), bool_or(pubdelete), bool_or(pubtruncate) "
      "FROM pg_catalog.pg_publication WHERE pubname = $1 HAVING count(*) > 0;",
      name);
  if (pub.empty()) {
    return publication;
  }

  publication.all_tables       = pub[0][0].as<bool>();
  publication.publish_insert   = pub[0][1].as<bool>();
  publication.publish_update   = pub[0][2].as<bool>();
  publication.publish_delete   = pub[0][3].as<bool>();
  publication.publish_truncate = pub[0][4].as<bool>();
  if (publication.all_tables) {
    return publication;
  }

  auto tables = tx.exec_params("SELECT schemaname::text, tablename::text FROM pg_catalog.pg_publication_tables WHERE pubname = $1 ORDER BY 1, 2;", name);
  for (const auto& row : tables) {
    publication.tables.emplace_back(row[0].c_str(), row[1].c_str());
  }
  return publication;
}

void PgSlotSource::EnsureSlot() {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       existing = tx.exec_params("SELECT plugin FROM pg_catalog.pg_replication_slots WHERE slot_name = $1;", options_.slot_name);
    if (!existing.empty()) {
      if (std::string(existing[0][0].c_str()) != "wal2json") {
        throw util::InvalidState("replication slot '" + options_.slot_name + "' uses plugin " + existing[0][0].c_str() + ", expected wal2json");
      }
      return;
    }
    if (!options_.create_slot) {
      throw util::NotFound("replication slot '" + options_.slot_name + "' does not exist");
    }
    tx.exec_params("SELECT pg_create_logical_replication_slot($1, 'wal2json');", options_.slot_name);
    tx.commit();
    ROWCAST_LOG_INFO("created replication slot", {observability::StringField("slot", options_.slot_name)});
  } catch (const pqxx::broken_connection& e) {
    throw util::Unavailable(std::string("replication slot setup: ") + e.what());
  }
}

std::vector<PendingChange> PgSlotSource::Peek(util::Lsn from, std::size_t max) {
  std::vector<PendingChange> out;
  if (max == 0) {
    return out;
  }

  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);

    const auto publication = LoadPublication(tx, options_.publication);
    if (!publication.CapturesAnything()) {
      ROWCAST_LOG_DEBUG("publication captures no tables", {observability::StringField("publication", options_.publication)});
      return out;
    }
    const auto options = publication.Wal2JsonOptions();

    for (std::size_t window = max;; window = std::min(window * 2, kMaxPeekWindow)) {
      out.clear();
      auto rows = tx.exec_params(
          "SELECT lsn::text, data FROM pg_logical_slot_peek_changes($1, NULL, $2, VARIADIC $3::text[]);", options_.slot_name,
          static_cast<int>(window), options);

      for (const auto& row : rows) {
        auto position = util::ParseLsn(row[0].c_str());
        if (!position) {
          throw util::InvalidState(std::string("slot returned unparsable lsn ") + row[0].c_str());
        }
        if (*position <= from) continue;
        if (out.size() >= max) break;
        out.push_back({*position, row[1].c_str()});
      }

      // exhausted the slot, or found enough past `from`
      if (rows.size() < window || out.size() >= max || window == kMaxPeekWindow) break;
    }
    tx.commit();
  } catch (const pqxx::broken_connection& e) {
    throw util::Unavailable(std::string("slot peek: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    throw util::Unavailable("slot peek on '" + options_.slot_name + "' failed: " + e.what());
  }
  return out;
}

void PgSlotSource::Advance(util::Lsn to) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_params("SELECT pg_replication_slot_advance($1, $2::pg_lsn);", options_.slot_name, util::FormatLsn(to));
    tx.commit();
  } catch (const pqxx::broken_connection& e) {
    throw util::Unavailable(std::string("slot advance: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    throw util::Unavailable("advancing slot '" + options_.slot_name + "' to " + util::FormatLsn(to) + " failed: " + e.what());
  }
}

} // namespace rowcast::stream
