#pragma once

#include <string>
#include <utility>
#include <vector>

namespace rowcast::stream {

/*
  Publication metadata as far as change capture needs it: which actions
  are published and which tables (or all of them).
*/
struct Publication {
  std::string name;
  bool        all_tables       = false;
  bool        publish_insert   = false;
  bool        publish_update   = false;
  bool        publish_delete   = false;
  bool        publish_truncate = false;

  // (schema, table); empty for all-tables publications
  std::vector<std::pair<std::string, std::string>> tables;

  // false when nothing can reach the decoder
  bool CapturesAnything() const {
    return all_tables || !tables.empty();
  }

  // "insert,update,..." in wal2json's spelling
  std::string Actions() const;

  // "schema.table,..." with wal2json escaping; empty for all-tables
  std::string AddTables() const;

  // Option list for pg_logical_slot_peek_changes (name, value, name, value, ...).
  std::vector<std::string> Wal2JsonOptions() const;
};

// Escapes the characters wal2json treats specially in add-tables.
std::string QuoteWal2JsonName(const std::string& name);

} // namespace rowcast::stream
