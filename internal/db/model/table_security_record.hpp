#pragma once

#include <optional>
#include <set>
#include <string>

namespace rowcast::db::model {

struct TableSecurityRecord {
  std::string schema_name;
  std::string table;
  std::string role;
  bool        is_rls_enabled = false;

  // nullopt: no grant metadata stored for (table, role)
  std::optional<std::set<std::string>> granted_columns;
};

} // namespace rowcast::db::model
