#pragma once

#include <optional>
#include <set>
#include <string>

namespace rowcast::model {

/*
  Security metadata for one table as seen by one role.

  granted_columns == nullopt means the grant metadata could not be
  found; callers must treat that as "no column granted".
*/
struct TableSecurity {
  std::string                          schema_name;
  std::string                          table;
  std::string                          role;
  bool                                 is_rls_enabled = false;
  std::optional<std::set<std::string>> granted_columns;

  std::string EntityName() const {
    return schema_name + "." + table;
  }
};

} // namespace rowcast::model
