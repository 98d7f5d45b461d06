#pragma once

#include <cstdint>
#include <string>

namespace rowcast::db::model {

/*
  Stored subscription row.

  filters_json is the stored filter list as JSON text:
    [{"column":"body","op":"eq","value":"bbb"}, ...]
  It is parsed by the registry, not by the repository.
*/
struct SubscriptionRecord {
  int64_t     id = 0;
  std::string user_id;
  std::string entity; // schema.table
  std::string filters_json = "[]";
  uint64_t    created_at_ms = 0;
};

} // namespace rowcast::db::model
