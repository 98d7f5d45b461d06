#pragma once

#include <cstdint>
#include <string>

namespace rowcast::db::model {

struct CursorPositionRecord {
  std::string slot_name;
  uint64_t    position      = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace rowcast::db::model
