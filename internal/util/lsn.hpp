#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rowcast::util {

/*
  Stream position. For PostgreSQL sources this is the WAL log sequence
  number; other sources use any monotonically increasing counter.

  Text form follows pg_lsn: upper 32 bits / lower 32 bits in hex.
*/
using Lsn = uint64_t;

std::string        FormatLsn(Lsn lsn);
std::optional<Lsn> ParseLsn(const std::string& text);

} // namespace rowcast::util
