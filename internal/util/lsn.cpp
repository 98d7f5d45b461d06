#include "lsn.hpp"

#include <cstdio>

namespace rowcast::util {

namespace {

std::optional<uint32_t> ParseHex32(const std::string& text) {
  if (text.empty() || text.size() > 8) {
    return std::nullopt;
  }
  uint32_t value = 0;
  for (char c : text) {
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint32_t>(10 + c - 'a');
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint32_t>(10 + c - 'A');
    } else {
      return std::nullopt;
    }
  }
  return value;
}

} // namespace

std::string FormatLsn(Lsn lsn) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%X/%X", static_cast<uint32_t>(lsn >> 32), static_cast<uint32_t>(lsn & 0xFFFFFFFFu));
  return buf;
}

std::optional<Lsn> ParseLsn(const std::string& text) {
  const auto slash = text.find('/');
  if (slash == std::string::npos) {
    return std::nullopt;
  }
  auto hi = ParseHex32(text.substr(0, slash));
  auto lo = ParseHex32(text.substr(slash + 1));
  if (!hi || !lo) {
    return std::nullopt;
  }
  return (static_cast<Lsn>(*hi) << 32) | *lo;
}

} // namespace rowcast::util
