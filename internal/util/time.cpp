#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace rowcast::util {

namespace {

// "+00" -> "+00:00", "+0530" -> "+05:30"; RFC 3339 offsets pass through.
std::string NormalizeOffset(const std::string& text, std::size_t sign_pos) {
  std::string offset = text.substr(sign_pos + 1);
  if (offset.size() == 2) {
    offset += ":00";
  } else if (offset.size() == 4 && offset.find(':') == std::string::npos) {
    offset.insert(2, ":");
  }
  return text.substr(0, sign_pos + 1) + offset;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::optional<TimePoint> ParseTimestamp(const std::string& text) {
  // shortest accepted form: "YYYY-MM-DD HH:MM:SS"
  if (text.size() < 19) {
    return std::nullopt;
  }

  std::string normalized = text;
  if (normalized[10] == ' ') {
    normalized[10] = 'T';
  }

  const auto last = normalized.back();
  if (last != 'Z' && last != 'z') {
    const auto sign_pos = normalized.find_last_of("+-");
    if (sign_pos == std::string::npos || sign_pos < 19) {
      // no zone: PostgreSQL "timestamp without time zone" is read as UTC
      normalized += "Z";
    } else {
      normalized = NormalizeOffset(normalized, sign_pos);
    }
  } else {
    normalized.back() = 'Z';
  }

  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(normalized, &ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

std::string FormatTimestamp(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(tp));
}

} // namespace rowcast::util
