#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace rowcast::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Accepts RFC 3339 and the PostgreSQL text form ("2021-12-01 10:00:00.123+00").
std::optional<TimePoint> ParseTimestamp(const std::string& text);

// RFC 3339, UTC, "Z" suffix.
std::string FormatTimestamp(TimePoint tp);

} // namespace rowcast::util
