#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace resonance::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339, UTC, e.g. 2025-01-31T12:00:00Z
std::string ToIso8601(TimePoint tp);

// Accepts full RFC 3339 timestamps and bare dates (YYYY-MM-DD).
std::optional<TimePoint> ParseIso8601(const std::string& value);

double DaysBetween(TimePoint earlier, TimePoint later);

} // namespace resonance::util
