#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace resonance::util {

using google::protobuf::util::TimeUtil;

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
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) +
                                                                    std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIso8601(TimePoint tp) {
  return TimeUtil::ToString(ToProto(tp));
}

std::optional<TimePoint> ParseIso8601(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }

  google::protobuf::Timestamp ts;
  if (TimeUtil::FromString(value, &ts)) {
    return FromProto(ts);
  }

  // bare calendar date
  if (value.size() == 10 && TimeUtil::FromString(value + "T00:00:00Z", &ts)) {
    return FromProto(ts);
  }

  return std::nullopt;
}

double DaysBetween(TimePoint earlier, TimePoint later) {
  constexpr double kSecondsPerDay = 86400.0;
  const auto       elapsed        = std::chrono::duration<double>(later - earlier).count();
  return elapsed / kSecondsPerDay;
}

} // namespace resonance::util
