#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace stagesync::util {

TimePoint Now() {
  return WallClock::now();
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
  return TimePoint{} + std::chrono::duration_cast<WallClock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

Millis ToMillis(const google::protobuf::Duration& d, Millis fallback) {
  const auto ms = google::protobuf::util::TimeUtil::DurationToMilliseconds(d);
  if (ms <= 0) {
    return fallback;
  }
  return Millis(ms);
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<WallClock::duration>(std::chrono::milliseconds(ms));
}

std::string FormatIso8601(TimePoint tp) {
  auto ts = ToProto(std::chrono::time_point_cast<std::chrono::milliseconds>(tp));
  return google::protobuf::util::TimeUtil::ToString(ts);
}

} // namespace stagesync::util
