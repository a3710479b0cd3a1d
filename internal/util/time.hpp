#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace stagesync::util {

/*
  Time utilities.

  Components that reason about expiry or retry deadlines take a Clock so tests
  can drive time explicitly.
*/

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;
using Millis    = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override {
    return WallClock::now();
  }
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = WallClock::now()) : now_(start) {
  }

  TimePoint Now() const override {
    std::lock_guard lock(mutex_);
    return now_;
  }

  void Advance(WallClock::duration by) {
    std::lock_guard lock(mutex_);
    now_ += by;
  }

  void Set(TimePoint tp) {
    std::lock_guard lock(mutex_);
    now_ = tp;
  }

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// Zero or unset durations fall back to the supplied default.
Millis ToMillis(const google::protobuf::Duration& d, Millis fallback);

uint64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// RFC 3339 UTC text, millisecond precision.
std::string FormatIso8601(TimePoint tp);

} // namespace stagesync::util
