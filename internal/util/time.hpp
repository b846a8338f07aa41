#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace taskvault::util {

/*
  Time utilities: single place to control the clock source.

  Every component that stamps or compares times takes a ClockFn so tests
  can pin "now" without sleeping.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t ToUnixSeconds(TimePoint tp);

// RFC 3339, UTC ("2026-10-19T10:00:00Z", fractional seconds only when present).
std::string FormatTimestamp(TimePoint tp);
// Throws std::invalid_argument on anything that is not RFC 3339.
TimePoint ParseTimestamp(const std::string& text);

// "YYYY-MM-DD" of tp in UTC.
std::string DayStamp(TimePoint tp);
// "YYYYMMDD" of tp in UTC.
std::string CompactDayStamp(TimePoint tp);

} // namespace taskvault::util
