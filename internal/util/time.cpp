#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <ctime>
#include <stdexcept>

namespace taskvault::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::floor<std::chrono::seconds>(tp).time_since_epoch().count();
}

std::string FormatTimestamp(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(tp));
}

TimePoint ParseTimestamp(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(text, &ts)) {
    throw std::invalid_argument("invalid RFC 3339 timestamp: '" + text + "'");
  }
  return FromProto(ts);
}

namespace {

std::tm UtcCalendar(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(std::chrono::floor<std::chrono::seconds>(tp));
  std::tm           out{};
  gmtime_r(&seconds, &out);
  return out;
}

} // namespace

std::string DayStamp(TimePoint tp) {
  const auto cal = UtcCalendar(tp);
  char       buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &cal);
  return buf;
}

std::string CompactDayStamp(TimePoint tp) {
  const auto cal = UtcCalendar(tp);
  char       buf[16];
  std::strftime(buf, sizeof(buf), "%Y%m%d", &cal);
  return buf;
}

} // namespace taskvault::util
