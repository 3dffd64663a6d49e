#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace fleet::util {

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

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

CivilTime ToCivil(TimePoint tp, std::chrono::minutes utc_offset) {
  const auto local = std::chrono::floor<Seconds>(tp) + utc_offset;
  const auto date  = std::chrono::floor<std::chrono::days>(local);
  return CivilTime{std::chrono::sys_days{date}, local - date};
}

TimePoint FromCivil(std::chrono::sys_days date, Seconds time_of_day, std::chrono::minutes utc_offset) {
  return TimePoint{std::chrono::time_point_cast<Clock::duration>(date + time_of_day - utc_offset)};
}

std::string FormatDate(const std::chrono::year_month_day& ymd) {
  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.day());
  return out.str();
}

std::string FormatTimestamp(TimePoint tp, std::chrono::minutes utc_offset) {
  const auto civil = ToCivil(tp, utc_offset);
  const auto secs  = civil.time_of_day.count();

  std::ostringstream out;
  out << FormatDate(civil.ymd()) << 'T' << std::setfill('0') << std::setw(2) << secs / 3600 << ':' << std::setw(2) << (secs / 60) % 60
      << ':' << std::setw(2) << secs % 60;

  if (utc_offset.count() == 0) {
    out << 'Z';
  } else {
    const auto total = std::abs(utc_offset.count());
    out << (utc_offset.count() < 0 ? '-' : '+') << std::setw(2) << total / 60 << ':' << std::setw(2) << total % 60;
  }
  return out.str();
}

std::optional<TimePoint> ParseTimestamp(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(text, &ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

} // namespace fleet::util
