#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace fleet::util {

/*
  Time utilities. Single place to control the clock source.

  Calendars and cron schedules work in "local" civil time, which is
  UTC shifted by a fixed offset in minutes.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Seconds   = std::chrono::seconds;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

uint64_t ToUnixMillis(TimePoint tp);

struct CivilTime {
  std::chrono::sys_days date;
  Seconds               time_of_day{0};

  std::chrono::year_month_day ymd() const {
    return std::chrono::year_month_day{date};
  }

  std::chrono::weekday weekday() const {
    return std::chrono::weekday{date};
  }

  int MinuteOfDay() const {
    return static_cast<int>(time_of_day.count() / 60);
  }
};

CivilTime ToCivil(TimePoint tp, std::chrono::minutes utc_offset);
TimePoint FromCivil(std::chrono::sys_days date, Seconds time_of_day, std::chrono::minutes utc_offset);

// YYYY-MM-DD
std::string FormatDate(const std::chrono::year_month_day& ymd);

// RFC 3339 with the given offset, second precision.
std::string FormatTimestamp(TimePoint tp, std::chrono::minutes utc_offset = std::chrono::minutes{0});

// RFC 3339 ("2024-07-04T10:00:00Z", "2024-07-04T10:00:00-05:00").
std::optional<TimePoint> ParseTimestamp(const std::string& text);

} // namespace fleet::util
