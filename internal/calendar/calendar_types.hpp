#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace fleet::calendar {

enum class HolidayType : std::uint8_t {
  kFixed    = 0,
  kFloating = 1,
  kCustom   = 2,
};

std::string_view           ToString(HolidayType type);
std::optional<HolidayType> ParseHolidayType(std::string_view value);

// "mon".."sun" or full names, case-insensitive.
std::optional<std::chrono::weekday> ParseWeekday(std::string_view value);

/*
  A holiday rule. Dates are computed per year, never stored:
    FIXED / CUSTOM  month + day
    FLOATING        nth weekday of month; negative occurrence counts from
                    the end (-1 = last)
  With observance, Saturday moves to Friday and Sunday to Monday.
*/
struct Holiday {
  std::string                         name;
  HolidayType                         type{HolidayType::kFixed};
  unsigned                            month{1};
  std::optional<unsigned>             day;
  std::optional<std::chrono::weekday> weekday;
  std::optional<int>                  occurrence;
  // restricts the rule to a single year
  std::optional<int>                  year;
  bool                                observance{false};

  std::optional<std::chrono::year_month_day> DateFor(int year) const;

  static Holiday Fixed(std::string name, unsigned month, unsigned day, bool observance = false);
  static Holiday Floating(std::string name, unsigned month, std::chrono::weekday weekday, int occurrence);
};

struct WorkingHours {
  std::chrono::minutes start{9 * 60};
  std::chrono::minutes end{17 * 60};
  bool                 enabled{true};

  // inclusive on both ends
  bool Contains(std::chrono::seconds time_of_day) const {
    return enabled && time_of_day >= start && time_of_day <= end;
  }

  int MinutesRemaining(std::chrono::seconds time_of_day) const;
};

struct BlackoutPeriod {
  std::string              name;
  util::TimePoint          start{};
  util::TimePoint          end{};
  std::string              reason;
  // compares month/day/time only, wrapping over new year
  bool                     recurring{false};
  // empty: applies to every workflow
  std::vector<std::string> affects_workflows;

  bool IsActive(util::TimePoint t, const std::optional<std::string>& workflow_id, std::chrono::minutes utc_offset) const;
};

} // namespace fleet::calendar
