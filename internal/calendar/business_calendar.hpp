#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/calendar/calendar_config.hpp"
#include "internal/util/time.hpp"

namespace fleet::calendar {

struct ExecutionVerdict {
  bool                       allowed{true};
  std::optional<std::string> reason;

  explicit operator bool() const {
    return allowed;
  }
};

/*
  BusinessCalendar

  Turns a point in time (+ optional workflow id) into a working /
  non-working verdict. All day and hour arithmetic happens in the
  calendar's local time (UTC + utc_offset).

  Holiday dates are computed per year on demand and cached; any holiday
  mutation clears the cache. Thread-safe.
*/
class BusinessCalendar {
 public:
  static constexpr int kDefaultMaxDaysAhead = 30;

  explicit BusinessCalendar(CalendarConfig config = CalendarConfigBuilder().Build());

  static BusinessCalendar CreateUsCalendar(std::chrono::minutes utc_offset = std::chrono::hours(-5));
  static BusinessCalendar CreateUkCalendar(std::chrono::minutes utc_offset = std::chrono::minutes(0));
  static BusinessCalendar Create24x7Calendar(std::chrono::minutes utc_offset = std::chrono::minutes(0));

  static std::vector<Holiday> UsFederalHolidays();
  static std::vector<Holiday> UkBankHolidays();

  BusinessCalendar(const BusinessCalendar& other);
  BusinessCalendar& operator=(const BusinessCalendar&) = delete;

  CalendarConfig config() const;

  void AddHoliday(Holiday holiday);
  bool RemoveHoliday(const std::string& name);
  void AddBlackout(BlackoutPeriod blackout);
  bool RemoveBlackout(const std::string& name);
  void AddCustomDate(std::chrono::year_month_day date);
  bool RemoveCustomDate(std::chrono::year_month_day date);
  void SetWorkingHours(std::chrono::weekday wd, WorkingHours hours);

  // Sorted by date.
  std::vector<std::pair<std::chrono::year_month_day, std::string>> GetHolidaysForYear(int year) const;

  bool IsHoliday(std::chrono::year_month_day date) const;
  bool IsCustomNonWorking(std::chrono::year_month_day date) const;
  bool IsWeekend(std::chrono::year_month_day date) const;
  bool IsWorkingDay(std::chrono::year_month_day date) const;
  bool IsWithinWorkingHours(util::TimePoint t) const;

  // Reason (or name) of the first active blackout.
  std::optional<std::string> IsInBlackout(util::TimePoint t, const std::optional<std::string>& workflow_id = std::nullopt) const;

  ExecutionVerdict CanExecute(util::TimePoint t, const std::optional<std::string>& workflow_id = std::nullopt, bool ignore_hours = false,
                              bool ignore_blackouts = false) const;

  std::optional<util::TimePoint> GetNextWorkingTime(std::optional<util::TimePoint> from = std::nullopt,
                                                    const std::optional<std::string>& workflow_id = std::nullopt,
                                                    int max_days_ahead = kDefaultMaxDaysAhead) const;

  // t itself when allowed, else the next working time, else t.
  util::TimePoint AdjustToWorkingTime(util::TimePoint t, const std::optional<std::string>& workflow_id = std::nullopt) const;

  // Inclusive; order of the arguments does not matter.
  int CountWorkingDays(std::chrono::year_month_day start, std::chrono::year_month_day end) const;

  std::chrono::year_month_day AddWorkingDays(std::chrono::year_month_day start, int days) const;

  int GetWorkingHoursRemaining(util::TimePoint t) const;

  // Local calendar date of a point in time.
  std::chrono::year_month_day LocalDate(util::TimePoint t) const;

 private:
  const std::set<std::chrono::sys_days>& HolidayDatesLocked(int year) const;
  bool IsHolidayLocked(std::chrono::sys_days day) const;
  bool IsWorkingDayLocked(std::chrono::sys_days day) const;
  const BlackoutPeriod* ActiveBlackoutLocked(util::TimePoint t, const std::optional<std::string>& workflow_id) const;
  ExecutionVerdict CanExecuteLocked(util::TimePoint t, const std::optional<std::string>& workflow_id, bool ignore_hours,
                                    bool ignore_blackouts) const;

  mutable std::mutex                               mutex_;
  CalendarConfig                                   config_;
  mutable std::map<int, std::set<std::chrono::sys_days>> holiday_cache_;
};

} // namespace fleet::calendar
