#pragma once

#include <array>
#include <chrono>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/calendar/calendar_types.hpp"

namespace fleet::calendar {

/*
  Immutable calendar definition. Built with CalendarConfigBuilder; every
  instance owns its own collections.
*/
class CalendarConfig {
 public:
  const std::string& id() const {
    return id_;
  }
  const std::string& name() const {
    return name_;
  }
  std::chrono::minutes utc_offset() const {
    return utc_offset_;
  }
  // indexed by weekday::c_encoding() (Sunday = 0)
  const std::array<WorkingHours, 7>& working_hours() const {
    return working_hours_;
  }
  const WorkingHours& hours_for(std::chrono::weekday wd) const {
    return working_hours_[wd.c_encoding()];
  }
  const std::vector<Holiday>& holidays() const {
    return holidays_;
  }
  const std::vector<BlackoutPeriod>& blackouts() const {
    return blackouts_;
  }
  const std::set<std::chrono::sys_days>& custom_dates() const {
    return custom_dates_;
  }
  bool allow_weekends() const {
    return allow_weekends_;
  }
  bool allow_outside_hours() const {
    return allow_outside_hours_;
  }

 private:
  friend class CalendarConfigBuilder;
  friend class BusinessCalendar;

  CalendarConfig();

  std::string                     id_;
  std::string                     name_;
  std::chrono::minutes            utc_offset_{0};
  std::array<WorkingHours, 7>     working_hours_;
  std::vector<Holiday>            holidays_;
  std::vector<BlackoutPeriod>     blackouts_;
  std::set<std::chrono::sys_days> custom_dates_;
  bool                            allow_weekends_{false};
  bool                            allow_outside_hours_{false};
};

class CalendarConfigBuilder {
 public:
  CalendarConfigBuilder() = default;

  // Starts from an existing definition, e.g. a preset calendar's.
  explicit CalendarConfigBuilder(CalendarConfig base) : config_(std::move(base)) {
  }

  CalendarConfigBuilder& Id(std::string id);
  CalendarConfigBuilder& Name(std::string name);
  CalendarConfigBuilder& UtcOffset(std::chrono::minutes offset);
  CalendarConfigBuilder& WorkingHoursFor(std::chrono::weekday wd, WorkingHours hours);
  CalendarConfigBuilder& AllDays(WorkingHours hours);
  CalendarConfigBuilder& AddHoliday(Holiday holiday);
  CalendarConfigBuilder& AddHolidays(const std::vector<Holiday>& holidays);
  CalendarConfigBuilder& AddBlackout(BlackoutPeriod blackout);
  CalendarConfigBuilder& AddCustomDate(std::chrono::year_month_day date);
  CalendarConfigBuilder& AllowWeekends(bool allow);
  CalendarConfigBuilder& AllowOutsideHours(bool allow);

  // Throws util::InvalidArgument when a working-hours window is inverted.
  CalendarConfig Build() const;

 private:
  CalendarConfig config_;
};

} // namespace fleet::calendar
