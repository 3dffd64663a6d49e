#include "calendar_config.hpp"

#include "internal/util/errors.hpp"

namespace fleet::calendar {

CalendarConfig::CalendarConfig() {
  // Monday..Friday 09:00-17:00, weekends off
  working_hours_[std::chrono::Saturday.c_encoding()].enabled = false;
  working_hours_[std::chrono::Sunday.c_encoding()].enabled   = false;
}

CalendarConfigBuilder& CalendarConfigBuilder::Id(std::string id) {
  config_.id_ = std::move(id);
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::Name(std::string name) {
  config_.name_ = std::move(name);
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::UtcOffset(std::chrono::minutes offset) {
  config_.utc_offset_ = offset;
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::WorkingHoursFor(std::chrono::weekday wd, WorkingHours hours) {
  config_.working_hours_[wd.c_encoding()] = hours;
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::AllDays(WorkingHours hours) {
  config_.working_hours_.fill(hours);
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::AddHoliday(Holiday holiday) {
  config_.holidays_.push_back(std::move(holiday));
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::AddHolidays(const std::vector<Holiday>& holidays) {
  config_.holidays_.insert(config_.holidays_.end(), holidays.begin(), holidays.end());
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::AddBlackout(BlackoutPeriod blackout) {
  config_.blackouts_.push_back(std::move(blackout));
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::AddCustomDate(std::chrono::year_month_day date) {
  config_.custom_dates_.insert(std::chrono::sys_days{date});
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::AllowWeekends(bool allow) {
  config_.allow_weekends_ = allow;
  return *this;
}

CalendarConfigBuilder& CalendarConfigBuilder::AllowOutsideHours(bool allow) {
  config_.allow_outside_hours_ = allow;
  return *this;
}

CalendarConfig CalendarConfigBuilder::Build() const {
  for (const auto& hours : config_.working_hours_) {
    if (hours.enabled && hours.end < hours.start) {
      throw util::InvalidArgument("working hours end before they start in calendar '" + config_.id_ + "'");
    }
  }
  for (const auto& blackout : config_.blackouts_) {
    if (!blackout.recurring && blackout.end < blackout.start) {
      throw util::InvalidArgument("blackout '" + blackout.name + "' ends before it starts");
    }
  }
  return config_;
}

} // namespace fleet::calendar
