#include "business_calendar.hpp"

#include <algorithm>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace fleet::calendar {

using namespace std::chrono;

namespace {

bool IsWeekendDay(sys_days day) {
  const weekday wd{day};
  return wd == Saturday || wd == Sunday;
}

} // namespace

BusinessCalendar::BusinessCalendar(CalendarConfig config) : config_(std::move(config)) {
}

BusinessCalendar::BusinessCalendar(const BusinessCalendar& other) : config_(other.config()) {
}

CalendarConfig BusinessCalendar::config() const {
  std::lock_guard lock(mutex_);
  return config_;
}

// ------------------------------------------------------------
// Presets
// ------------------------------------------------------------

std::vector<Holiday> BusinessCalendar::UsFederalHolidays() {
  return {
      Holiday::Fixed("New Year's Day", 1, 1, true),
      Holiday::Floating("Martin Luther King Jr. Day", 1, Monday, 3),
      Holiday::Floating("Presidents' Day", 2, Monday, 3),
      Holiday::Floating("Memorial Day", 5, Monday, -1),
      Holiday::Fixed("Independence Day", 7, 4, true),
      Holiday::Floating("Labor Day", 9, Monday, 1),
      Holiday::Floating("Columbus Day", 10, Monday, 2),
      Holiday::Fixed("Veterans Day", 11, 11, true),
      Holiday::Floating("Thanksgiving Day", 11, Thursday, 4),
      Holiday::Fixed("Christmas Day", 12, 25, true),
  };
}

std::vector<Holiday> BusinessCalendar::UkBankHolidays() {
  return {
      Holiday::Fixed("New Year's Day", 1, 1, true),
      Holiday::Floating("Early May Bank Holiday", 5, Monday, 1),
      Holiday::Floating("Spring Bank Holiday", 5, Monday, -1),
      Holiday::Floating("Summer Bank Holiday", 8, Monday, -1),
      Holiday::Fixed("Christmas Day", 12, 25, true),
      Holiday::Fixed("Boxing Day", 12, 26, true),
  };
}

BusinessCalendar BusinessCalendar::CreateUsCalendar(minutes utc_offset) {
  return BusinessCalendar(CalendarConfigBuilder().Id("us").Name("US business calendar").UtcOffset(utc_offset).AddHolidays(UsFederalHolidays()).Build());
}

BusinessCalendar BusinessCalendar::CreateUkCalendar(minutes utc_offset) {
  return BusinessCalendar(CalendarConfigBuilder().Id("uk").Name("UK business calendar").UtcOffset(utc_offset).AddHolidays(UkBankHolidays()).Build());
}

BusinessCalendar BusinessCalendar::Create24x7Calendar(minutes utc_offset) {
  WorkingHours all_day;
  all_day.start = minutes{0};
  all_day.end   = minutes{23 * 60 + 59};
  return BusinessCalendar(CalendarConfigBuilder()
                              .Id("24x7")
                              .Name("24/7 calendar")
                              .UtcOffset(utc_offset)
                              .AllDays(all_day)
                              .AllowWeekends(true)
                              .AllowOutsideHours(true)
                              .Build());
}

// ------------------------------------------------------------
// Mutation
// ------------------------------------------------------------

void BusinessCalendar::AddHoliday(Holiday holiday) {
  std::lock_guard lock(mutex_);
  config_.holidays_.push_back(std::move(holiday));
  holiday_cache_.clear();
}

bool BusinessCalendar::RemoveHoliday(const std::string& name) {
  std::lock_guard lock(mutex_);
  auto&           holidays = config_.holidays_;
  const auto      before   = holidays.size();
  holidays.erase(std::remove_if(holidays.begin(), holidays.end(), [&](const Holiday& h) { return h.name == name; }), holidays.end());
  if (holidays.size() == before) return false;
  holiday_cache_.clear();
  return true;
}

void BusinessCalendar::AddBlackout(BlackoutPeriod blackout) {
  std::lock_guard lock(mutex_);
  config_.blackouts_.push_back(std::move(blackout));
}

bool BusinessCalendar::RemoveBlackout(const std::string& name) {
  std::lock_guard lock(mutex_);
  auto&           blackouts = config_.blackouts_;
  const auto      before    = blackouts.size();
  blackouts.erase(std::remove_if(blackouts.begin(), blackouts.end(), [&](const BlackoutPeriod& b) { return b.name == name; }),
                  blackouts.end());
  return blackouts.size() != before;
}

void BusinessCalendar::AddCustomDate(year_month_day date) {
  std::lock_guard lock(mutex_);
  config_.custom_dates_.insert(sys_days{date});
}

bool BusinessCalendar::RemoveCustomDate(year_month_day date) {
  std::lock_guard lock(mutex_);
  return config_.custom_dates_.erase(sys_days{date}) > 0;
}

void BusinessCalendar::SetWorkingHours(weekday wd, WorkingHours hours) {
  std::lock_guard lock(mutex_);
  config_.working_hours_[wd.c_encoding()] = hours;
}

// ------------------------------------------------------------
// Day classification
// ------------------------------------------------------------

const std::set<sys_days>& BusinessCalendar::HolidayDatesLocked(int y) const {
  auto it = holiday_cache_.find(y);
  if (it != holiday_cache_.end()) return it->second;

  std::set<sys_days> dates;
  for (const auto& holiday : config_.holidays_) {
    if (auto date = holiday.DateFor(y)) dates.insert(sys_days{*date});
  }
  return holiday_cache_.emplace(y, std::move(dates)).first->second;
}

bool BusinessCalendar::IsHolidayLocked(sys_days day) const {
  // observance can push a holiday across new year, so look at the neighbours too
  const int y = static_cast<int>(year_month_day{day}.year());
  for (int candidate : {y, y + 1, y - 1}) {
    if (HolidayDatesLocked(candidate).count(day) > 0) return true;
  }
  return false;
}

bool BusinessCalendar::IsWorkingDayLocked(sys_days day) const {
  if (IsHolidayLocked(day)) return false;
  if (config_.custom_dates_.count(day) > 0) return false;
  if (IsWeekendDay(day) && !config_.allow_weekends_) return false;
  return config_.hours_for(weekday{day}).enabled;
}

std::vector<std::pair<year_month_day, std::string>> BusinessCalendar::GetHolidaysForYear(int y) const {
  std::lock_guard lock(mutex_);

  std::vector<std::pair<year_month_day, std::string>> out;
  for (const auto& holiday : config_.holidays_) {
    if (auto date = holiday.DateFor(y)) out.emplace_back(*date, holiday.name);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return sys_days{a.first} < sys_days{b.first}; });
  return out;
}

bool BusinessCalendar::IsHoliday(year_month_day date) const {
  std::lock_guard lock(mutex_);
  return IsHolidayLocked(sys_days{date});
}

bool BusinessCalendar::IsCustomNonWorking(year_month_day date) const {
  std::lock_guard lock(mutex_);
  return config_.custom_dates_.count(sys_days{date}) > 0;
}

bool BusinessCalendar::IsWeekend(year_month_day date) const {
  return IsWeekendDay(sys_days{date});
}

bool BusinessCalendar::IsWorkingDay(year_month_day date) const {
  std::lock_guard lock(mutex_);
  return IsWorkingDayLocked(sys_days{date});
}

bool BusinessCalendar::IsWithinWorkingHours(util::TimePoint t) const {
  std::lock_guard lock(mutex_);

  const auto local = util::ToCivil(t, config_.utc_offset_);
  if (!IsWorkingDayLocked(local.date)) return false;
  if (config_.allow_outside_hours_) return true;
  return config_.hours_for(local.weekday()).Contains(local.time_of_day);
}

year_month_day BusinessCalendar::LocalDate(util::TimePoint t) const {
  std::lock_guard lock(mutex_);
  return util::ToCivil(t, config_.utc_offset_).ymd();
}

// ------------------------------------------------------------
// Verdicts
// ------------------------------------------------------------

const BlackoutPeriod* BusinessCalendar::ActiveBlackoutLocked(util::TimePoint t, const std::optional<std::string>& workflow_id) const {
  for (const auto& blackout : config_.blackouts_) {
    if (blackout.IsActive(t, workflow_id, config_.utc_offset_)) return &blackout;
  }
  return nullptr;
}

std::optional<std::string> BusinessCalendar::IsInBlackout(util::TimePoint t, const std::optional<std::string>& workflow_id) const {
  std::lock_guard lock(mutex_);
  const auto*     blackout = ActiveBlackoutLocked(t, workflow_id);
  if (!blackout) return std::nullopt;
  return blackout->reason.empty() ? blackout->name : blackout->reason;
}

ExecutionVerdict BusinessCalendar::CanExecuteLocked(util::TimePoint t, const std::optional<std::string>& workflow_id, bool ignore_hours,
                                                    bool ignore_blackouts) const {
  if (!ignore_blackouts) {
    if (const auto* blackout = ActiveBlackoutLocked(t, workflow_id)) {
      return {false, "Blackout: " + (blackout->reason.empty() ? blackout->name : blackout->reason)};
    }
  }

  const auto local = util::ToCivil(t, config_.utc_offset_);

  if (IsHolidayLocked(local.date)) return {false, "Holiday: " + util::FormatDate(local.ymd())};
  if (config_.custom_dates_.count(local.date) > 0) return {false, "Non-working date: " + util::FormatDate(local.ymd())};
  if (IsWeekendDay(local.date) && !config_.allow_weekends_) return {false, "Weekend execution not allowed"};

  if (!ignore_hours && !config_.allow_outside_hours_) {
    if (!config_.hours_for(local.weekday()).Contains(local.time_of_day)) return {false, "Outside working hours"};
  }

  return {true, std::nullopt};
}

ExecutionVerdict BusinessCalendar::CanExecute(util::TimePoint t, const std::optional<std::string>& workflow_id, bool ignore_hours,
                                              bool ignore_blackouts) const {
  std::lock_guard lock(mutex_);
  return CanExecuteLocked(t, workflow_id, ignore_hours, ignore_blackouts);
}

std::optional<util::TimePoint> BusinessCalendar::GetNextWorkingTime(std::optional<util::TimePoint> from,
                                                                    const std::optional<std::string>& workflow_id, int max_days_ahead) const {
  std::lock_guard lock(mutex_);

  const auto offset     = config_.utc_offset_;
  auto       current    = from.value_or(util::Now());
  const auto end_search = current + days{max_days_ahead};

  while (current < end_search) {
    if (CanExecuteLocked(current, workflow_id, false, false)) return current;

    const auto  local = util::ToCivil(current, offset);
    const auto& hours = config_.hours_for(local.weekday());

    if (hours.enabled) {
      // before today's opening: try the opening time
      if (local.time_of_day < hours.start) {
        const auto opening = util::FromCivil(local.date, hours.start, offset);
        if (CanExecuteLocked(opening, workflow_id, false, false)) return opening;
      }

      // inside a blackout that lifts later today
      if (const auto* blackout = ActiveBlackoutLocked(current, workflow_id); blackout && !blackout->recurring) {
        const auto after = blackout->end + seconds{1};
        if (util::ToCivil(after, offset).date == local.date && after > current) {
          if (CanExecuteLocked(after, workflow_id, false, false)) return after;
        }
      }
    }

    const sys_days tomorrow    = local.date + days{1};
    const auto&    next_hours  = config_.hours_for(weekday{tomorrow});
    const auto     next_offset = next_hours.enabled ? duration_cast<seconds>(next_hours.start) : seconds{0};
    current                    = util::FromCivil(tomorrow, next_offset, offset);
  }

  return std::nullopt;
}

util::TimePoint BusinessCalendar::AdjustToWorkingTime(util::TimePoint t, const std::optional<std::string>& workflow_id) const {
  if (CanExecute(t, workflow_id)) return t;
  return GetNextWorkingTime(t, workflow_id).value_or(t);
}

int BusinessCalendar::CountWorkingDays(year_month_day start, year_month_day end) const {
  std::lock_guard lock(mutex_);

  sys_days first{start};
  sys_days last{end};
  if (first > last) std::swap(first, last);

  int count = 0;
  for (auto day = first; day <= last; day += days{1}) {
    if (IsWorkingDayLocked(day)) ++count;
  }
  return count;
}

year_month_day BusinessCalendar::AddWorkingDays(year_month_day start, int n) const {
  std::lock_guard lock(mutex_);

  sys_days   current{start};
  const auto step      = days{n >= 0 ? 1 : -1};
  int        remaining = std::abs(n);
  int        scanned   = 0;
  while (remaining > 0) {
    current += step;
    if (IsWorkingDayLocked(current)) {
      --remaining;
      scanned = 0;
    } else if (++scanned > 366) {
      throw util::InvalidState("calendar '" + config_.id_ + "' has no working days");
    }
  }
  return year_month_day{current};
}

int BusinessCalendar::GetWorkingHoursRemaining(util::TimePoint t) const {
  std::lock_guard lock(mutex_);

  const auto local = util::ToCivil(t, config_.utc_offset_);
  if (!IsWorkingDayLocked(local.date)) return 0;
  return config_.hours_for(local.weekday()).MinutesRemaining(local.time_of_day);
}

} // namespace fleet::calendar
