#include "calendar_types.hpp"

#include <algorithm>
#include <cctype>

namespace fleet::calendar {

using namespace std::chrono;

namespace {

std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

year_month_day ApplyObservance(const year_month_day& date) {
  const sys_days day{date};
  const weekday  wd{day};
  if (wd == Saturday) return year_month_day{day - days{1}};
  if (wd == Sunday) return year_month_day{day + days{1}};
  return date;
}

// Same month/day in another year; Feb 29 falls back to Feb 28.
sys_seconds WithYear(const util::CivilTime& civil, int y) {
  const auto     ymd = civil.ymd();
  year_month_day moved{year{y}, ymd.month(), ymd.day()};
  if (!moved.ok()) moved = year_month_day{year_month_day_last{year{y}, month_day_last{ymd.month()}}};
  return sys_days{moved} + civil.time_of_day;
}

} // namespace

std::string_view ToString(HolidayType type) {
  switch (type) {
    case HolidayType::kFloating:
      return "floating";
    case HolidayType::kCustom:
      return "custom";
    case HolidayType::kFixed:
    default:
      return "fixed";
  }
}

std::optional<HolidayType> ParseHolidayType(std::string_view value) {
  const auto lower = ToLower(value);
  if (lower == "fixed") return HolidayType::kFixed;
  if (lower == "floating") return HolidayType::kFloating;
  if (lower == "custom") return HolidayType::kCustom;
  return std::nullopt;
}

std::optional<weekday> ParseWeekday(std::string_view value) {
  static constexpr std::string_view kNames[] = {"sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"};

  const auto lower = ToLower(value);
  if (lower.size() < 3) return std::nullopt;
  for (unsigned i = 0; i < 7; ++i) {
    if (kNames[i] == lower || kNames[i].substr(0, 3) == lower) return weekday{i};
  }
  return std::nullopt;
}

std::optional<year_month_day> Holiday::DateFor(int y) const {
  if (this->year && *this->year != y) return std::nullopt;

  const auto ym = std::chrono::year{y} / std::chrono::month{this->month};

  year_month_day date;
  if (type == HolidayType::kFloating) {
    if (!this->weekday || !occurrence || *occurrence == 0) return std::nullopt;

    if (*occurrence > 0) {
      const auto nth = ym / std::chrono::weekday_indexed{*this->weekday, static_cast<unsigned>(*occurrence)};
      // a 5th weekday does not exist in every month
      if (!nth.ok()) return std::nullopt;
      date = year_month_day{sys_days{nth}};
    } else {
      const sys_days last{ym / std::chrono::weekday_last{*this->weekday}};
      date = year_month_day{last - weeks{-*occurrence - 1}};
      if (date.month() != ym.month()) return std::nullopt;
    }
  } else {
    if (!this->day) return std::nullopt;
    date = ym / std::chrono::day{*this->day};
    if (!date.ok()) return std::nullopt;
  }

  return observance ? ApplyObservance(date) : date;
}

Holiday Holiday::Fixed(std::string name, unsigned month, unsigned day, bool observance) {
  Holiday h;
  h.name       = std::move(name);
  h.type       = HolidayType::kFixed;
  h.month      = month;
  h.day        = day;
  h.observance = observance;
  return h;
}

Holiday Holiday::Floating(std::string name, unsigned month, std::chrono::weekday wd, int occurrence) {
  Holiday h;
  h.name       = std::move(name);
  h.type       = HolidayType::kFloating;
  h.month      = month;
  h.weekday    = wd;
  h.occurrence = occurrence;
  return h;
}

int WorkingHours::MinutesRemaining(seconds time_of_day) const {
  if (!enabled || time_of_day >= end) return 0;
  const auto from = std::max(duration_cast<minutes>(time_of_day), start);
  return static_cast<int>(std::max<minutes::rep>(0, (end - from).count()));
}

bool BlackoutPeriod::IsActive(util::TimePoint t, const std::optional<std::string>& workflow_id, minutes utc_offset) const {
  if (!affects_workflows.empty() && workflow_id) {
    if (std::find(affects_workflows.begin(), affects_workflows.end(), *workflow_id) == affects_workflows.end()) return false;
  }

  if (!recurring) return start <= t && t <= end;

  const auto check     = util::ToCivil(t, utc_offset);
  const int  check_y   = static_cast<int>(check.ymd().year());
  const auto local     = check.date + check.time_of_day;
  const auto start_adj = WithYear(util::ToCivil(start, utc_offset), check_y);
  const auto end_adj   = WithYear(util::ToCivil(end, utc_offset), check_y);

  if (start_adj > end_adj) return local >= start_adj || local <= end_adj;
  return start_adj <= local && local <= end_adj;
}

} // namespace fleet::calendar
