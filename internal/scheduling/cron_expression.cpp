#include "cron_expression.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <sstream>

#include "internal/util/errors.hpp"

namespace fleet::scheduling {

namespace {

enum class Field { kSecond, kMinute, kHour, kDay, kMonth, kWeekday };

struct FieldRange {
  std::string_view name;
  int              min;
  int              max;
};

FieldRange RangeOf(Field field) {
  switch (field) {
    case Field::kSecond:
      return {"second", 0, 59};
    case Field::kMinute:
      return {"minute", 0, 59};
    case Field::kHour:
      return {"hour", 0, 23};
    case Field::kDay:
      return {"day", 1, 31};
    case Field::kMonth:
      return {"month", 1, 12};
    case Field::kWeekday:
      return {"day_of_week", 0, 7};
  }
  return {"unknown", 0, 0};
}

constexpr std::array<std::string_view, 12> kMonthNames{"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                                       "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
constexpr std::array<std::string_view, 7>  kWeekdayNames{"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};
constexpr std::array<std::string_view, 7>  kWeekdayShort{"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr std::array<std::string_view, 12> kMonthShort{"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

const std::vector<CronAlias> kAliases = {
    {"@yearly", "0 0 1 1 *", "Once a year at midnight on January 1st"},
    {"@annually", "0 0 1 1 *", "Once a year at midnight on January 1st"},
    {"@monthly", "0 0 1 * *", "Once a month at midnight on the 1st"},
    {"@weekly", "0 0 * * 0", "Once a week at midnight on Sunday"},
    {"@daily", "0 0 * * *", "Once a day at midnight"},
    {"@midnight", "0 0 * * *", "Once a day at midnight"},
    {"@hourly", "0 * * * *", "Once every hour"},
    {"@every_minute", "* * * * *", "Every minute"},
    {"@every_5_minutes", "*/5 * * * *", "Every 5 minutes"},
    {"@every_10_minutes", "*/10 * * * *", "Every 10 minutes"},
    {"@every_15_minutes", "*/15 * * * *", "Every 15 minutes"},
    {"@every_30_minutes", "*/30 * * * *", "Every 30 minutes"},
    {"@business_hours", "0 9-17 * * 1-5", "Every hour during business hours (9-17) on weekdays"},
    {"@weekdays", "0 9 * * 1-5", "At 9 AM on weekdays"},
    {"@weekends", "0 9 * * 0,6", "At 9 AM on weekends"},
    {"@end_of_month", "0 0 L * *", "At midnight on the last day of the month"},
    {"@first_monday", "0 0 * * 1#1", "At midnight on the first Monday of the month"},
    {"@last_friday", "0 17 * * 5L", "At 5 PM on the last Friday of the month"},
};

[[noreturn]] void Fail(const std::string& reason) {
  throw util::InvalidCronExpression("Invalid cron expression: " + reason);
}

std::string Upper(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string Trim(std::string_view text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) return {};
  const auto end = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(begin, end - begin + 1));
}

std::optional<int> ToInt(std::string_view text) {
  int value = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
  return value;
}

const CronAlias* FindAlias(std::string_view text) {
  std::string key = Lower(Trim(text));
  if (key.empty()) return nullptr;
  if (key.front() != '@') key.insert(key.begin(), '@');
  for (const auto& alias : kAliases) {
    if (alias.name == key) return &alias;
  }
  return nullptr;
}

int ParseValue(std::string_view token, Field field) {
  const auto range = RangeOf(field);
  if (token.empty()) Fail("empty value in " + std::string(range.name) + " field");

  const std::string upper = Upper(token);
  if (field == Field::kMonth) {
    for (size_t i = 0; i < kMonthNames.size(); ++i) {
      if (upper == kMonthNames[i]) return static_cast<int>(i) + 1;
    }
  }
  if (field == Field::kWeekday) {
    for (size_t i = 0; i < kWeekdayNames.size(); ++i) {
      if (upper == kWeekdayNames[i]) return static_cast<int>(i);
    }
  }

  const auto value = ToInt(token);
  if (!value) Fail("invalid value '" + std::string(token) + "' in " + std::string(range.name) + " field");
  if (*value < range.min || *value > range.max) {
    Fail("value " + std::to_string(*value) + " out of range [" + std::to_string(range.min) + ", " + std::to_string(range.max) + "] in " +
         std::string(range.name) + " field");
  }
  return *value;
}

uint64_t ParseItem(std::string_view item, Field field) {
  const auto range = RangeOf(field);

  std::string_view base    = item;
  int              step    = 1;
  bool             stepped = false;
  if (const auto slash = item.find('/'); slash != std::string_view::npos) {
    base            = item.substr(0, slash);
    const auto text = item.substr(slash + 1);
    const auto n    = ToInt(text);
    if (!n || *n <= 0) Fail("invalid step '" + std::string(text) + "' in " + std::string(range.name) + " field");
    step    = *n;
    stepped = true;
  }

  int lo = range.min;
  int hi = range.max;
  if (base == "*" || base == "?") {
    if (field == Field::kWeekday) hi = 6;
  } else if (const auto dash = base.find('-'); dash != std::string_view::npos) {
    lo = ParseValue(base.substr(0, dash), field);
    hi = ParseValue(base.substr(dash + 1), field);
    if (lo > hi) Fail("reversed range '" + std::string(base) + "' in " + std::string(range.name) + " field");
  } else {
    lo = ParseValue(base, field);
    hi = stepped ? range.max : lo;
  }

  uint64_t mask = 0;
  for (int v = lo; v <= hi; v += step) {
    mask |= uint64_t{1} << v;
  }
  return mask;
}

struct ParsedField {
  uint64_t                              mask{0};
  bool                                  any{false};
  bool                                  last_day{false};
  std::vector<std::pair<unsigned, int>> weekday_rules;
};

ParsedField ParseField(std::string_view text, Field field) {
  const auto range = RangeOf(field);
  ParsedField out;
  out.any = (text == "*" || text == "?");

  size_t start = 0;
  while (start <= text.size()) {
    const auto comma = text.find(',', start);
    const auto item  = text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
    if (item.empty()) Fail("empty list item in " + std::string(range.name) + " field");

    const std::string upper = Upper(item);
    if (field == Field::kDay && upper == "L") {
      out.last_day = true;
    } else if (field == Field::kWeekday && upper.size() > 1 && upper.back() == 'L') {
      const int wd = ParseValue(item.substr(0, item.size() - 1), field) % 7;
      out.weekday_rules.emplace_back(static_cast<unsigned>(wd), -1);
    } else if (const auto hash = item.find('#'); field == Field::kWeekday && hash != std::string_view::npos) {
      const int  wd = ParseValue(item.substr(0, hash), field) % 7;
      const auto k  = ToInt(item.substr(hash + 1));
      if (!k || *k < 1 || *k > 5) Fail("occurrence in '" + std::string(item) + "' must be 1-5");
      out.weekday_rules.emplace_back(static_cast<unsigned>(wd), *k);
    } else {
      out.mask |= ParseItem(item, field);
    }

    if (comma == std::string_view::npos) break;
    start = comma + 1;
  }

  if (field == Field::kWeekday && (out.mask & (uint64_t{1} << 7))) {
    out.mask = (out.mask & ~(uint64_t{1} << 7)) | 1;
  }
  return out;
}

std::string OrdinalSuffix(int n) {
  switch (n) {
    case 1:
      return "st";
    case 2:
      return "nd";
    case 3:
      return "rd";
    default:
      return "th";
  }
}

std::string WeekdayLabel(std::string_view text) {
  const auto n = ToInt(text);
  if (n && *n >= 0 && *n <= 7) return std::string(kWeekdayShort[static_cast<size_t>(*n % 7)]);
  return std::string(text);
}

} // namespace

const std::vector<CronAlias>& CronExpression::Aliases() {
  return kAliases;
}

std::optional<std::string> CronExpression::ResolveAlias(std::string_view expression) {
  if (const auto* alias = FindAlias(expression)) return std::string(alias->expression);
  return std::nullopt;
}

CronExpression CronExpression::Parse(std::string_view expression) {
  CronExpression cron;
  cron.expression_ = std::string(expression);

  const std::string trimmed = Trim(expression);
  if (trimmed.empty()) Fail("empty expression");

  std::string text = trimmed;
  if (const auto* alias = FindAlias(trimmed)) {
    text                    = std::string(alias->expression);
    cron.alias_description_ = alias->description;
  } else if (trimmed.front() == '@') {
    Fail("unknown alias '" + trimmed + "'");
  }

  std::vector<std::string> fields;
  std::istringstream       in(text);
  for (std::string field; in >> field;) {
    fields.push_back(field);
  }
  if (fields.size() != 5 && fields.size() != 6) {
    Fail("expected 5 or 6 fields, got " + std::to_string(fields.size()));
  }

  size_t i = 0;
  if (fields.size() == 6) {
    cron.seconds_ = std::bitset<60>(ParseField(fields[0], Field::kSecond).mask);
    i             = 1;
  } else {
    cron.seconds_.set(0);
  }

  cron.raw_minute_  = fields[i];
  cron.raw_hour_    = fields[i + 1];
  cron.raw_day_     = fields[i + 2];
  cron.raw_month_   = fields[i + 3];
  cron.raw_weekday_ = fields[i + 4];

  cron.minutes_ = std::bitset<60>(ParseField(cron.raw_minute_, Field::kMinute).mask);
  cron.hours_   = std::bitset<24>(ParseField(cron.raw_hour_, Field::kHour).mask);
  cron.months_  = std::bitset<13>(ParseField(cron.raw_month_, Field::kMonth).mask);

  const auto day          = ParseField(cron.raw_day_, Field::kDay);
  cron.days_              = std::bitset<32>(day.mask);
  cron.day_any_           = day.any;
  cron.last_day_of_month_ = day.last_day;

  const auto weekday = ParseField(cron.raw_weekday_, Field::kWeekday);
  cron.weekdays_     = std::bitset<7>(weekday.mask);
  cron.weekday_any_  = weekday.any;
  for (const auto& [wd, nth] : weekday.weekday_rules) {
    cron.weekday_rules_.push_back(WeekdayRule{wd, nth});
  }

  cron.canonical_.clear();
  for (size_t f = 0; f < fields.size(); ++f) {
    if (f > 0) cron.canonical_ += ' ';
    cron.canonical_ += fields[f];
  }

  if (!cron.alias_description_) {
    for (const auto& alias : kAliases) {
      if (alias.expression == cron.canonical_) {
        cron.alias_description_ = alias.description;
        break;
      }
    }
  }
  return cron;
}

std::pair<bool, std::string> CronExpression::Validate(std::string_view expression) {
  try {
    Parse(expression);
    return {true, {}};
  } catch (const util::InvalidCronExpression& e) {
    return {false, e.what()};
  }
}

bool CronExpression::DayMatches(std::chrono::sys_days day) const {
  const std::chrono::year_month_day ymd{day};
  if (!months_[static_cast<unsigned>(ymd.month())]) return false;

  const unsigned d    = static_cast<unsigned>(ymd.day());
  const unsigned last = static_cast<unsigned>(std::chrono::year_month_day_last{ymd.year(), std::chrono::month_day_last{ymd.month()}}.day());

  const bool day_ok = day_any_ || days_[d] || (last_day_of_month_ && d == last);
  if (!day_ok) return false;
  if (weekday_any_) return true;

  const unsigned wd = std::chrono::weekday{day}.c_encoding();
  if (weekdays_[wd]) return true;
  for (const auto& rule : weekday_rules_) {
    if (rule.weekday != wd) continue;
    if (rule.nth == -1 && d + 7 > last) return true;
    if (rule.nth > 0 && static_cast<int>((d - 1) / 7 + 1) == rule.nth) return true;
  }
  return false;
}

std::optional<util::Seconds> CronExpression::NextTimeOfDay(std::optional<util::Seconds> after) const {
  const long long floor = after ? after->count() : -1;
  for (int h = 0; h < 24; ++h) {
    if (!hours_[h] || h * 3600 + 3599 <= floor) continue;
    for (int m = 0; m < 60; ++m) {
      if (!minutes_[m] || h * 3600 + m * 60 + 59 <= floor) continue;
      for (int s = 0; s < 60; ++s) {
        if (!seconds_[s]) continue;
        const long long t = h * 3600 + m * 60 + s;
        if (t > floor) return util::Seconds{t};
      }
    }
  }
  return std::nullopt;
}

std::optional<util::TimePoint> CronExpression::NextAfter(util::TimePoint after, std::chrono::minutes utc_offset) const {
  const auto local   = std::chrono::floor<std::chrono::seconds>(after) + utc_offset;
  auto       day     = std::chrono::floor<std::chrono::days>(local);
  const auto tod     = std::chrono::duration_cast<util::Seconds>(local - day);
  const auto horizon = day + std::chrono::days{366 * kMaxSearchYears};

  for (bool first = true; day <= horizon; day += std::chrono::days{1}, first = false) {
    if (!DayMatches(day)) continue;
    const auto time = NextTimeOfDay(first ? std::optional<util::Seconds>(tod) : std::nullopt);
    if (time) return util::FromCivil(day, *time, utc_offset);
  }
  return std::nullopt;
}

bool CronExpression::Matches(util::TimePoint t, std::chrono::minutes utc_offset) const {
  const auto civil = util::ToCivil(t, utc_offset);
  const auto secs  = civil.time_of_day.count();
  return DayMatches(civil.date) && hours_[static_cast<size_t>(secs / 3600)] && minutes_[static_cast<size_t>((secs / 60) % 60)] &&
         seconds_[static_cast<size_t>(secs % 60)];
}

std::string CronExpression::Describe() const {
  if (alias_description_) return std::string(*alias_description_);

  std::vector<std::string> parts;

  const std::string& minute = raw_minute_;
  const std::string& hour   = raw_hour_;
  if (minute == "*" && hour == "*") {
    parts.push_back("Every minute");
  } else if (minute.rfind("*/", 0) == 0) {
    parts.push_back("Every " + minute.substr(2) + " minutes");
  } else if (hour == "*") {
    parts.push_back("At minute " + minute + " every hour");
  } else if (hour.rfind("*/", 0) == 0) {
    parts.push_back("Every " + hour.substr(2) + " hours at minute " + minute);
  } else {
    parts.push_back("At " + hour + ":" + (minute.size() < 2 ? "0" + minute : minute));
  }

  if (raw_day_ != "*" && raw_day_ != "?") {
    if (Upper(raw_day_) == "L") {
      parts.push_back("on the last day of the month");
    } else {
      parts.push_back("on day " + raw_day_);
    }
  }

  if (raw_month_ != "*" && raw_month_ != "?") {
    const auto n = ToInt(raw_month_);
    if (n && *n >= 1 && *n <= 12) {
      parts.push_back("in " + std::string(kMonthShort[static_cast<size_t>(*n - 1)]));
    } else {
      parts.push_back("in month " + raw_month_);
    }
  }

  const std::string& dow = raw_weekday_;
  if (dow != "*" && dow != "?") {
    const auto hash = dow.find('#');
    if (dow == "1-5") {
      parts.push_back("on weekdays");
    } else if (dow == "0,6") {
      parts.push_back("on weekends");
    } else if (dow.size() > 1 && (dow.back() == 'L' || dow.back() == 'l')) {
      parts.push_back("on last " + WeekdayLabel(dow.substr(0, dow.size() - 1)) + " of month");
    } else if (hash != std::string::npos) {
      const auto k = ToInt(std::string_view(dow).substr(hash + 1));
      if (k) {
        parts.push_back("on " + std::to_string(*k) + OrdinalSuffix(*k) + " " + WeekdayLabel(dow.substr(0, hash)) + " of month");
      } else {
        parts.push_back("on " + dow);
      }
    } else if (const auto n = ToInt(dow); n && *n >= 0 && *n <= 7) {
      parts.push_back("on " + WeekdayLabel(dow));
    } else {
      parts.push_back("on " + dow);
    }
  }

  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += ' ';
    out += parts[i];
  }
  return out;
}

} // namespace fleet::scheduling
