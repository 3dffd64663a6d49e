#pragma once

#include <bitset>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"

namespace fleet::scheduling {

struct CronAlias {
  std::string_view name;
  std::string_view expression;
  std::string_view description;
};

/*
  CronExpression

  Parsed 5-field (minute hour day month day_of_week) or 6-field
  (second minute hour day month day_of_week) cron expression.

  Field syntax: '*', '?', values, 'a-b', '/step' and comma lists.
  Months accept JAN..DEC, weekdays SUN..SAT; 0 and 7 are both Sunday.
  Day field accepts 'L' (last day of the month). Weekday field accepts
  'nL' (last weekday n of the month) and 'n#k' (k-th weekday n).

  Day-of-month and day-of-week are combined with AND. Evaluation runs in
  local civil time given as a fixed UTC offset.
*/
class CronExpression {
 public:
  // Search horizon for NextAfter.
  static constexpr int kMaxSearchYears = 5;

  // Throws util::InvalidCronExpression.
  static CronExpression Parse(std::string_view expression);

  // (true, "") or (false, reason).
  static std::pair<bool, std::string> Validate(std::string_view expression);

  // Alias ("@daily", "daily", "DAILY") to its 5-field expression.
  static std::optional<std::string> ResolveAlias(std::string_view expression);

  static const std::vector<CronAlias>& Aliases();

  // First fire time strictly after `after`, or nullopt past the search horizon.
  std::optional<util::TimePoint> NextAfter(util::TimePoint after, std::chrono::minutes utc_offset = std::chrono::minutes{0}) const;

  bool Matches(util::TimePoint t, std::chrono::minutes utc_offset = std::chrono::minutes{0}) const;

  std::string Describe() const;

  // As given by the caller.
  const std::string& expression() const {
    return expression_;
  }

  // After alias resolution.
  const std::string& canonical() const {
    return canonical_;
  }

 private:
  struct WeekdayRule {
    unsigned weekday;
    int      nth; // 1..5 for n#k, -1 for nL
  };

  CronExpression() = default;

  bool DayMatches(std::chrono::sys_days day) const;
  std::optional<util::Seconds> NextTimeOfDay(std::optional<util::Seconds> after) const;

  std::string expression_;
  std::string canonical_;
  std::optional<std::string_view> alias_description_;

  std::string raw_minute_;
  std::string raw_hour_;
  std::string raw_day_;
  std::string raw_month_;
  std::string raw_weekday_;

  std::bitset<60> seconds_;
  std::bitset<60> minutes_;
  std::bitset<24> hours_;
  std::bitset<32> days_;
  std::bitset<13> months_;
  std::bitset<7>  weekdays_;

  bool day_any_{true};
  bool weekday_any_{true};
  bool last_day_of_month_{false};

  std::vector<WeekdayRule> weekday_rules_;
};

} // namespace fleet::scheduling
