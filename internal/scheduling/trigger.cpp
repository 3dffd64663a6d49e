#include "trigger.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace fleet::scheduling {

DateTrigger::DateTrigger(util::TimePoint run_at) : run_at_(run_at) {
}

std::optional<util::TimePoint> DateTrigger::NextFireTime(std::optional<util::TimePoint> previous, util::TimePoint) const {
  if (previous) return std::nullopt;
  return run_at_;
}

std::string DateTrigger::Describe() const {
  return "Once at " + util::FormatTimestamp(run_at_);
}

IntervalTrigger::IntervalTrigger(util::TimePoint start, util::Seconds interval) : start_(start), interval_(interval) {
}

std::optional<util::TimePoint> IntervalTrigger::NextFireTime(std::optional<util::TimePoint> previous, util::TimePoint now) const {
  if (previous) return *previous + interval_;
  if (now < start_ + interval_) return start_ + interval_;

  // First multiple of the interval strictly after now.
  const auto elapsed = std::chrono::duration_cast<util::Seconds>(now - start_);
  return start_ + interval_ * (elapsed / interval_ + 1);
}

std::string IntervalTrigger::Describe() const {
  return "Every " + std::to_string(interval_.count()) + " seconds";
}

CronTrigger::CronTrigger(CronExpression cron, std::chrono::minutes utc_offset) : cron_(std::move(cron)), utc_offset_(utc_offset) {
}

std::optional<util::TimePoint> CronTrigger::NextFireTime(std::optional<util::TimePoint> previous, util::TimePoint now) const {
  return cron_.NextAfter(previous.value_or(now), utc_offset_);
}

std::string CronTrigger::Describe() const {
  return cron_.Describe();
}

std::unique_ptr<Trigger> MakeTrigger(const AdvancedSchedule& schedule, util::TimePoint now) {
  switch (schedule.type) {
    case ScheduleType::kOneTime:
      if (!schedule.run_at) throw util::InvalidArgument("one-time schedule '" + schedule.id + "' has no run_at");
      return std::make_unique<DateTrigger>(*schedule.run_at);

    case ScheduleType::kInterval:
      if (schedule.interval.count() <= 0) {
        throw util::InvalidArgument("interval schedule '" + schedule.id + "' needs a positive interval");
      }
      return std::make_unique<IntervalTrigger>(schedule.start_at.value_or(now), schedule.interval);

    case ScheduleType::kCron:
      if (schedule.cron_expression.empty()) throw util::InvalidCronExpression("cron schedule '" + schedule.id + "' has no expression");
      return std::make_unique<CronTrigger>(CronExpression::Parse(schedule.cron_expression), schedule.utc_offset);

    case ScheduleType::kEvent:
    case ScheduleType::kDependency:
      return nullptr;
  }
  return nullptr;
}

} // namespace fleet::scheduling
