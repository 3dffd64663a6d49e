#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/scheduling/cron_expression.hpp"
#include "internal/scheduling/schedule.hpp"
#include "internal/util/time.hpp"

namespace fleet::scheduling {

/*
  Trigger

  Computes fire times for a time-driven schedule. `previous` is the last
  scheduled fire time (not the actual start), nullopt before the first.
*/
class Trigger {
 public:
  virtual ~Trigger() = default;

  virtual std::optional<util::TimePoint> NextFireTime(std::optional<util::TimePoint> previous, util::TimePoint now) const = 0;

  virtual std::string Describe() const = 0;
};

class DateTrigger : public Trigger {
 public:
  explicit DateTrigger(util::TimePoint run_at);

  std::optional<util::TimePoint> NextFireTime(std::optional<util::TimePoint> previous, util::TimePoint now) const override;
  std::string                    Describe() const override;

 private:
  util::TimePoint run_at_;
};

class IntervalTrigger : public Trigger {
 public:
  IntervalTrigger(util::TimePoint start, util::Seconds interval);

  std::optional<util::TimePoint> NextFireTime(std::optional<util::TimePoint> previous, util::TimePoint now) const override;
  std::string                    Describe() const override;

 private:
  util::TimePoint start_;
  util::Seconds   interval_;
};

class CronTrigger : public Trigger {
 public:
  CronTrigger(CronExpression cron, std::chrono::minutes utc_offset);

  std::optional<util::TimePoint> NextFireTime(std::optional<util::TimePoint> previous, util::TimePoint now) const override;
  std::string                    Describe() const override;

  const CronExpression& cron() const {
    return cron_;
  }

 private:
  CronExpression       cron_;
  std::chrono::minutes utc_offset_;
};

// nullptr for event and dependency schedules. Throws
// util::InvalidCronExpression / util::InvalidArgument on bad definitions.
std::unique_ptr<Trigger> MakeTrigger(const AdvancedSchedule& schedule, util::TimePoint now);

} // namespace fleet::scheduling
