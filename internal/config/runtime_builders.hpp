#pragma once

#include <chrono>
#include <memory>
#include <string_view>

#include "config/config.pb.h"

#include "internal/affinity/robot_state.hpp"
#include "internal/affinity/state_affinity_manager.hpp"
#include "internal/assignment/scoring_weights.hpp"
#include "internal/calendar/business_calendar.hpp"
#include "internal/model/robot.hpp"
#include "internal/scheduling/advanced_scheduler.hpp"
#include "internal/scheduling/schedule.hpp"

namespace fleet::config {

/*
  Config message -> runtime type conversions.

  Unset optional fields keep the runtime defaults. Every builder throws
  util::InvalidArgument naming the offending field.
*/

assignment::ScoringWeights BuildWeights(const fleet::runtime::config::ScoringWeightsConfig& config);

affinity::StateAffinityOptions BuildAffinityOptions(const fleet::runtime::config::AffinityConfig& config);

// Empty means NONE.
affinity::StateAffinityLevel BuildDefaultAffinityLevel(const fleet::runtime::config::AffinityConfig& config);

scheduling::SchedulerOptions BuildSchedulerOptions(const fleet::runtime::config::SchedulerConfig& config);

std::shared_ptr<calendar::BusinessCalendar> BuildCalendar(const fleet::runtime::config::CalendarDefinition& definition);

model::RobotInfo BuildRobot(const fleet::runtime::config::RobotDefinition& definition);

// default_offset applies when the definition carries no utc_offset_minutes.
scheduling::AdvancedSchedule BuildSchedule(const fleet::runtime::config::ScheduleDefinition& definition,
                                           std::chrono::minutes default_offset = std::chrono::minutes{0});

// "HH:MM", 00:00 through 23:59.
std::chrono::minutes ParseClock(std::string_view text);

// "YYYY-MM-DD"
std::chrono::year_month_day ParseDate(std::string_view text);

} // namespace fleet::config
