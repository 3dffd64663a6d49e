#include "runtime_builders.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleet::config {

namespace rc = fleet::runtime::config;

namespace {

using std::chrono::minutes;
using std::chrono::seconds;

int ParseNumber(std::string_view text, std::string_view what) {
  int value = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    throw util::InvalidArgument("invalid " + std::string(what) + ": '" + std::string(text) + "'");
  }
  return value;
}

seconds ToSeconds(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<seconds>(util::FromProto(d));
}

calendar::WorkingHours BuildWorkingHours(const rc::WorkingHoursDefinition& def) {
  calendar::WorkingHours hours;
  if (!def.start().empty()) hours.start = ParseClock(def.start());
  if (!def.end().empty()) hours.end = ParseClock(def.end());
  if (def.has_enabled()) hours.enabled = def.enabled();
  return hours;
}

calendar::Holiday BuildHoliday(const rc::HolidayDefinition& def) {
  if (def.name().empty()) throw util::InvalidArgument("holiday name is required");
  if (def.month() < 1 || def.month() > 12) {
    throw util::InvalidArgument("holiday '" + def.name() + "': month must be 1-12");
  }

  const auto type = def.type().empty() ? std::optional(calendar::HolidayType::kFixed) : calendar::ParseHolidayType(def.type());
  if (!type) throw util::InvalidArgument("holiday '" + def.name() + "': unknown type '" + def.type() + "'");

  calendar::Holiday holiday;
  if (*type == calendar::HolidayType::kFloating) {
    const auto wd = calendar::ParseWeekday(def.weekday());
    if (!wd) throw util::InvalidArgument("holiday '" + def.name() + "': unknown weekday '" + def.weekday() + "'");
    if (def.occurrence() == 0 || def.occurrence() > 5 || def.occurrence() < -5) {
      throw util::InvalidArgument("holiday '" + def.name() + "': occurrence must be 1-5 or -1..-5");
    }
    holiday = calendar::Holiday::Floating(def.name(), def.month(), *wd, def.occurrence());
  } else {
    if (def.day() < 1 || def.day() > 31) throw util::InvalidArgument("holiday '" + def.name() + "': day must be 1-31");
    holiday      = calendar::Holiday::Fixed(def.name(), def.month(), def.day(), def.observance());
    holiday.type = *type;
  }
  if (def.has_year()) holiday.year = def.year();
  holiday.observance = def.observance();
  return holiday;
}

calendar::BlackoutPeriod BuildBlackout(const rc::BlackoutDefinition& def) {
  if (!def.has_start() || !def.has_end()) {
    throw util::InvalidArgument("blackout '" + def.name() + "': start and end are required");
  }
  calendar::BlackoutPeriod blackout;
  blackout.name      = def.name();
  blackout.start     = util::FromProto(def.start());
  blackout.end       = util::FromProto(def.end());
  blackout.reason    = def.reason();
  blackout.recurring = def.recurring();
  blackout.affects_workflows.assign(def.affects_workflows().begin(), def.affects_workflows().end());
  if (blackout.end < blackout.start) {
    throw util::InvalidArgument("blackout '" + def.name() + "': end precedes start");
  }
  return blackout;
}

model::CapabilityValue BuildCapability(const std::string& key, const google::protobuf::Value& value) {
  using google::protobuf::Value;
  switch (value.kind_case()) {
    case Value::kBoolValue:
      return value.bool_value();
    case Value::kNumberValue:
      return value.number_value();
    case Value::kStringValue:
      return value.string_value();
    case Value::kStructValue: {
      const auto& fields = value.struct_value().fields();
      model::CapabilityDescriptor descriptor;
      auto                        name = fields.find("name");
      descriptor.name                  = name != fields.end() ? name->second.string_value() : key;
      auto version                     = fields.find("version");
      if (version != fields.end()) descriptor.version = version->second.string_value();
      return descriptor;
    }
    default:
      throw util::InvalidArgument("capability '" + key + "': expected bool, number, string or {name, version}");
  }
}

} // namespace

std::chrono::minutes ParseClock(std::string_view text) {
  const auto colon = text.find(':');
  if (colon == std::string_view::npos) throw util::InvalidArgument("invalid clock time '" + std::string(text) + "', expected HH:MM");

  const int h = ParseNumber(text.substr(0, colon), "hour");
  const int m = ParseNumber(text.substr(colon + 1), "minute");
  if (h < 0 || h > 23 || m < 0 || m > 59) {
    throw util::InvalidArgument("clock time out of range: '" + std::string(text) + "'");
  }
  return minutes{h * 60 + m};
}

std::chrono::year_month_day ParseDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    throw util::InvalidArgument("invalid date '" + std::string(text) + "', expected YYYY-MM-DD");
  }
  const std::chrono::year_month_day ymd{std::chrono::year{ParseNumber(text.substr(0, 4), "year")},
                                        std::chrono::month{static_cast<unsigned>(ParseNumber(text.substr(5, 2), "month"))},
                                        std::chrono::day{static_cast<unsigned>(ParseNumber(text.substr(8, 2), "day"))}};
  if (!ymd.ok()) throw util::InvalidArgument("invalid date '" + std::string(text) + "'");
  return ymd;
}

assignment::ScoringWeights BuildWeights(const rc::ScoringWeightsConfig& config) {
  assignment::ScoringWeights w;
  if (config.has_cpu_weight()) w.cpu_weight = config.cpu_weight();
  if (config.has_memory_weight()) w.memory_weight = config.memory_weight();
  if (config.has_tag_match_weight()) w.tag_match_weight = config.tag_match_weight();
  if (config.has_state_affinity_weight()) w.state_affinity_weight = config.state_affinity_weight();
  if (config.has_network_proximity_weight()) w.network_proximity_weight = config.network_proximity_weight();
  if (config.has_job_count_weight()) w.job_count_weight = config.job_count_weight();

  if (config.has_cpu_high_threshold()) w.cpu_high_threshold = config.cpu_high_threshold();
  if (config.has_cpu_medium_threshold()) w.cpu_medium_threshold = config.cpu_medium_threshold();
  if (config.has_memory_high_threshold()) w.memory_high_threshold = config.memory_high_threshold();
  if (config.has_memory_medium_threshold()) w.memory_medium_threshold = config.memory_medium_threshold();

  if (config.has_high_load_penalty()) w.high_load_penalty = config.high_load_penalty();
  if (config.has_medium_load_penalty()) w.medium_load_penalty = config.medium_load_penalty();

  if (config.has_tag_match_bonus()) w.tag_match_bonus = config.tag_match_bonus();
  if (config.has_state_affinity_bonus()) w.state_affinity_bonus = config.state_affinity_bonus();
  if (config.has_network_proximity_bonus()) w.network_proximity_bonus = config.network_proximity_bonus();

  if (w.cpu_medium_threshold > w.cpu_high_threshold) {
    throw util::InvalidArgument("assignment.weights: cpu_medium_threshold exceeds cpu_high_threshold");
  }
  if (w.memory_medium_threshold > w.memory_high_threshold) {
    throw util::InvalidArgument("assignment.weights: memory_medium_threshold exceeds memory_high_threshold");
  }
  return w;
}

affinity::StateAffinityOptions BuildAffinityOptions(const rc::AffinityConfig& config) {
  affinity::StateAffinityOptions options;
  if (config.has_default_state_ttl()) options.default_state_ttl = ToSeconds(config.default_state_ttl());
  if (config.has_session_timeout()) options.session_timeout = ToSeconds(config.session_timeout());
  if (config.has_hard_affinity_queue_delay()) options.hard_affinity_queue_delay = ToSeconds(config.hard_affinity_queue_delay());
  if (config.has_max_queue_delay()) options.max_queue_delay = ToSeconds(config.max_queue_delay());
  if (config.has_max_queue_attempts()) options.max_queue_attempts = config.max_queue_attempts();
  if (config.has_cleanup_interval()) options.cleanup_interval = util::FromProto(config.cleanup_interval());

  if (options.max_queue_attempts < 1) throw util::InvalidArgument("affinity.max_queue_attempts must be positive");
  if (options.session_timeout.count() <= 0) throw util::InvalidArgument("affinity.session_timeout must be positive");
  if (options.cleanup_interval.count() <= 0) throw util::InvalidArgument("affinity.cleanup_interval must be positive");
  return options;
}

affinity::StateAffinityLevel BuildDefaultAffinityLevel(const rc::AffinityConfig& config) {
  const auto level = affinity::ParseAffinityLevel(config.default_level());
  if (!level) throw util::InvalidArgument("affinity.default_level: unknown level '" + config.default_level() + "'");
  return *level;
}

scheduling::SchedulerOptions BuildSchedulerOptions(const rc::SchedulerConfig& config) {
  scheduling::SchedulerOptions options;
  if (config.has_executor_threads()) options.executor_threads = config.executor_threads();
  if (config.has_max_instances()) options.max_instances = config.max_instances();
  if (config.has_misfire_grace()) options.misfire_grace = ToSeconds(config.misfire_grace());
  if (config.has_max_poll_interval()) options.max_poll_interval = util::FromProto(config.max_poll_interval());
  if (config.has_default_consecutive_failure_limit()) options.default_consecutive_failure_limit = config.default_consecutive_failure_limit();

  if (options.executor_threads == 0) throw util::InvalidArgument("scheduler.executor_threads must be positive");
  if (options.max_instances < 1) throw util::InvalidArgument("scheduler.max_instances must be positive");
  if (options.max_poll_interval.count() <= 0) throw util::InvalidArgument("scheduler.max_poll_interval must be positive");
  return options;
}

std::shared_ptr<calendar::BusinessCalendar> BuildCalendar(const rc::CalendarDefinition& definition) {
  if (definition.id().empty()) throw util::InvalidArgument("calendar id is required");

  std::optional<minutes> offset;
  if (definition.has_utc_offset_minutes()) offset = minutes{definition.utc_offset_minutes()};

  calendar::CalendarConfigBuilder builder;
  const auto&                     preset = definition.preset();
  if (preset == "us") {
    builder = calendar::CalendarConfigBuilder(calendar::BusinessCalendar::CreateUsCalendar(offset.value_or(std::chrono::hours(-5))).config());
  } else if (preset == "uk") {
    builder = calendar::CalendarConfigBuilder(calendar::BusinessCalendar::CreateUkCalendar(offset.value_or(minutes{0})).config());
  } else if (preset == "24x7") {
    builder = calendar::CalendarConfigBuilder(calendar::BusinessCalendar::Create24x7Calendar(offset.value_or(minutes{0})).config());
  } else if (!preset.empty()) {
    throw util::InvalidArgument("calendar '" + definition.id() + "': unknown preset '" + preset + "'");
  } else if (offset) {
    builder.UtcOffset(*offset);
  }

  builder.Id(definition.id()).Name(definition.name().empty() ? definition.id() : definition.name());
  if (definition.has_allow_weekends()) builder.AllowWeekends(definition.allow_weekends());
  if (definition.has_allow_outside_hours()) builder.AllowOutsideHours(definition.allow_outside_hours());

  for (const auto& wh : definition.working_hours()) {
    const auto hours = BuildWorkingHours(wh);
    if (wh.day() == "all" || wh.day().empty()) {
      builder.AllDays(hours);
      continue;
    }
    const auto wd = calendar::ParseWeekday(wh.day());
    if (!wd) throw util::InvalidArgument("calendar '" + definition.id() + "': unknown day '" + wh.day() + "'");
    builder.WorkingHoursFor(*wd, hours);
  }
  for (const auto& h : definition.holidays()) {
    builder.AddHoliday(BuildHoliday(h));
  }
  for (const auto& b : definition.blackouts()) {
    builder.AddBlackout(BuildBlackout(b));
  }
  for (const auto& d : definition.custom_dates()) {
    builder.AddCustomDate(ParseDate(d));
  }

  return std::make_shared<calendar::BusinessCalendar>(builder.Build());
}

model::RobotInfo BuildRobot(const rc::RobotDefinition& definition) {
  if (definition.id().empty()) throw util::InvalidArgument("robot id is required");

  model::RobotInfo robot;
  robot.id             = definition.id();
  robot.name           = definition.name().empty() ? definition.id() : definition.name();
  robot.status         = definition.status().empty() ? model::RobotStatus::kOnline : model::ParseRobotStatus(definition.status());
  robot.cpu_percent    = definition.cpu_percent();
  robot.memory_percent = definition.memory_percent();
  robot.current_jobs   = definition.current_jobs();
  if (definition.has_max_concurrent_jobs()) robot.max_concurrent_jobs = definition.max_concurrent_jobs();
  robot.tags.assign(definition.tags().begin(), definition.tags().end());
  if (!definition.environment().empty()) robot.environment = definition.environment();
  robot.network_zone = definition.network_zone();

  for (const auto& [key, value] : definition.capabilities().fields()) {
    robot.capabilities.emplace(key, BuildCapability(key, value));
  }

  if (robot.cpu_percent < 0 || robot.cpu_percent > 100 || robot.memory_percent < 0 || robot.memory_percent > 100) {
    throw util::InvalidArgument("robot '" + robot.id + "': cpu_percent and memory_percent must be 0-100");
  }
  if (robot.current_jobs < 0 || robot.max_concurrent_jobs < 0) {
    throw util::InvalidArgument("robot '" + robot.id + "': job counts must not be negative");
  }
  return robot;
}

scheduling::AdvancedSchedule BuildSchedule(const rc::ScheduleDefinition& definition, minutes default_offset) {
  using namespace scheduling;

  if (definition.id().empty()) throw util::InvalidArgument("schedule id is required");
  const std::string where = "schedule '" + definition.id() + "'";

  AdvancedSchedule s;
  s.id            = definition.id();
  s.name          = definition.name().empty() ? definition.id() : definition.name();
  s.workflow_id   = definition.workflow_id();
  s.workflow_name = definition.workflow_name().empty() ? definition.workflow_id() : definition.workflow_name();

  const auto type = ParseScheduleType(definition.type());
  if (!type) throw util::InvalidArgument(where + ": unknown type '" + definition.type() + "'");
  s.type = *type;

  if (!definition.status().empty()) {
    const auto status = ParseScheduleStatus(definition.status());
    if (!status) throw util::InvalidArgument(where + ": unknown status '" + definition.status() + "'");
    s.status = *status;
  }
  if (definition.has_enabled()) s.enabled = definition.enabled();
  s.utc_offset = definition.has_utc_offset_minutes() ? minutes{definition.utc_offset_minutes()} : default_offset;

  s.cron_expression = definition.cron_expression();
  if (definition.has_interval()) s.interval = ToSeconds(definition.interval());
  if (definition.has_start_at()) s.start_at = util::FromProto(definition.start_at());
  if (definition.has_run_at()) s.run_at = util::FromProto(definition.run_at());

  if (!definition.calendar_id().empty()) s.calendar_id = definition.calendar_id();
  s.respect_business_hours = definition.respect_business_hours();

  if (definition.has_sla()) {
    const auto& p = definition.sla();
    SlaConfig   sla;
    if (p.has_max_duration()) sla.max_duration = ToSeconds(p.max_duration());
    if (p.has_max_start_delay()) sla.max_start_delay = ToSeconds(p.max_start_delay());
    if (p.has_success_rate_threshold()) sla.success_rate_threshold = p.success_rate_threshold();
    if (p.has_consecutive_failure_limit()) sla.consecutive_failure_limit = p.consecutive_failure_limit();
    if (sla.success_rate_threshold < 0 || sla.success_rate_threshold > 100) {
      throw util::InvalidArgument(where + ": sla.success_rate_threshold must be 0-100");
    }
    if (sla.consecutive_failure_limit < 1) throw util::InvalidArgument(where + ": sla.consecutive_failure_limit must be positive");
    s.sla = std::move(sla);
  }

  if (definition.has_rate_limit()) {
    const auto&     p = definition.rate_limit();
    RateLimitConfig limit;
    if (p.has_max_executions()) limit.max_executions = p.max_executions();
    if (p.has_window()) limit.window = ToSeconds(p.window());
    if (p.has_queue_overflow()) limit.queue_overflow = p.queue_overflow();
    if (limit.max_executions < 1 || limit.window.count() <= 0) {
      throw util::InvalidArgument(where + ": rate_limit needs positive max_executions and window");
    }
    s.rate_limit = limit;
  }

  if (definition.has_dependency()) {
    const auto&      p = definition.dependency();
    DependencyConfig dep;
    dep.depends_on.assign(p.depends_on().begin(), p.depends_on().end());
    if (p.has_wait_for_all()) dep.wait_for_all = p.wait_for_all();
    if (p.has_timeout()) dep.timeout = ToSeconds(p.timeout());
    if (p.has_trigger_on_success_only()) dep.trigger_on_success_only = p.trigger_on_success_only();
    s.dependency = std::move(dep);
  }

  if (definition.has_catch_up()) {
    const auto&   p = definition.catch_up();
    CatchUpConfig catch_up;
    catch_up.enabled = p.enabled();
    if (p.has_max_runs()) catch_up.max_runs = p.max_runs();
    if (p.has_window()) catch_up.window = std::chrono::duration_cast<std::chrono::hours>(util::FromProto(p.window()));
    if (p.has_sequential()) catch_up.sequential = p.sequential();
    if (p.has_sequential_delay()) catch_up.sequential_delay = ToSeconds(p.sequential_delay());
    if (catch_up.max_runs < 1) throw util::InvalidArgument(where + ": catch_up.max_runs must be positive");
    s.catch_up = catch_up;
  }

  if (definition.has_event_trigger()) {
    const auto&        p = definition.event_trigger();
    EventTriggerConfig event;
    if (!p.event_type().empty()) {
      const auto event_type = ParseEventType(p.event_type());
      if (!event_type) throw util::InvalidArgument(where + ": unknown event_type '" + p.event_type() + "'");
      event.event_type = *event_type;
    }
    event.event_source = p.event_source();
    if (p.has_event_filter()) event.event_filter = p.event_filter();
    if (p.has_debounce()) event.debounce = ToSeconds(p.debounce());
    s.event_trigger = std::move(event);
  }

  if (definition.has_priority()) s.priority = definition.priority();
  if (s.priority < 1 || s.priority > 10) throw util::InvalidArgument(where + ": priority must be 1-10");
  if (!definition.robot_id().empty()) s.robot_id = definition.robot_id();
  s.variables = definition.variables();
  s.tags.assign(definition.tags().begin(), definition.tags().end());
  for (const auto& [key, value] : definition.metadata()) {
    s.metadata.emplace(key, value);
  }
  s.created_by = definition.created_by().empty() ? "config" : definition.created_by();

  if (!definition.affinity_level().empty()) {
    const auto level = affinity::ParseAffinityLevel(definition.affinity_level());
    if (!level) throw util::InvalidArgument(where + ": unknown affinity_level '" + definition.affinity_level() + "'");
    s.metadata["affinity_level"] = std::string(affinity::ToString(*level));
  }
  return s;
}

} // namespace fleet::config
