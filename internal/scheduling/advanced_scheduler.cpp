#include "advanced_scheduler.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/scheduling/event_filter.hpp"

namespace fleet::scheduling {

using observability::BoolField;
using observability::DurationField;
using observability::IntField;
using observability::StringField;

namespace {

std::string Join(const std::vector<std::string>& items, std::string_view sep) {
  std::ostringstream out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out << sep;
    out << items[i];
  }
  return out.str();
}

std::string FormatOptional(const std::optional<util::TimePoint>& tp) {
  return tp ? util::FormatTimestamp(*tp) : std::string("none");
}

} // namespace

std::string_view ToString(ExecutionOutcome outcome) {
  switch (outcome) {
    case ExecutionOutcome::kExecuted:
      return "executed";
    case ExecutionOutcome::kFailed:
      return "failed";
    case ExecutionOutcome::kSkippedInactive:
      return "skipped_inactive";
    case ExecutionOutcome::kSkippedRateLimited:
      return "skipped_rate_limited";
    case ExecutionOutcome::kSkippedOutsideBusinessHours:
      return "skipped_outside_business_hours";
    case ExecutionOutcome::kSkippedConditionFalse:
      return "skipped_condition_false";
    case ExecutionOutcome::kSkippedDependenciesUnmet:
      return "skipped_dependencies_unmet";
    case ExecutionOutcome::kSkippedMaxInstances:
      return "skipped_max_instances";
    case ExecutionOutcome::kNotFound:
      return "not_found";
  }
  return "unknown";
}

AdvancedScheduler::AdvancedScheduler(TriggerCallback on_trigger, SchedulerOptions options)
    : on_trigger_(std::move(on_trigger)), options_(options), queue_(std::make_shared<ExecutionQueue>()) {
  if (options_.executor_threads == 0) options_.executor_threads = 1;
  if (options_.max_instances <= 0) options_.max_instances = 1;
  FLEET_LOG_INFO("AdvancedScheduler initialized", {IntField("executor_threads", static_cast<int64_t>(options_.executor_threads)),
                                                   IntField("max_instances", options_.max_instances),
                                                   IntField("misfire_grace_s", options_.misfire_grace.count())});
}

AdvancedScheduler::~AdvancedScheduler() {
  try {
    Stop(false);
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Scheduler shutdown failed", {StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void AdvancedScheduler::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;

    {
      std::lock_guard wait_lock(wait_mutex_);
      cancel_waits_       = false;
      shutdown_requested_ = false;
    }
    queue_->Reset();

    const auto now = util::Now();
    for (auto& [id, entry] : schedules_) {
      if (entry.trigger && entry.schedule.status == ScheduleStatus::kActive && !entry.schedule.next_run) {
        entry.schedule.next_run = entry.trigger->NextFireTime(std::nullopt, now);
      }
    }
    running_ = true;
  }

  for (size_t i = 0; i < options_.executor_threads; ++i) {
    auto worker = std::make_unique<ExecutionWorker>(queue_, [this](const ExecutionTask& task) { RunPipeline(task); });
    worker->Start();
    workers_.push_back(std::move(worker));
  }
  timer_thread_ = std::thread(&AdvancedScheduler::TimerLoop, this);

  FLEET_LOG_INFO("AdvancedScheduler started");
}

void AdvancedScheduler::Stop(bool wait) {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  timer_cv_.notify_all();
  if (timer_thread_.joinable()) timer_thread_.join();

  {
    std::lock_guard wait_lock(wait_mutex_);
    shutdown_requested_ = true;
    if (!wait) cancel_waits_ = true;
  }
  wait_cv_.notify_all();

  const size_t dropped = queue_->Shutdown(wait);
  for (auto& worker : workers_) {
    worker->Stop();
  }
  workers_.clear();

  // cancel_waits_ stays set until the next Start().
  FLEET_LOG_INFO("AdvancedScheduler stopped", {BoolField("wait", wait), IntField("dropped", static_cast<int64_t>(dropped))});
}

bool AdvancedScheduler::IsRunning() const {
  return running_;
}

bool AdvancedScheduler::WaitFor(std::chrono::milliseconds duration, bool on_shutdown) {
  std::unique_lock lock(wait_mutex_);
  const bool interrupted =
      wait_cv_.wait_for(lock, duration, [&] { return cancel_waits_ || (on_shutdown && shutdown_requested_); });
  return !interrupted;
}

bool AdvancedScheduler::ShutdownRequested() {
  std::lock_guard lock(wait_mutex_);
  return shutdown_requested_ || cancel_waits_;
}

// ------------------------------------------------------------
// Calendars
// ------------------------------------------------------------

void AdvancedScheduler::RegisterCalendar(const std::string& calendar_id, std::shared_ptr<calendar::BusinessCalendar> calendar) {
  std::lock_guard lock(mutex_);
  calendars_[calendar_id] = std::move(calendar);
  FLEET_LOG_DEBUG("Registered calendar", {StringField("calendar_id", calendar_id)});
}

std::shared_ptr<calendar::BusinessCalendar> AdvancedScheduler::GetCalendar(const std::string& calendar_id) const {
  std::lock_guard lock(mutex_);
  auto            it = calendars_.find(calendar_id);
  return it == calendars_.end() ? nullptr : it->second;
}

// ------------------------------------------------------------
// Schedule management
// ------------------------------------------------------------

std::map<std::string, std::vector<std::string>> AdvancedScheduler::DependsOnLocked() const {
  std::map<std::string, std::vector<std::string>> graph;
  for (const auto& [id, entry] : schedules_) {
    graph[id] = entry.schedule.dependency ? entry.schedule.dependency->depends_on : std::vector<std::string>{};
  }
  return graph;
}

bool AdvancedScheduler::ValidateLocked(const AdvancedSchedule& schedule) const {
  auto reject = [&](const std::string& reason) {
    FLEET_LOG_ERROR("Schedule rejected", {StringField("schedule_id", schedule.id), StringField("reason", reason)});
    return false;
  };

  if (schedule.id.empty()) return reject("missing id");
  if (schedules_.count(schedule.id)) return reject("duplicate id");

  switch (schedule.type) {
    case ScheduleType::kCron: {
      const auto [ok, error] = CronExpression::Validate(schedule.cron_expression);
      if (!ok) return reject(error);
      break;
    }
    case ScheduleType::kInterval:
      if (schedule.interval.count() <= 0) return reject("interval must be positive");
      break;
    case ScheduleType::kOneTime:
      if (!schedule.run_at) return reject("one-time schedule needs run_at");
      break;
    case ScheduleType::kEvent:
      if (!schedule.event_trigger) return reject("event schedule needs an event trigger");
      break;
    case ScheduleType::kDependency:
      if (!schedule.dependency || schedule.dependency->depends_on.empty()) return reject("dependency schedule needs depends_on");
      break;
  }

  if (schedule.dependency && !schedule.dependency->depends_on.empty()) {
    auto graph         = DependsOnLocked();
    graph[schedule.id] = schedule.dependency->depends_on;
    const auto check   = scheduling::ValidateDependencyGraph(graph);
    if (!check.valid) return reject("dependency cycle: " + Join(check.cycle, " -> "));
  }
  return true;
}

bool AdvancedScheduler::InsertLocked(AdvancedSchedule schedule, util::TimePoint now) {
  if (!ValidateLocked(schedule)) return false;

  if (schedule.type == ScheduleType::kOneTime && schedule.respect_business_hours && schedule.calendar_id) {
    if (auto it = calendars_.find(*schedule.calendar_id); it != calendars_.end() && it->second) {
      schedule.run_at = it->second->AdjustToWorkingTime(*schedule.run_at, schedule.workflow_id);
    }
  }

  Entry entry;
  try {
    entry.trigger = MakeTrigger(schedule, now);
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Schedule rejected", {StringField("schedule_id", schedule.id), StringField("reason", e.what())});
    return false;
  }
  if (schedule.rate_limit) {
    entry.limiter = std::make_shared<SlidingWindowRateLimiter>(schedule.rate_limit->max_executions, schedule.rate_limit->window);
  }

  if (!schedule.created_at) schedule.created_at = now;
  if (!schedule.enabled) {
    schedule.status = ScheduleStatus::kDisabled;
    schedule.next_run.reset();
  } else if (entry.trigger && schedule.status == ScheduleStatus::kActive) {
    schedule.next_run = entry.trigger->NextFireTime(std::nullopt, now);
  }

  FLEET_LOG_INFO("Schedule added", {StringField("schedule_id", schedule.id), StringField("name", schedule.name),
                                    StringField("type", ToString(schedule.type)), StringField("next_run", FormatOptional(schedule.next_run))});

  entry.schedule = std::move(schedule);
  const std::string id = entry.schedule.id;
  schedules_.emplace(id, std::move(entry));
  rearm_ = true;
  return true;
}

bool AdvancedScheduler::AddSchedule(AdvancedSchedule schedule) {
  bool added = false;
  {
    std::lock_guard lock(mutex_);
    added = InsertLocked(std::move(schedule), util::Now());
  }
  if (added) timer_cv_.notify_all();
  return added;
}

bool AdvancedScheduler::RemoveSchedule(const std::string& schedule_id) {
  std::lock_guard lock(mutex_);
  if (schedules_.erase(schedule_id) == 0) return false;
  FLEET_LOG_INFO("Schedule removed", {StringField("schedule_id", schedule_id)});
  return true;
}

bool AdvancedScheduler::UpdateSchedule(AdvancedSchedule schedule) {
  bool updated = false;
  {
    std::lock_guard lock(mutex_);
    auto            it = schedules_.find(schedule.id);
    if (it == schedules_.end()) {
      FLEET_LOG_WARN("Update of unknown schedule", {StringField("schedule_id", schedule.id)});
      return false;
    }

    Entry previous = std::move(it->second);
    schedules_.erase(it);

    const auto now      = util::Now();
    schedule.updated_at = now;
    schedule.next_run.reset();
    updated = InsertLocked(std::move(schedule), now);
    if (!updated) {
      const std::string id = previous.schedule.id;
      schedules_.emplace(id, std::move(previous));
    }
  }
  if (updated) timer_cv_.notify_all();
  return updated;
}

bool AdvancedScheduler::PauseSchedule(const std::string& schedule_id) {
  std::lock_guard lock(mutex_);
  auto            it = schedules_.find(schedule_id);
  if (it == schedules_.end()) return false;
  it->second.schedule.status = ScheduleStatus::kPaused;
  FLEET_LOG_INFO("Schedule paused", {StringField("schedule_id", schedule_id)});
  return true;
}

bool AdvancedScheduler::ResumeSchedule(const std::string& schedule_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = schedules_.find(schedule_id);
    if (it == schedules_.end()) return false;

    auto& entry            = it->second;
    entry.schedule.status  = ScheduleStatus::kActive;
    entry.schedule.enabled = true;

    const auto now = util::Now();
    if (entry.trigger && (!entry.schedule.next_run || *entry.schedule.next_run < now)) {
      entry.schedule.next_run = entry.trigger->NextFireTime(std::nullopt, now);
    }
    rearm_ = true;
    FLEET_LOG_INFO("Schedule resumed", {StringField("schedule_id", schedule_id), StringField("next_run", FormatOptional(entry.schedule.next_run))});
  }
  timer_cv_.notify_all();
  return true;
}

bool AdvancedScheduler::DisableSchedule(const std::string& schedule_id) {
  std::lock_guard lock(mutex_);
  auto            it = schedules_.find(schedule_id);
  if (it == schedules_.end()) return false;
  it->second.schedule.status  = ScheduleStatus::kDisabled;
  it->second.schedule.enabled = false;
  it->second.schedule.next_run.reset();
  FLEET_LOG_INFO("Schedule disabled", {StringField("schedule_id", schedule_id)});
  return true;
}

std::optional<AdvancedSchedule> AdvancedScheduler::GetSchedule(const std::string& schedule_id) const {
  std::lock_guard lock(mutex_);
  auto            it = schedules_.find(schedule_id);
  if (it == schedules_.end()) return std::nullopt;
  return it->second.schedule;
}

std::vector<AdvancedSchedule> AdvancedScheduler::GetAllSchedules() const {
  std::lock_guard               lock(mutex_);
  std::vector<AdvancedSchedule> out;
  out.reserve(schedules_.size());
  for (const auto& [id, entry] : schedules_) {
    out.push_back(entry.schedule);
  }
  return out;
}

std::vector<AdvancedSchedule> AdvancedScheduler::GetSchedulesByStatus(ScheduleStatus status) const {
  std::lock_guard               lock(mutex_);
  std::vector<AdvancedSchedule> out;
  for (const auto& [id, entry] : schedules_) {
    if (entry.schedule.status == status) out.push_back(entry.schedule);
  }
  return out;
}

// ------------------------------------------------------------
// Timer
// ------------------------------------------------------------

void AdvancedScheduler::TimerLoop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    const auto now = util::Now();

    for (auto& [id, entry] : schedules_) {
      auto& schedule = entry.schedule;
      if (!entry.trigger || !schedule.next_run || schedule.status != ScheduleStatus::kActive) continue;
      if (*schedule.next_run > now) continue;

      const auto fire_time = *schedule.next_run;
      auto       next      = entry.trigger->NextFireTime(fire_time, now);
      while (next && *next + options_.misfire_grace < now) {
        next = entry.trigger->NextFireTime(*next, now);
      }
      schedule.next_run = next;

      if (now - fire_time > options_.misfire_grace) {
        FLEET_LOG_WARN("Schedule run missed", {StringField("schedule_id", id), StringField("scheduled", util::FormatTimestamp(fire_time))});
        continue;
      }
      if (entry.running >= options_.max_instances) {
        FLEET_LOG_WARN("Schedule at max instances, run skipped",
                       {StringField("schedule_id", id), IntField("running", entry.running)});
        continue;
      }
      if (!queue_->Enqueue(ExecutionTask{id, ExecutionKind::kScheduled, std::nullopt, fire_time})) {
        FLEET_LOG_WARN("Execution queue closed, run dropped", {StringField("schedule_id", id)});
      }
    }

    auto wake = now + options_.max_poll_interval;
    for (const auto& [id, entry] : schedules_) {
      const auto& schedule = entry.schedule;
      if (entry.trigger && schedule.next_run && schedule.status == ScheduleStatus::kActive && *schedule.next_run < wake) {
        wake = *schedule.next_run;
      }
    }

    timer_cv_.wait_until(lock, wake, [&] { return !running_ || rearm_; });
    rearm_ = false;
  }
}

void AdvancedScheduler::Dispatch(ExecutionTask task) {
  if (running_) {
    if (queue_->Enqueue(task)) return;
    FLEET_LOG_WARN("Execution queue closed, running inline", {StringField("schedule_id", task.schedule_id)});
  }
  RunPipeline(task);
}

// ------------------------------------------------------------
// Triggering
// ------------------------------------------------------------

std::vector<std::string> AdvancedScheduler::TriggerEvent(EventType type, const std::string& source, const google::protobuf::Struct& data) {
  std::vector<std::string>   triggered;
  std::vector<ExecutionTask> tasks;
  {
    std::lock_guard lock(mutex_);
    const auto      now = util::Now();

    for (auto& [id, entry] : schedules_) {
      const auto& schedule = entry.schedule;
      if (schedule.type != ScheduleType::kEvent || !schedule.event_trigger) continue;
      if (schedule.status != ScheduleStatus::kActive) continue;

      const auto& config = *schedule.event_trigger;
      if (config.event_type != type || config.event_source != source) continue;
      if (config.event_filter && !MatchesEventFilter(data, *config.event_filter)) continue;

      if (config.debounce.count() > 0 && entry.last_event && now - *entry.last_event < config.debounce) {
        FLEET_LOG_DEBUG("Event debounced", {StringField("schedule_id", id)});
        continue;
      }
      entry.last_event = now;

      tasks.push_back(ExecutionTask{id, ExecutionKind::kEvent, data, std::nullopt});
      triggered.push_back(id);
    }
  }

  FLEET_LOG_INFO("Event received", {StringField("type", ToString(type)), StringField("source", source),
                                    IntField("triggered", static_cast<int64_t>(triggered.size()))});
  for (auto& task : tasks) {
    Dispatch(std::move(task));
  }
  return triggered;
}

void AdvancedScheduler::NotifyCompletion(const std::string& schedule_id, bool success, std::optional<google::protobuf::Value> result) {
  dependency_tracker_.RecordCompletion(schedule_id, success, std::move(result));

  std::vector<ExecutionTask> tasks;
  {
    std::lock_guard lock(mutex_);
    const auto      now = util::Now();

    for (const auto& [id, entry] : schedules_) {
      const auto& schedule = entry.schedule;
      if (schedule.type != ScheduleType::kDependency || !schedule.dependency) continue;
      if (schedule.status != ScheduleStatus::kActive) continue;

      const auto& deps = schedule.dependency->depends_on;
      if (std::find(deps.begin(), deps.end(), schedule_id) == deps.end()) continue;

      const auto check = dependency_tracker_.AreDependenciesSatisfied(*schedule.dependency, now - schedule.dependency->timeout);
      if (!check.satisfied) {
        FLEET_LOG_DEBUG("Dependencies pending", {StringField("schedule_id", id), StringField("unsatisfied", Join(check.unsatisfied, ","))});
        continue;
      }
      tasks.push_back(ExecutionTask{id, ExecutionKind::kDependency, std::nullopt, std::nullopt});
    }
  }

  for (auto& task : tasks) {
    Dispatch(std::move(task));
  }
}

ExecutionOutcome AdvancedScheduler::ExecuteNow(const std::string& schedule_id, ExecutionKind kind,
                                               std::optional<google::protobuf::Struct> event_data) {
  return RunPipeline(ExecutionTask{schedule_id, kind, std::move(event_data), std::nullopt});
}

// ------------------------------------------------------------
// Firing pipeline
// ------------------------------------------------------------

void AdvancedScheduler::ReleaseInstance(const std::string& schedule_id) {
  std::lock_guard lock(mutex_);
  auto            it = schedules_.find(schedule_id);
  if (it != schedules_.end() && it->second.running > 0) --it->second.running;
}

bool AdvancedScheduler::CheckCondition(const AdvancedSchedule& schedule) {
  const auto& config = *schedule.conditional;
  if (!config.condition) return true;

  for (int attempt = 0; attempt <= config.max_retries; ++attempt) {
    try {
      if (config.condition(schedule)) return true;
    } catch (const std::exception& e) {
      FLEET_LOG_WARN("Condition check failed", {StringField("schedule_id", schedule.id), StringField("error", e.what())});
    }

    if (!config.retry_on_false) break;
    if (attempt < config.max_retries) {
      FLEET_LOG_DEBUG("Condition not met, retrying", {StringField("schedule_id", schedule.id), IntField("attempt", attempt + 1)});
      if (!WaitFor(std::chrono::duration_cast<std::chrono::milliseconds>(config.retry_interval))) return false;
    }
  }
  return false;
}

ExecutionOutcome AdvancedScheduler::RunPipeline(const ExecutionTask& task) {
  const std::string& id = task.schedule_id;

  AdvancedSchedule                          snapshot;
  std::shared_ptr<SlidingWindowRateLimiter> limiter;
  {
    std::lock_guard lock(mutex_);
    auto            it = schedules_.find(id);
    if (it == schedules_.end()) {
      FLEET_LOG_ERROR("Schedule not found", {StringField("schedule_id", id)});
      return ExecutionOutcome::kNotFound;
    }
    auto& entry = it->second;
    if (entry.schedule.status != ScheduleStatus::kActive) {
      FLEET_LOG_DEBUG("Schedule not active, skipping", {StringField("schedule_id", id), StringField("status", ToString(entry.schedule.status))});
      return ExecutionOutcome::kSkippedInactive;
    }
    if (entry.running >= options_.max_instances) {
      FLEET_LOG_WARN("Schedule at max instances, skipping", {StringField("schedule_id", id), IntField("running", entry.running)});
      return ExecutionOutcome::kSkippedMaxInstances;
    }
    ++entry.running;
    snapshot = entry.schedule;
    limiter  = entry.limiter;
  }

  struct InstanceGuard {
    AdvancedScheduler* self;
    const std::string& id;
    ~InstanceGuard() {
      self->ReleaseInstance(id);
    }
  } guard{this, id};

  auto skip = [&](ExecutionOutcome outcome) {
    observability::Metrics::Instance().RecordScheduleExecution(ToString(outcome), 0.0);
    return outcome;
  };

  // Rate limit.
  if (limiter) {
    while (!limiter->CanExecute(id)) {
      if (!snapshot.rate_limit || !snapshot.rate_limit->queue_overflow) {
        FLEET_LOG_WARN("Schedule rate limited, skipping", {StringField("schedule_id", id)});
        return skip(ExecutionOutcome::kSkippedRateLimited);
      }
      const auto wait = std::max(limiter->GetWaitTime(id), util::Seconds{1});
      FLEET_LOG_INFO("Schedule rate limited, queueing", {StringField("schedule_id", id), DurationField("wait", wait)});
      if (!WaitFor(std::chrono::duration_cast<std::chrono::milliseconds>(wait))) {
        FLEET_LOG_INFO("Rate limit wait interrupted", {StringField("schedule_id", id)});
        return skip(ExecutionOutcome::kSkippedRateLimited);
      }
    }
  }

  // Business hours.
  if (snapshot.respect_business_hours && snapshot.calendar_id) {
    if (auto calendar = GetCalendar(*snapshot.calendar_id)) {
      const auto now     = util::Now();
      const auto verdict = calendar->CanExecute(now, snapshot.workflow_id);
      if (!verdict) {
        const auto next = calendar->GetNextWorkingTime(now, snapshot.workflow_id);
        FLEET_LOG_INFO("Schedule blocked by calendar", {StringField("schedule_id", id), StringField("reason", verdict.reason.value_or("")),
                                                        StringField("next_working_time", FormatOptional(next))});
        return skip(ExecutionOutcome::kSkippedOutsideBusinessHours);
      }
    } else {
      FLEET_LOG_WARN("Schedule calendar not registered", {StringField("schedule_id", id), StringField("calendar_id", *snapshot.calendar_id)});
    }
  }

  // Condition.
  if (snapshot.conditional && !CheckCondition(snapshot)) {
    FLEET_LOG_INFO("Schedule condition not met, skipping", {StringField("schedule_id", id)});
    return skip(ExecutionOutcome::kSkippedConditionFalse);
  }

  // Dependencies of non-dependency schedules.
  if (snapshot.dependency && snapshot.type != ScheduleType::kDependency) {
    const auto check = dependency_tracker_.AreDependenciesSatisfied(*snapshot.dependency, util::Now() - snapshot.dependency->timeout);
    if (!check.satisfied) {
      FLEET_LOG_INFO("Schedule waiting for dependencies", {StringField("schedule_id", id), StringField("unsatisfied", Join(check.unsatisfied, ","))});
      return skip(ExecutionOutcome::kSkippedDependenciesUnmet);
    }
  }

  // Execute.
  if (limiter) limiter->RecordExecution(id);
  const auto execution_id = sla_monitor_.RecordStart(id, task.scheduled_time);
  const auto started      = util::Now();
  {
    std::lock_guard lock(mutex_);
    if (auto it = schedules_.find(id); it != schedules_.end()) {
      it->second.schedule.last_run = started;
      ++it->second.schedule.run_count;
      snapshot = it->second.schedule;
    }
  }

  FLEET_LOG_INFO("Executing schedule", {StringField("schedule_id", id), StringField("name", snapshot.name), StringField("kind", ToString(task.kind)),
                                        StringField("type", ToString(snapshot.type))});

  TriggerContext context{snapshot, task.kind, task.kind == ExecutionKind::kCatchUp, task.event_data, task.scheduled_time};

  bool                       success = false;
  std::optional<std::string> error;
  try {
    if (on_trigger_) on_trigger_(context);
    success = true;
  } catch (const std::exception& e) {
    error = e.what();
    FLEET_LOG_ERROR("Schedule execution failed", {StringField("schedule_id", id), StringField("error", e.what())});
  } catch (...) {
    // still a failed run: counted, SLA-recorded and reported below
    error = "non-standard exception thrown by trigger callback";
    FLEET_LOG_ERROR("Schedule execution failed", {StringField("schedule_id", id), StringField("error", *error)});
  }

  {
    std::lock_guard lock(mutex_);
    if (auto it = schedules_.find(id); it != schedules_.end()) {
      auto& schedule = it->second.schedule;
      if (success) {
        ++schedule.success_count;
        schedule.consecutive_failures = 0;
        ++schedule.consecutive_successes;
      } else {
        ++schedule.failure_count;
        ++schedule.consecutive_failures;
        schedule.consecutive_successes = 0;

        const int limit = schedule.sla ? schedule.sla->consecutive_failure_limit : options_.default_consecutive_failure_limit;
        if (limit > 0 && schedule.consecutive_failures >= limit && schedule.status == ScheduleStatus::kActive) {
          schedule.status = ScheduleStatus::kError;
          schedule.next_run.reset();
          FLEET_LOG_ERROR("Schedule moved to error after consecutive failures",
                          {StringField("schedule_id", id), IntField("consecutive_failures", schedule.consecutive_failures)});
        }
      }
      if (schedule.type == ScheduleType::kOneTime && schedule.status == ScheduleStatus::kActive) {
        schedule.status = ScheduleStatus::kCompleted;
        schedule.next_run.reset();
      }
    }
  }

  sla_monitor_.RecordCompletion(execution_id, success, snapshot.sla, error);

  const auto outcome     = success ? ExecutionOutcome::kExecuted : ExecutionOutcome::kFailed;
  const auto duration_ms = std::chrono::duration<double, std::milli>(util::Now() - started).count();
  observability::Metrics::Instance().RecordScheduleExecution(ToString(outcome), duration_ms);

  NotifyCompletion(id, success);
  return outcome;
}

// ------------------------------------------------------------
// Catch-up
// ------------------------------------------------------------

std::vector<AdvancedSchedule> AdvancedScheduler::CheckMissedRuns() const {
  std::lock_guard               lock(mutex_);
  std::vector<AdvancedSchedule> out;
  const auto                    now = util::Now();

  for (const auto& [id, entry] : schedules_) {
    const auto& schedule = entry.schedule;
    if (!schedule.catch_up || !schedule.catch_up->enabled) continue;
    if (schedule.status != ScheduleStatus::kActive || !schedule.last_run) continue;
    if (*schedule.last_run < now - schedule.catch_up->window) out.push_back(schedule);
  }
  return out;
}

int AdvancedScheduler::ExecuteCatchUp(const std::string& schedule_id) {
  CatchUpConfig config;
  {
    std::lock_guard lock(mutex_);
    auto            it = schedules_.find(schedule_id);
    if (it == schedules_.end() || !it->second.schedule.catch_up || !it->second.schedule.catch_up->enabled) return 0;
    config = *it->second.schedule.catch_up;
  }

  int executed = 0;
  if (!config.sequential && running_) {
    for (int i = 0; i < config.max_runs; ++i) {
      if (!queue_->Enqueue(ExecutionTask{schedule_id, ExecutionKind::kCatchUp, std::nullopt, std::nullopt})) break;
      ++executed;
    }
  } else {
    for (int i = 0; i < config.max_runs; ++i) {
      if (ShutdownRequested()) break;

      const auto outcome = RunPipeline(ExecutionTask{schedule_id, ExecutionKind::kCatchUp, std::nullopt, std::nullopt});
      if (outcome == ExecutionOutcome::kNotFound || outcome == ExecutionOutcome::kSkippedInactive) break;
      if (outcome == ExecutionOutcome::kExecuted || outcome == ExecutionOutcome::kFailed) ++executed;

      if (config.sequential && i + 1 < config.max_runs &&
          !WaitFor(std::chrono::duration_cast<std::chrono::milliseconds>(config.sequential_delay), true)) {
        break;
      }
    }
  }

  FLEET_LOG_INFO("Catch-up runs executed", {StringField("schedule_id", schedule_id), IntField("runs", executed)});
  return executed;
}

// ------------------------------------------------------------
// Introspection
// ------------------------------------------------------------

std::vector<UpcomingRun> AdvancedScheduler::GetUpcomingRuns(size_t limit, const std::optional<std::string>& workflow_id) const {
  std::vector<UpcomingRun> out;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : schedules_) {
      const auto& s = entry.schedule;
      if (!s.next_run || s.status != ScheduleStatus::kActive) continue;
      if (workflow_id && s.workflow_id != *workflow_id) continue;
      out.push_back(UpcomingRun{s.id, s.name, s.workflow_id, s.workflow_name, *s.next_run, s.type, s.status});
    }
  }

  std::stable_sort(out.begin(), out.end(), [](const UpcomingRun& a, const UpcomingRun& b) { return a.next_run < b.next_run; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

SlaReport AdvancedScheduler::GetSlaReport(const std::optional<std::string>& schedule_id, std::chrono::hours window) const {
  SlaReport report;
  report.generated_at = util::Now();
  report.window       = window;

  std::vector<AdvancedSchedule> schedules;
  if (schedule_id) {
    if (auto s = GetSchedule(*schedule_id)) schedules.push_back(std::move(*s));
  } else {
    schedules = GetAllSchedules();
  }

  for (const auto& s : schedules) {
    if (!s.sla) continue;

    SlaReportEntry entry;
    entry.schedule_id               = s.id;
    entry.schedule_name             = s.name;
    entry.status                    = s.GetSlaStatus();
    entry.success_rate              = sla_monitor_.GetSuccessRate(s.id, window);
    entry.success_rate_threshold    = s.sla->success_rate_threshold;
    entry.average_duration          = sla_monitor_.GetAverageDuration(s.id, window);
    entry.consecutive_failures      = s.consecutive_failures;
    entry.consecutive_successes     = s.consecutive_successes;
    entry.consecutive_failure_limit = s.sla->consecutive_failure_limit;
    entry.run_count                 = s.run_count;
    entry.success_count             = s.success_count;
    entry.failure_count             = s.failure_count;
    if (s.sla->max_duration) entry.max_duration = std::chrono::duration_cast<std::chrono::milliseconds>(*s.sla->max_duration);
    report.schedules.push_back(std::move(entry));
  }
  return report;
}

std::map<std::string, std::vector<std::string>> AdvancedScheduler::GetDependencyGraph() const {
  std::lock_guard                                 lock(mutex_);
  std::map<std::string, std::vector<std::string>> graph;
  for (const auto& [id, entry] : schedules_) {
    if (!entry.schedule.dependency) continue;
    for (const auto& dep : entry.schedule.dependency->depends_on) {
      graph[dep].push_back(id);
    }
  }
  return graph;
}

DependencyValidation AdvancedScheduler::ValidateDependencyGraph() const {
  std::lock_guard lock(mutex_);
  return scheduling::ValidateDependencyGraph(DependsOnLocked());
}

} // namespace fleet::scheduling
