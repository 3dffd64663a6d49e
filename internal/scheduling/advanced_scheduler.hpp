#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/calendar/business_calendar.hpp"
#include "internal/scheduling/dependency_tracker.hpp"
#include "internal/scheduling/execution_queue.hpp"
#include "internal/scheduling/execution_task.hpp"
#include "internal/scheduling/execution_worker.hpp"
#include "internal/scheduling/rate_limiter.hpp"
#include "internal/scheduling/schedule.hpp"
#include "internal/scheduling/sla_monitor.hpp"
#include "internal/scheduling/trigger.hpp"
#include "internal/util/time.hpp"

namespace fleet::scheduling {

struct SchedulerOptions {
  size_t                    executor_threads{4};
  int                       max_instances{3};
  util::Seconds             misfire_grace{300};
  std::chrono::milliseconds max_poll_interval{1000};
  int                       default_consecutive_failure_limit{5};
};

enum class ExecutionOutcome {
  kExecuted,
  kFailed,
  kSkippedInactive,
  kSkippedRateLimited,
  kSkippedOutsideBusinessHours,
  kSkippedConditionFalse,
  kSkippedDependenciesUnmet,
  kSkippedMaxInstances,
  kNotFound,
};

std::string_view ToString(ExecutionOutcome outcome);

// What the trigger callback sees for one run.
struct TriggerContext {
  AdvancedSchedule                        schedule;
  ExecutionKind                           kind{ExecutionKind::kScheduled};
  bool                                    is_catch_up{false};
  std::optional<google::protobuf::Struct> event_data;
  std::optional<util::TimePoint>          scheduled_time;
};

// A thrown exception counts as a failed run.
using TriggerCallback = std::function<void(const TriggerContext&)>;

struct UpcomingRun {
  std::string     schedule_id;
  std::string     schedule_name;
  std::string     workflow_id;
  std::string     workflow_name;
  util::TimePoint next_run;
  ScheduleType    type;
  ScheduleStatus  status;
};

struct SlaReportEntry {
  std::string                              schedule_id;
  std::string                              schedule_name;
  SlaStatus                                status{SlaStatus::kUnknown};
  double                                   success_rate{100.0};
  double                                   success_rate_threshold{0.0};
  std::chrono::milliseconds                average_duration{0};
  std::optional<std::chrono::milliseconds> max_duration;
  int                                      consecutive_failures{0};
  int                                      consecutive_successes{0};
  int                                      consecutive_failure_limit{0};
  int64_t                                  run_count{0};
  int64_t                                  success_count{0};
  int64_t                                  failure_count{0};
};

struct SlaReport {
  util::TimePoint             generated_at;
  std::chrono::hours          window{24};
  std::vector<SlaReportEntry> schedules;
};

/*
  AdvancedScheduler

  Owns the schedules and the trigger loop.

  A timer thread sleeps until the earliest next_run (bounded by
  max_poll_interval), applies misfire grace and max_instances, and
  enqueues due runs. Execution workers take runs off the queue and push
  each through the firing pipeline:

      status -> rate limit -> business hours -> condition
             -> dependencies -> callback -> SLA + dependency tracking

  Event and dependency runs go through the same queue while running and
  execute inline on the caller's thread otherwise. ExecuteNow always runs
  inline.

  Schedules may be added before Start(). Thread-safe.
*/
class AdvancedScheduler {
 public:
  explicit AdvancedScheduler(TriggerCallback on_trigger, SchedulerOptions options = {});
  ~AdvancedScheduler();

  AdvancedScheduler(const AdvancedScheduler&)            = delete;
  AdvancedScheduler& operator=(const AdvancedScheduler&) = delete;

  void Start();

  // wait=true drains queued runs; wait=false drops them and interrupts
  // pending backoff / retry waits. Running callbacks always finish.
  void Stop(bool wait = true);

  bool IsRunning() const;

  void                                        RegisterCalendar(const std::string& calendar_id, std::shared_ptr<calendar::BusinessCalendar> calendar);
  std::shared_ptr<calendar::BusinessCalendar> GetCalendar(const std::string& calendar_id) const;

  // False (with the reason logged) for duplicates and invalid definitions.
  bool AddSchedule(AdvancedSchedule schedule);
  bool RemoveSchedule(const std::string& schedule_id);
  bool UpdateSchedule(AdvancedSchedule schedule);
  bool PauseSchedule(const std::string& schedule_id);
  bool ResumeSchedule(const std::string& schedule_id);
  bool DisableSchedule(const std::string& schedule_id);

  std::optional<AdvancedSchedule> GetSchedule(const std::string& schedule_id) const;
  std::vector<AdvancedSchedule>   GetAllSchedules() const;
  std::vector<AdvancedSchedule>   GetSchedulesByStatus(ScheduleStatus status) const;

  // Ids of the event schedules that matched and were dispatched.
  std::vector<std::string> TriggerEvent(EventType type, const std::string& source, const google::protobuf::Struct& data = {});

  void NotifyCompletion(const std::string& schedule_id, bool success, std::optional<google::protobuf::Value> result = std::nullopt);

  ExecutionOutcome ExecuteNow(const std::string& schedule_id, ExecutionKind kind = ExecutionKind::kManual,
                              std::optional<google::protobuf::Struct> event_data = std::nullopt);

  std::vector<AdvancedSchedule> CheckMissedRuns() const;

  // Number of catch-up runs executed (or enqueued, for parallel catch-up).
  int ExecuteCatchUp(const std::string& schedule_id);

  // Ascending by next_run.
  std::vector<UpcomingRun> GetUpcomingRuns(size_t limit = 20, const std::optional<std::string>& workflow_id = std::nullopt) const;

  SlaReport GetSlaReport(const std::optional<std::string>& schedule_id = std::nullopt,
                         std::chrono::hours window = std::chrono::hours{24}) const;

  // dependency -> dependents
  std::map<std::string, std::vector<std::string>> GetDependencyGraph() const;

  DependencyValidation ValidateDependencyGraph() const;

  SlaMonitor& sla_monitor() {
    return sla_monitor_;
  }

  DependencyTracker& dependency_tracker() {
    return dependency_tracker_;
  }

  const SchedulerOptions& options() const {
    return options_;
  }

 private:
  struct Entry {
    AdvancedSchedule                          schedule;
    std::unique_ptr<Trigger>                  trigger;
    std::shared_ptr<SlidingWindowRateLimiter> limiter;
    int                                       running{0};
    std::optional<util::TimePoint>            last_event;
  };

  bool ValidateLocked(const AdvancedSchedule& schedule) const;
  bool InsertLocked(AdvancedSchedule schedule, util::TimePoint now);
  std::map<std::string, std::vector<std::string>> DependsOnLocked() const;

  void TimerLoop();
  void Dispatch(ExecutionTask task);
  ExecutionOutcome RunPipeline(const ExecutionTask& task);
  bool CheckCondition(const AdvancedSchedule& schedule);
  void ReleaseInstance(const std::string& schedule_id);

  // False when interrupted by Stop(false) (or any Stop, if on_shutdown).
  bool WaitFor(std::chrono::milliseconds duration, bool on_shutdown = false);
  bool ShutdownRequested();

  TriggerCallback  on_trigger_;
  SchedulerOptions options_;

  mutable std::mutex                                                  mutex_;
  std::condition_variable                                             timer_cv_;
  std::map<std::string, Entry>                                        schedules_;
  std::map<std::string, std::shared_ptr<calendar::BusinessCalendar>> calendars_;
  bool                                                                rearm_{false};

  DependencyTracker dependency_tracker_;
  SlaMonitor        sla_monitor_;

  std::shared_ptr<ExecutionQueue>               queue_;
  std::vector<std::unique_ptr<ExecutionWorker>> workers_;
  std::thread                                   timer_thread_;
  std::atomic<bool>                             running_{false};

  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
  bool                    cancel_waits_{false};
  bool                    shutdown_requested_{false};
};

} // namespace fleet::scheduling
