#include "internal/scheduling/advanced_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/calendar/business_calendar.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono;
using namespace fleet::scheduling;

/*
  Records every trigger it sees; optionally fails.
*/
struct Recorder {
  std::mutex                  mutex;
  std::vector<TriggerContext> seen;
  std::atomic<bool>           fail{false};

  TriggerCallback Callback() {
    return [this](const TriggerContext& context) {
      {
        std::lock_guard lock(mutex);
        seen.push_back(context);
      }
      if (fail) throw std::runtime_error("robot offline");
    };
  }

  std::vector<std::string> Ids() {
    std::lock_guard          lock(mutex);
    std::vector<std::string> out;
    for (const auto& c : seen) out.push_back(c.schedule.id);
    return out;
  }

  size_t Count() {
    std::lock_guard lock(mutex);
    return seen.size();
  }
};

AdvancedSchedule Cron(const std::string& id, const std::string& expr = "@yearly") {
  AdvancedSchedule s;
  s.id              = id;
  s.name            = id + " schedule";
  s.workflow_id     = "wf-" + id;
  s.type            = ScheduleType::kCron;
  s.cron_expression = expr;
  return s;
}

AdvancedSchedule Interval(const std::string& id, seconds every) {
  AdvancedSchedule s;
  s.id          = id;
  s.workflow_id = "wf-" + id;
  s.type        = ScheduleType::kInterval;
  s.interval    = every;
  return s;
}

AdvancedSchedule DependsOn(const std::string& id, std::vector<std::string> deps, bool wait_for_all = true) {
  AdvancedSchedule s;
  s.id          = id;
  s.workflow_id = "wf-" + id;
  s.type        = ScheduleType::kDependency;
  DependencyConfig dep;
  dep.depends_on   = std::move(deps);
  dep.wait_for_all = wait_for_all;
  s.dependency     = dep;
  return s;
}

void TestAddValidation() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  assert(scheduler.AddSchedule(Cron("nightly", "@daily")));
  assert(!scheduler.AddSchedule(Cron("nightly")));
  assert(!scheduler.AddSchedule(Cron("broken", "61 * * * *")));
  assert(!scheduler.AddSchedule(Interval("zero", seconds{0})));
  assert(!scheduler.AddSchedule(Cron("")));

  AdvancedSchedule once;
  once.id   = "once";
  once.type = ScheduleType::kOneTime;
  assert(!scheduler.AddSchedule(once));

  AdvancedSchedule event;
  event.id   = "event";
  event.type = ScheduleType::kEvent;
  assert(!scheduler.AddSchedule(event));

  const auto nightly = scheduler.GetSchedule("nightly");
  assert(nightly && nightly->next_run && nightly->created_at);
  assert(*nightly->next_run > fleet::util::Now());

  auto disabled    = Cron("off");
  disabled.enabled = false;
  assert(scheduler.AddSchedule(disabled));
  assert(scheduler.GetSchedule("off")->status == ScheduleStatus::kDisabled);
  assert(!scheduler.GetSchedule("off")->next_run);
  assert(scheduler.GetSchedulesByStatus(ScheduleStatus::kDisabled).size() == 1);
}

void TestLifecycleTransitions() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());
  assert(scheduler.AddSchedule(Cron("report", "0 6 * * *")));

  assert(scheduler.PauseSchedule("report"));
  assert(scheduler.ExecuteNow("report") == ExecutionOutcome::kSkippedInactive);
  assert(scheduler.ResumeSchedule("report"));
  assert(scheduler.GetSchedule("report")->status == ScheduleStatus::kActive);
  assert(scheduler.ExecuteNow("report") == ExecutionOutcome::kExecuted);

  auto updated            = Cron("report", "0 7 * * *");
  updated.name            = "renamed";
  assert(scheduler.UpdateSchedule(updated));
  assert(scheduler.GetSchedule("report")->name == "renamed");
  assert(scheduler.GetSchedule("report")->updated_at);

  // a rejected update keeps the previous definition
  assert(!scheduler.UpdateSchedule(Cron("report", "bogus")));
  assert(scheduler.GetSchedule("report")->cron_expression == "0 7 * * *");
  assert(!scheduler.UpdateSchedule(Cron("ghost")));

  assert(scheduler.DisableSchedule("report"));
  assert(scheduler.ExecuteNow("report") == ExecutionOutcome::kSkippedInactive);

  assert(scheduler.RemoveSchedule("report"));
  assert(!scheduler.RemoveSchedule("report"));
  assert(scheduler.ExecuteNow("report") == ExecutionOutcome::kNotFound);
}

void TestExecuteNowRunsPipeline() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  auto s     = Cron("invoices");
  s.priority = 7;
  s.tags     = {"finance"};
  assert(scheduler.AddSchedule(s));

  google::protobuf::Struct data;
  (*data.mutable_fields())["file"].set_string_value("a.pdf");
  assert(scheduler.ExecuteNow("invoices", ExecutionKind::kManual, data) == ExecutionOutcome::kExecuted);

  assert(recorder.Count() == 1);
  const auto& context = recorder.seen.front();
  assert(context.kind == ExecutionKind::kManual);
  assert(!context.is_catch_up);
  assert(context.schedule.priority == 7);
  assert(context.schedule.run_count == 1);
  assert(context.event_data && context.event_data->fields().at("file").string_value() == "a.pdf");

  const auto after = scheduler.GetSchedule("invoices");
  assert(after->run_count == 1 && after->success_count == 1);
  assert(after->consecutive_successes == 1);
  assert(after->last_run);

  assert(scheduler.sla_monitor().GetMetrics("invoices").size() == 1);
  assert(scheduler.dependency_tracker().IsDependencySatisfied("invoices"));
}

void TestConsecutiveFailuresMoveToError() {
  Recorder recorder;
  recorder.fail = true;
  AdvancedScheduler scheduler(recorder.Callback());

  auto s = Cron("flaky");
  SlaConfig sla;
  sla.consecutive_failure_limit = 2;
  s.sla                         = sla;
  assert(scheduler.AddSchedule(s));

  assert(scheduler.ExecuteNow("flaky") == ExecutionOutcome::kFailed);
  assert(scheduler.GetSchedule("flaky")->status == ScheduleStatus::kActive);
  assert(scheduler.ExecuteNow("flaky") == ExecutionOutcome::kFailed);

  const auto after = scheduler.GetSchedule("flaky");
  assert(after->status == ScheduleStatus::kError);
  assert(!after->next_run);
  assert(after->failure_count == 2);
  assert(after->GetSlaStatus() == SlaStatus::kBreached);

  assert(scheduler.ExecuteNow("flaky") == ExecutionOutcome::kSkippedInactive);
  assert(recorder.Count() == 2);

  const auto failed = scheduler.sla_monitor().GetMetrics("flaky");
  assert(failed.front().error == std::string("robot offline"));
  assert(!scheduler.dependency_tracker().IsDependencySatisfied("flaky"));
}

void TestNonStandardThrowCountsAsFailure() {
  std::atomic<int>  calls{0};
  AdvancedScheduler scheduler([&](const TriggerContext&) {
    if (calls.fetch_add(1) == 0) throw 42;
  });
  assert(scheduler.AddSchedule(Cron("odd")));

  assert(scheduler.ExecuteNow("odd") == ExecutionOutcome::kFailed);
  const auto after = scheduler.GetSchedule("odd");
  assert(after->failure_count == 1);
  assert(after->consecutive_failures == 1);
  assert(after->status == ScheduleStatus::kActive);

  const auto records = scheduler.sla_monitor().GetMetrics("odd");
  assert(records.size() == 1);
  assert(records.front().error == std::string("non-standard exception thrown by trigger callback"));

  // the scheduler keeps running the schedule afterwards
  assert(scheduler.ExecuteNow("odd") == ExecutionOutcome::kExecuted);
  assert(scheduler.GetSchedule("odd")->consecutive_failures == 0);
  assert(calls == 2);
}

void TestDefaultFailureLimit() {
  Recorder recorder;
  recorder.fail = true;
  SchedulerOptions options;
  options.default_consecutive_failure_limit = 3;
  AdvancedScheduler scheduler(recorder.Callback(), options);
  assert(scheduler.AddSchedule(Cron("no-sla")));

  for (int i = 0; i < 3; ++i) {
    assert(scheduler.ExecuteNow("no-sla") == ExecutionOutcome::kFailed);
  }
  assert(scheduler.GetSchedule("no-sla")->status == ScheduleStatus::kError);
}

void TestOneTimeCompletes() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  AdvancedSchedule once;
  once.id     = "once";
  once.type   = ScheduleType::kOneTime;
  once.run_at = fleet::util::Now() + hours{1};
  assert(scheduler.AddSchedule(once));
  assert(scheduler.GetSchedule("once")->next_run == once.run_at);

  assert(scheduler.ExecuteNow("once") == ExecutionOutcome::kExecuted);
  assert(scheduler.GetSchedule("once")->status == ScheduleStatus::kCompleted);
  assert(!scheduler.GetSchedule("once")->next_run);
}

void TestRateLimitWithoutOverflowSkips() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  auto            s = Cron("limited");
  RateLimitConfig limit;
  limit.max_executions = 1;
  limit.window         = seconds{3600};
  limit.queue_overflow = false;
  s.rate_limit         = limit;
  assert(scheduler.AddSchedule(s));

  assert(scheduler.ExecuteNow("limited") == ExecutionOutcome::kExecuted);
  assert(scheduler.ExecuteNow("limited") == ExecutionOutcome::kSkippedRateLimited);
  assert(recorder.Count() == 1);
}

void TestStopInterruptsRateLimitWait() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  auto            s = Cron("queued");
  RateLimitConfig limit;
  limit.max_executions = 1;
  limit.window         = seconds{3600};
  limit.queue_overflow = true;
  s.rate_limit         = limit;
  assert(scheduler.AddSchedule(s));

  scheduler.Start();
  assert(scheduler.IsRunning());
  assert(scheduler.ExecuteNow("queued") == ExecutionOutcome::kExecuted);

  auto pending = std::async(std::launch::async, [&] { return scheduler.ExecuteNow("queued"); });
  std::this_thread::sleep_for(milliseconds(200));
  assert(pending.wait_for(milliseconds(0)) == std::future_status::timeout);

  scheduler.Stop(false);
  assert(!scheduler.IsRunning());
  assert(pending.get() == ExecutionOutcome::kSkippedRateLimited);
  assert(recorder.Count() == 1);
}

void TestBusinessHoursGate() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  auto calendar = std::make_shared<fleet::calendar::BusinessCalendar>(fleet::calendar::BusinessCalendar::Create24x7Calendar());
  fleet::calendar::BlackoutPeriod freeze;
  freeze.name              = "freeze";
  freeze.start             = fleet::util::Now() - hours{1};
  freeze.end               = fleet::util::Now() + hours{1};
  freeze.affects_workflows = {"wf-blocked"};
  calendar->AddBlackout(freeze);
  scheduler.RegisterCalendar("ops", calendar);
  assert(scheduler.GetCalendar("ops") == calendar);
  assert(!scheduler.GetCalendar("missing"));

  auto blocked                   = Cron("blocked");
  blocked.calendar_id            = "ops";
  blocked.respect_business_hours = true;
  assert(scheduler.AddSchedule(blocked));

  auto open                   = Cron("open");
  open.calendar_id            = "ops";
  open.respect_business_hours = true;
  assert(scheduler.AddSchedule(open));

  assert(scheduler.ExecuteNow("blocked") == ExecutionOutcome::kSkippedOutsideBusinessHours);
  assert(scheduler.ExecuteNow("open") == ExecutionOutcome::kExecuted);
  assert(recorder.Ids() == std::vector<std::string>{"open"});
}

void TestConditionGate() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  int  checks = 0;
  auto gated  = Cron("gated");
  ConditionalConfig condition;
  condition.condition = [&](const AdvancedSchedule& s) {
    ++checks;
    return s.metadata.count("ready") > 0;
  };
  gated.conditional = condition;
  assert(scheduler.AddSchedule(gated));
  assert(scheduler.ExecuteNow("gated") == ExecutionOutcome::kSkippedConditionFalse);
  assert(checks == 1);

  // retry until the predicate flips
  auto              retried = Cron("retried");
  ConditionalConfig retry;
  int               calls = 0;
  retry.condition         = [&](const AdvancedSchedule&) { return ++calls >= 3; };
  retry.retry_on_false    = true;
  retry.retry_interval    = seconds{0};
  retry.max_retries       = 5;
  retried.conditional     = retry;
  assert(scheduler.AddSchedule(retried));
  assert(scheduler.ExecuteNow("retried") == ExecutionOutcome::kExecuted);
  assert(calls == 3);

  // no predicate passes
  auto open        = Cron("open");
  open.conditional = ConditionalConfig{};
  assert(scheduler.AddSchedule(open));
  assert(scheduler.ExecuteNow("open") == ExecutionOutcome::kExecuted);
}

void TestDependencyGateAndTriggers() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  // a time-driven schedule gated on an upstream completion
  auto gated = Cron("publish");
  DependencyConfig gate;
  gate.depends_on  = {"upstream"};
  gated.dependency = gate;
  assert(scheduler.AddSchedule(gated));
  assert(scheduler.ExecuteNow("publish") == ExecutionOutcome::kSkippedDependenciesUnmet);
  scheduler.NotifyCompletion("upstream", true);
  assert(scheduler.ExecuteNow("publish") == ExecutionOutcome::kExecuted);

  // extract -> load fires inline when the scheduler is not running
  assert(scheduler.AddSchedule(Cron("extract")));
  assert(scheduler.AddSchedule(DependsOn("load", {"extract"})));
  assert(scheduler.ExecuteNow("extract") == ExecutionOutcome::kExecuted);
  auto ids = recorder.Ids();
  assert((ids == std::vector<std::string>{"publish", "extract", "load"}));
  assert(recorder.seen.back().kind == ExecutionKind::kDependency);

  // wait for all
  assert(scheduler.AddSchedule(DependsOn("merge", {"left", "right"})));
  scheduler.NotifyCompletion("left", true);
  assert(recorder.Count() == 3);
  scheduler.NotifyCompletion("right", false);
  assert(recorder.Count() == 3);
  scheduler.NotifyCompletion("right", true);
  assert(recorder.Count() == 4);
  assert(recorder.Ids().back() == "merge");

  // any
  assert(scheduler.AddSchedule(DependsOn("either", {"p", "q"}, false)));
  scheduler.NotifyCompletion("q", true);
  assert(recorder.Ids().back() == "either");

  const auto graph = scheduler.GetDependencyGraph();
  assert(graph.at("extract") == std::vector<std::string>{"load"});
  assert(graph.at("upstream") == std::vector<std::string>{"publish"});
  assert(scheduler.ValidateDependencyGraph().valid);
}

void TestDependencyCycleRejected() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  assert(scheduler.AddSchedule(DependsOn("a", {"b"})));
  assert(!scheduler.AddSchedule(DependsOn("b", {"a"})));
  assert(!scheduler.AddSchedule(DependsOn("self", {"self"})));
  assert(scheduler.AddSchedule(DependsOn("b", {"c"})));
  assert(scheduler.ValidateDependencyGraph().valid);
}

void TestTriggerEvent() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  AdvancedSchedule ingest;
  ingest.id          = "ingest";
  ingest.workflow_id = "wf-ingest";
  ingest.type        = ScheduleType::kEvent;
  EventTriggerConfig trigger;
  trigger.event_type   = EventType::kFileArrival;
  trigger.event_source = "sftp";
  google::protobuf::Struct filter;
  (*filter.mutable_fields())["ext"].set_string_value("pdf");
  trigger.event_filter = filter;
  trigger.debounce     = seconds{3600};
  ingest.event_trigger = trigger;
  assert(scheduler.AddSchedule(ingest));
  assert(!scheduler.GetSchedule("ingest")->next_run);

  google::protobuf::Struct pdf;
  (*pdf.mutable_fields())["ext"].set_string_value("pdf");
  google::protobuf::Struct csv;
  (*csv.mutable_fields())["ext"].set_string_value("csv");

  assert(scheduler.TriggerEvent(EventType::kFileArrival, "sftp", csv).empty());
  assert(scheduler.TriggerEvent(EventType::kFileArrival, "s3", pdf).empty());
  assert(scheduler.TriggerEvent(EventType::kWebhook, "sftp", pdf).empty());
  // missing data never satisfies a filter
  assert(scheduler.TriggerEvent(EventType::kFileArrival, "sftp").empty());

  assert(scheduler.TriggerEvent(EventType::kFileArrival, "sftp", pdf) == std::vector<std::string>{"ingest"});
  assert(recorder.Count() == 1);
  assert(recorder.seen.front().kind == ExecutionKind::kEvent);
  assert(recorder.seen.front().event_data->fields().at("ext").string_value() == "pdf");

  // debounced
  assert(scheduler.TriggerEvent(EventType::kFileArrival, "sftp", pdf).empty());

  assert(scheduler.PauseSchedule("ingest"));
  assert(scheduler.TriggerEvent(EventType::kFileArrival, "sftp", pdf).empty());
  assert(recorder.Count() == 1);
}

void TestCatchUp() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  auto          s = Cron("ledger");
  CatchUpConfig catch_up;
  catch_up.enabled          = true;
  catch_up.max_runs         = 3;
  catch_up.window           = hours{24};
  catch_up.sequential       = true;
  catch_up.sequential_delay = seconds{0};
  s.catch_up                = catch_up;
  s.last_run                = fleet::util::Now() - hours{48};
  assert(scheduler.AddSchedule(s));

  auto recent     = Cron("recent");
  recent.catch_up = catch_up;
  recent.last_run = fleet::util::Now() - hours{1};
  assert(scheduler.AddSchedule(recent));

  const auto missed = scheduler.CheckMissedRuns();
  assert(missed.size() == 1);
  assert(missed.front().id == "ledger");

  assert(scheduler.ExecuteCatchUp("ledger") == 3);
  assert(recorder.Count() == 3);
  for (const auto& context : recorder.seen) {
    assert(context.is_catch_up);
    assert(context.kind == ExecutionKind::kCatchUp);
  }
  assert(scheduler.ExecuteCatchUp("missing") == 0);
  assert(scheduler.CheckMissedRuns().empty());
}

void TestUpcomingRunsAndSlaReport() {
  Recorder          recorder;
  AdvancedScheduler scheduler(recorder.Callback());

  auto slow        = Interval("slow", seconds{600});
  slow.workflow_id = "shared";
  assert(scheduler.AddSchedule(slow));
  auto fast        = Interval("fast", seconds{60});
  fast.workflow_id = "shared";
  assert(scheduler.AddSchedule(fast));
  assert(scheduler.AddSchedule(Cron("yearly")));
  assert(scheduler.AddSchedule(DependsOn("after", {"fast"})));

  auto upcoming = scheduler.GetUpcomingRuns();
  assert(upcoming.size() == 3);
  assert(upcoming[0].schedule_id == "fast");
  assert(upcoming[1].schedule_id == "slow");
  assert(upcoming[2].schedule_id == "yearly");

  assert(scheduler.GetUpcomingRuns(1).size() == 1);
  assert(scheduler.GetUpcomingRuns(20, std::string("shared")).size() == 2);

  auto      tracked = Cron("tracked");
  SlaConfig sla;
  sla.max_duration = seconds{60};
  tracked.sla      = sla;
  assert(scheduler.AddSchedule(tracked));

  assert(scheduler.ExecuteNow("tracked") == ExecutionOutcome::kExecuted);
  recorder.fail = true;
  assert(scheduler.ExecuteNow("tracked") == ExecutionOutcome::kFailed);

  const auto report = scheduler.GetSlaReport();
  assert(report.schedules.size() == 1);
  const auto& entry = report.schedules.front();
  assert(entry.schedule_id == "tracked");
  assert(entry.run_count == 2 && entry.success_count == 1 && entry.failure_count == 1);
  assert(entry.success_rate == 50.0);
  assert(entry.status == SlaStatus::kBreached);
  assert(entry.max_duration == milliseconds{60000});
  assert(entry.consecutive_failures == 1);

  assert(scheduler.GetSlaReport(std::string("fast")).schedules.empty());
  assert(scheduler.GetSlaReport(std::string("nope")).schedules.empty());
}

void TestTimerFiresIntervalSchedule() {
  Recorder          recorder;
  SchedulerOptions  options;
  options.executor_threads  = 2;
  options.max_poll_interval = milliseconds(100);
  AdvancedScheduler scheduler(recorder.Callback(), options);

  assert(scheduler.AddSchedule(Interval("tick", seconds{1})));
  scheduler.Start();

  const auto deadline = steady_clock::now() + seconds{5};
  while (recorder.Count() < 2 && steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(50));
  }
  scheduler.Stop(true);

  assert(recorder.Count() >= 2);
  assert(recorder.seen.front().kind == ExecutionKind::kScheduled);
  assert(recorder.seen.front().scheduled_time);
  assert(scheduler.GetSchedule("tick")->run_count >= 2);
}

} // namespace

int main() {
  TestAddValidation();
  TestLifecycleTransitions();
  TestExecuteNowRunsPipeline();
  TestConsecutiveFailuresMoveToError();
  TestNonStandardThrowCountsAsFailure();
  TestDefaultFailureLimit();
  TestOneTimeCompletes();
  TestRateLimitWithoutOverflowSkips();
  TestStopInterruptsRateLimitWait();
  TestBusinessHoursGate();
  TestConditionGate();
  TestDependencyGateAndTriggers();
  TestDependencyCycleRejected();
  TestTriggerEvent();
  TestCatchUp();
  TestUpcomingRunsAndSlaReport();
  TestTimerFiresIntervalSchedule();

  std::cout << "fleet_unit_advanced_scheduler: pass\n";
  return 0;
}
