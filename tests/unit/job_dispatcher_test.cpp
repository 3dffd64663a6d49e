#include "internal/dispatch/job_dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using fleet::affinity::StateAffinityLevel;
using fleet::affinity::StateAffinityManager;
using fleet::affinity::StateAffinityOptions;
using fleet::assignment::JobAssignmentEngine;
using fleet::dispatch::DispatchOptions;
using fleet::dispatch::JobDispatcher;
using fleet::dispatch::JobSink;
using fleet::dispatch::JobSubmission;
using fleet::dispatch::StaticRobotInventory;
using fleet::model::RobotInfo;
using fleet::model::RobotStatus;
using fleet::scheduling::AdvancedSchedule;
using fleet::scheduling::ExecutionKind;
using fleet::scheduling::TriggerContext;

class RecordingSink : public JobSink {
 public:
  void Submit(const JobSubmission& job) override {
    std::lock_guard lock(mutex_);
    if (reject_) throw std::runtime_error("orchestrator rejected job");
    jobs_.push_back(job);
  }

  void Reject(bool reject) {
    std::lock_guard lock(mutex_);
    reject_ = reject;
  }

  std::vector<JobSubmission> Jobs() const {
    std::lock_guard lock(mutex_);
    return jobs_;
  }

 private:
  mutable std::mutex         mutex_;
  bool                       reject_{false};
  std::vector<JobSubmission> jobs_;
};

RobotInfo MakeRobot(const std::string& id, double cpu) {
  RobotInfo robot;
  robot.id                  = id;
  robot.name                = "Robot " + id;
  robot.cpu_percent         = cpu;
  robot.memory_percent      = 20.0;
  robot.max_concurrent_jobs = 4;
  return robot;
}

/*
  Two robots: "a" is loaded, "b" is idle.
*/
struct Fixture {
  std::shared_ptr<StateAffinityManager> affinity;
  std::shared_ptr<JobAssignmentEngine>  engine;
  std::shared_ptr<StaticRobotInventory> inventory;
  std::shared_ptr<RecordingSink>        sink;
  std::unique_ptr<JobDispatcher>        dispatcher;

  explicit Fixture(StateAffinityLevel level = StateAffinityLevel::kNone, StateAffinityOptions options = {}) {
    affinity  = std::make_shared<StateAffinityManager>(options);
    engine    = std::make_shared<JobAssignmentEngine>(fleet::assignment::ScoringWeights{}, affinity);
    inventory = std::make_shared<StaticRobotInventory>(std::vector<RobotInfo>{MakeRobot("a", 90.0), MakeRobot("b", 10.0)});
    sink      = std::make_shared<RecordingSink>();

    DispatchOptions dispatch_options;
    dispatch_options.default_affinity_level = level;
    dispatcher = std::make_unique<JobDispatcher>(inventory, engine, affinity, sink, dispatch_options);
  }
};

TriggerContext Fire(const std::string& schedule_id, const std::string& workflow_id = "wf-invoices") {
  TriggerContext context;
  context.schedule.id            = schedule_id;
  context.schedule.name          = schedule_id + " schedule";
  context.schedule.workflow_id   = workflow_id;
  context.schedule.workflow_name = "Invoices";
  context.schedule.priority      = 5;
  context.schedule.tags          = {"finance"};
  context.kind                   = ExecutionKind::kScheduled;
  return context;
}

void TestConstructorRejectsMissingCollaborators() {
  Fixture fx;
  bool    threw = false;
  try {
    JobDispatcher broken(nullptr, fx.engine, fx.affinity, fx.sink);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestNoneLevelPicksBestScore() {
  Fixture fx(StateAffinityLevel::kNone);
  fx.affinity->RegisterState("a", "wf-invoices", "browser_session");

  const auto result = fx.dispatcher->Dispatch(Fire("nightly"));
  assert(result.robot_id == "b");
  assert(result.affinity_level == StateAffinityLevel::kNone);
  assert(fleet::util::ParseIdKind(result.job_id) == fleet::util::IdKind::kJob);
  assert(!fleet::util::ParseIdKind("job-not-a-uuid"));

  const auto jobs = fx.sink->Jobs();
  assert(jobs.size() == 1);
  const auto& job = jobs.front();
  assert(job.job_id == result.job_id);
  assert(job.robot_id == "b");
  assert(job.schedule_id == "nightly");
  assert(job.workflow_name == "Invoices");
  assert(job.priority == 5);
  assert(job.tags == std::vector<std::string>{"finance"});

  // NONE never registers state
  assert(!fx.affinity->HasStateFor("b", "wf-invoices"));
}

void TestSoftLevelStaysWithStateHolder() {
  Fixture fx(StateAffinityLevel::kSoft);
  fx.affinity->RegisterState("a", "wf-invoices", "browser_session");

  const auto result = fx.dispatcher->Dispatch(Fire("nightly"));
  assert(result.robot_id == "a");
  assert(result.affinity_reason == "Selected robot with existing state");

  // per-schedule override back to NONE
  auto context                                = Fire("adhoc");
  context.schedule.metadata["affinity_level"] = "none";
  assert(fx.dispatcher->Dispatch(context).robot_id == "b");

  context.schedule.metadata["affinity_level"] = "sticky";
  bool threw                                  = false;
  try {
    fx.dispatcher->Dispatch(context);
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSoftLevelRegistersStateOnFirstRun() {
  Fixture fx(StateAffinityLevel::kSoft);

  auto context                            = Fire("nightly");
  context.schedule.metadata["state_type"] = "file_system";
  const auto first                        = fx.dispatcher->Dispatch(context);
  assert(first.robot_id == "b");

  const auto states = fx.affinity->GetStateForRobot("b", "wf-invoices");
  assert(states.size() == 1);
  assert(states.front().state_type == "file_system");

  // b is now the holder even if it gets busier than a
  auto b        = MakeRobot("b", 95.0);
  fx.inventory->Upsert(b);
  assert(fx.dispatcher->Dispatch(context).robot_id == "b");
  assert(fx.affinity->GetStateForRobot("b", "wf-invoices").size() == 1);
}

void TestHardLevelFirstRunThenQueue() {
  StateAffinityOptions options;
  options.hard_affinity_queue_delay = std::chrono::seconds{30};
  options.max_queue_attempts        = 2;
  Fixture fx(StateAffinityLevel::kHard, options);

  // nothing held yet: any robot may take the first run
  const auto first = fx.dispatcher->Dispatch(Fire("hard"));
  assert(first.robot_id == "b");
  assert(first.affinity_reason == "No state exists yet, allowing any robot for initial execution");
  assert(fx.affinity->HasStateFor("b", "wf-invoices"));

  assert(fx.dispatcher->Dispatch(Fire("hard")).robot_id == "b");

  auto offline   = MakeRobot("b", 10.0);
  offline.status = RobotStatus::kOffline;
  fx.inventory->Upsert(offline);

  for (int attempt = 1; attempt <= 2; ++attempt) {
    bool queued = false;
    try {
      fx.dispatcher->Dispatch(Fire("hard"));
    } catch (const fleet::util::ResourceExhausted& e) {
      queued = std::string(e.what()).find("must wait") != std::string::npos;
    }
    assert(queued);
    assert(fx.affinity->QueueAttempts("hard") == attempt);
  }

  bool exhausted = false;
  try {
    fx.dispatcher->Dispatch(Fire("hard"));
  } catch (const fleet::util::SessionAffinityError& e) {
    exhausted = e.workflow_id() == "wf-invoices";
  }
  assert(exhausted);
  assert(fx.sink->Jobs().size() == 2);
}

void TestSessionPinsRobot() {
  Fixture fx(StateAffinityLevel::kSession);

  const auto first = fx.dispatcher->Dispatch(Fire("chain"));
  assert(first.robot_id == "b");
  assert(fx.affinity->GetSessionRobot("wf-invoices") == std::string("b"));

  // the session holds even when b is no longer the best score
  fx.inventory->Upsert(MakeRobot("b", 80.0));
  fx.inventory->Upsert(MakeRobot("a", 5.0));
  assert(fx.dispatcher->Dispatch(Fire("chain")).robot_id == "b");

  auto full         = MakeRobot("b", 80.0);
  full.current_jobs = full.max_concurrent_jobs;
  fx.inventory->Upsert(full);

  bool threw = false;
  try {
    fx.dispatcher->Dispatch(Fire("chain"));
  } catch (const fleet::util::SessionAffinityError& e) {
    threw = e.robot_id() == "b";
  }
  assert(threw);

  assert(fx.affinity->EndSession("wf-invoices"));
  assert(fx.dispatcher->Dispatch(Fire("chain")).robot_id == "a");
}

void TestScheduleRobotRestrictsCandidates() {
  Fixture fx;
  auto    context          = Fire("pinned");
  context.schedule.robot_id = "a";
  assert(fx.dispatcher->Dispatch(context).robot_id == "a");

  context.schedule.robot_id = "ghost";
  bool threw                = false;
  try {
    fx.dispatcher->Dispatch(context);
  } catch (const fleet::util::NoCapableRobotError&) {
    threw = true;
  }
  assert(threw);
}

void TestEnvironmentFilter() {
  Fixture fx;
  auto    prod     = MakeRobot("p", 0.0);
  prod.environment = "production";
  fx.inventory->Upsert(prod);
  assert(fx.inventory->Snapshot().size() == 3);

  auto context                             = Fire("prod-only");
  context.schedule.metadata["environment"] = "production";
  assert(fx.dispatcher->Dispatch(context).robot_id == "p");

  // p scores best but is fenced into production
  context.schedule.metadata["environment"] = "staging";
  assert(fx.dispatcher->Dispatch(context).robot_id == "b");

  // default-environment robots take the work once p is gone
  assert(fx.inventory->Remove("p"));
  assert(!fx.inventory->Remove("p"));
  context.schedule.metadata["environment"] = "production";
  assert(fx.dispatcher->Dispatch(context).robot_id == "b");

  // nothing available at all
  auto a         = MakeRobot("a", 90.0);
  a.status       = RobotStatus::kMaintenance;
  auto b         = MakeRobot("b", 10.0);
  b.current_jobs = b.max_concurrent_jobs;
  fx.inventory->Upsert(a);
  fx.inventory->Upsert(b);
  bool threw = false;
  try {
    fx.dispatcher->Dispatch(context);
  } catch (const fleet::util::NoCapableRobotError&) {
    threw = true;
  }
  assert(threw);
}

void TestEventDataAndCatchUpReachSink() {
  Fixture fx;

  auto context = Fire("ingest");
  (*context.schedule.variables.mutable_fields())["folder"].set_string_value("/inbox");
  google::protobuf::Struct event;
  (*event.mutable_fields())["file"].set_string_value("a.pdf");
  context.event_data  = event;
  context.kind        = ExecutionKind::kCatchUp;
  context.is_catch_up = true;

  fx.dispatcher->Dispatch(context);
  const auto job = fx.sink->Jobs().front();
  assert(job.kind == ExecutionKind::kCatchUp);
  assert(job.is_catch_up);
  assert(job.variables.fields().at("folder").string_value() == "/inbox");
  assert(job.variables.fields().at("event").struct_value().fields().at("file").string_value() == "a.pdf");
}

void TestSinkRejectionPropagates() {
  Fixture fx(StateAffinityLevel::kSoft);
  fx.sink->Reject(true);

  bool threw = false;
  try {
    fx.dispatcher->Dispatch(Fire("nightly"));
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "orchestrator rejected job";
  }
  assert(threw);
  // no state for a job that never ran
  assert(fx.affinity->GetRobotsWithState("wf-invoices").empty());
  assert(fx.dispatcher->InFlightJobs() == 0);
}

void TestOutcomeRecordedOnCompletion() {
  Fixture fx;

  const auto first = fx.dispatcher->Dispatch(Fire("nightly"));
  // accepted is not finished
  assert(fx.engine->GetAssignmentStats().tracked_workflows == 0);
  assert(fx.dispatcher->InFlightJobs() == 1);

  assert(fx.dispatcher->CompleteJob(first.job_id, true));
  assert(fx.engine->GetAssignmentStats().tracked_workflows == 1);
  assert(fx.dispatcher->InFlightJobs() == 0);
  assert(!fx.dispatcher->CompleteJob(first.job_id, true));
  assert(!fx.dispatcher->CompleteJob("job-unknown", false));

  const auto second = fx.dispatcher->Dispatch(Fire("nightly", "wf-payroll"));
  assert(fx.dispatcher->CompleteJob(second.job_id, false));
  assert(fx.engine->GetAssignmentStats().tracked_workflows == 1);
}

void TestCallbackThroughScheduler() {
  Fixture                          fx;
  fleet::scheduling::AdvancedScheduler scheduler(fx.dispatcher->AsCallback());

  AdvancedSchedule schedule;
  schedule.id              = "nightly";
  schedule.workflow_id     = "wf-invoices";
  schedule.type            = fleet::scheduling::ScheduleType::kCron;
  schedule.cron_expression = "@daily";
  assert(scheduler.AddSchedule(schedule));

  assert(scheduler.ExecuteNow("nightly") == fleet::scheduling::ExecutionOutcome::kExecuted);
  assert(fx.sink->Jobs().size() == 1);
  assert(fx.sink->Jobs().front().kind == ExecutionKind::kManual);

  fx.sink->Reject(true);
  assert(scheduler.ExecuteNow("nightly") == fleet::scheduling::ExecutionOutcome::kFailed);
  assert(scheduler.GetSchedule("nightly")->failure_count == 1);
}

} // namespace

int main() {
  TestConstructorRejectsMissingCollaborators();
  TestNoneLevelPicksBestScore();
  TestSoftLevelStaysWithStateHolder();
  TestSoftLevelRegistersStateOnFirstRun();
  TestHardLevelFirstRunThenQueue();
  TestSessionPinsRobot();
  TestScheduleRobotRestrictsCandidates();
  TestEnvironmentFilter();
  TestEventDataAndCatchUpReachSink();
  TestSinkRejectionPropagates();
  TestOutcomeRecordedOnCompletion();
  TestCallbackThroughScheduler();

  std::cout << "fleet_unit_job_dispatcher: pass\n";
  return 0;
}
