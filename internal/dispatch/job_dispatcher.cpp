#include "job_dispatcher.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace fleet::dispatch {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

JobDispatcher::JobDispatcher(std::shared_ptr<RobotInventory> inventory, std::shared_ptr<assignment::JobAssignmentEngine> engine,
                             std::shared_ptr<affinity::StateAffinityManager> affinity, std::shared_ptr<JobSink> sink, DispatchOptions options)
    : inventory_(std::move(inventory)), engine_(std::move(engine)), affinity_(std::move(affinity)), sink_(std::move(sink)), options_(std::move(options)) {
  if (!inventory_ || !engine_ || !affinity_ || !sink_) {
    throw std::invalid_argument("JobDispatcher: inventory, engine, affinity manager and sink are required");
  }
}

affinity::StateAffinityLevel JobDispatcher::LevelFor(const scheduling::AdvancedSchedule& schedule) const {
  auto it = schedule.metadata.find("affinity_level");
  if (it == schedule.metadata.end()) return options_.default_affinity_level;

  const auto level = affinity::ParseAffinityLevel(it->second);
  if (!level) throw util::InvalidArgument("schedule '" + schedule.id + "': unknown affinity_level '" + it->second + "'");
  return *level;
}

model::JobRequirements JobDispatcher::BuildRequirements(const scheduling::AdvancedSchedule& schedule, affinity::StateAffinityLevel level) const {
  model::JobRequirements req;
  req.workflow_id        = schedule.workflow_id;
  req.workflow_name      = schedule.workflow_name.empty() ? schedule.name : schedule.workflow_name;
  req.preferred_tags     = schedule.tags;
  req.priority           = schedule.priority;
  req.requires_state     = level != affinity::StateAffinityLevel::kNone;
  req.preferred_robot_id = schedule.robot_id;

  auto env = schedule.metadata.find("environment");
  if (env != schedule.metadata.end()) req.environment = env->second;
  return req;
}

DispatchResult JobDispatcher::Dispatch(const scheduling::TriggerContext& context) {
  const auto& schedule = context.schedule;
  const auto  level    = LevelFor(schedule);
  const auto  req      = BuildRequirements(schedule, level);

  auto robots = inventory_->Snapshot();
  if (schedule.robot_id) {
    robots.erase(std::remove_if(robots.begin(), robots.end(), [&](const model::RobotInfo& r) { return r.id != *schedule.robot_id; }),
                 robots.end());
  }

  const auto scorer = [this, &req](const model::RobotInfo& robot) { return engine_->Score(robot, req, options_.orchestrator_zone).score; };

  // HARD queue attempts accumulate per schedule.
  const auto decision = affinity_->SelectRobot(schedule.workflow_id, level, robots, schedule.id, scorer);
  if (decision.should_queue) {
    throw util::ResourceExhausted("workflow '" + schedule.workflow_id + "' must wait " + std::to_string(decision.queue_delay.count()) +
                                  "s: " + decision.decision_reason);
  }

  const bool pinned = decision.selected_robot_id && (decision.has_state || decision.session_id);
  if (pinned) {
    robots.erase(
        std::remove_if(robots.begin(), robots.end(), [&](const model::RobotInfo& r) { return r.id != *decision.selected_robot_id; }),
        robots.end());
  }

  DispatchResult result;
  result.assignment      = engine_->AssignJob(req, robots, options_.orchestrator_zone);
  result.robot_id        = result.assignment.robot_id;
  result.affinity_level  = level;
  result.affinity_reason = decision.decision_reason;
  result.job_id          = util::GenerateId(util::IdKind::kJob);

  JobSubmission job;
  job.job_id         = result.job_id;
  job.schedule_id    = schedule.id;
  job.schedule_name  = schedule.name;
  job.workflow_id    = schedule.workflow_id;
  job.workflow_name  = req.workflow_name;
  job.robot_id       = result.robot_id;
  job.priority       = schedule.priority;
  job.kind           = context.kind;
  job.is_catch_up    = context.is_catch_up;
  job.scheduled_time = context.scheduled_time;
  job.variables      = schedule.variables;
  job.tags           = schedule.tags;
  if (context.event_data) {
    (*job.variables.mutable_fields())["event"].mutable_struct_value()->CopyFrom(*context.event_data);
  }

  {
    std::lock_guard lock(mutex_);
    in_flight_[result.job_id] = InFlightJob{schedule.workflow_id, result.robot_id};
  }

  try {
    sink_->Submit(job);
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      in_flight_.erase(result.job_id);
    }
    engine_->RecordJobCompletion(schedule.workflow_id, result.robot_id, false);
    FLEET_LOG_WARN("Job submission rejected", {StringField("schedule_id", schedule.id), StringField("robot_id", result.robot_id),
                                               StringField("error", e.what())});
    throw;
  }

  if (level != affinity::StateAffinityLevel::kNone && !affinity_->TouchState(result.robot_id, schedule.workflow_id)) {
    auto state_type = schedule.metadata.find("state_type");
    affinity_->RegisterState(result.robot_id, schedule.workflow_id,
                             state_type != schedule.metadata.end() ? state_type->second : std::string(affinity::state_type::kCustom));
  }

  FLEET_LOG_INFO("Job dispatched", {StringField("job_id", result.job_id), StringField("schedule_id", schedule.id),
                                    StringField("robot_id", result.robot_id), StringField("affinity", affinity::ToString(level)),
                                    DoubleField("score", result.assignment.score), IntField("candidates", static_cast<int64_t>(result.assignment.candidates))});
  return result;
}

bool JobDispatcher::CompleteJob(const std::string& job_id, bool success) {
  InFlightJob job;
  {
    std::lock_guard lock(mutex_);
    auto            it = in_flight_.find(job_id);
    if (it == in_flight_.end()) return false;
    job = std::move(it->second);
    in_flight_.erase(it);
  }

  engine_->RecordJobCompletion(job.workflow_id, job.robot_id, success);
  FLEET_LOG_INFO("Job completed", {StringField("job_id", job_id), StringField("robot_id", job.robot_id),
                                   observability::BoolField("success", success)});
  return true;
}

size_t JobDispatcher::InFlightJobs() const {
  std::lock_guard lock(mutex_);
  return in_flight_.size();
}

scheduling::TriggerCallback JobDispatcher::AsCallback() {
  return [this](const scheduling::TriggerContext& context) { Dispatch(context); };
}

} // namespace fleet::dispatch
