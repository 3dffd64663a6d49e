#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/affinity/robot_state.hpp"
#include "internal/affinity/state_affinity_manager.hpp"
#include "internal/assignment/job_assignment_engine.hpp"
#include "internal/dispatch/job_sink.hpp"
#include "internal/dispatch/robot_inventory.hpp"
#include "internal/scheduling/advanced_scheduler.hpp"

namespace fleet::dispatch {

struct DispatchOptions {
  affinity::StateAffinityLevel default_affinity_level{affinity::StateAffinityLevel::kNone};
  std::optional<std::string>   orchestrator_zone;
};

struct DispatchResult {
  std::string                    job_id;
  std::string                    robot_id;
  affinity::StateAffinityLevel   affinity_level{affinity::StateAffinityLevel::kNone};
  std::string                    affinity_reason;
  assignment::AssignmentResult   assignment;
};

/*
  JobDispatcher

  Turns a fired schedule into a submitted job:

      requirements -> inventory snapshot -> affinity decision
                   -> assignment -> sink -> completion tracking

  A schedule's metadata["affinity_level"] overrides the default level.
  A robot pinned by state or session (or by the schedule's robot_id) is
  the only candidate the engine sees.

  Throws util::NoCapableRobotError and util::SessionAffinityError as
  raised below it, and util::ResourceExhausted when affinity asks for
  the job to be queued.

  Accepted jobs stay in flight until the executor reports back through
  CompleteJob(); only then does the outcome reach the assignment engine's
  history. A rejected submission is recorded as a failed job at once.
*/
class JobDispatcher {
 public:
  JobDispatcher(std::shared_ptr<RobotInventory> inventory, std::shared_ptr<assignment::JobAssignmentEngine> engine,
                std::shared_ptr<affinity::StateAffinityManager> affinity, std::shared_ptr<JobSink> sink, DispatchOptions options = {});

  DispatchResult Dispatch(const scheduling::TriggerContext& context);

  // Outcome of a dispatched job. False when job_id is not in flight.
  bool CompleteJob(const std::string& job_id, bool success);

  size_t InFlightJobs() const;

  // Adapter for AdvancedScheduler's trigger callback.
  scheduling::TriggerCallback AsCallback();

 private:
  model::JobRequirements BuildRequirements(const scheduling::AdvancedSchedule& schedule, affinity::StateAffinityLevel level) const;
  affinity::StateAffinityLevel LevelFor(const scheduling::AdvancedSchedule& schedule) const;

  std::shared_ptr<RobotInventory>                 inventory_;
  std::shared_ptr<assignment::JobAssignmentEngine> engine_;
  std::shared_ptr<affinity::StateAffinityManager> affinity_;
  std::shared_ptr<JobSink>                        sink_;
  DispatchOptions                                 options_;

  struct InFlightJob {
    std::string workflow_id;
    std::string robot_id;
  };

  mutable std::mutex                 mutex_;
  std::map<std::string, InFlightJob> in_flight_;
};

} // namespace fleet::dispatch
