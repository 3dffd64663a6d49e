#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/affinity/state_affinity_manager.hpp"
#include "internal/assignment/job_assignment_engine.hpp"
#include "internal/dispatch/job_dispatcher.hpp"
#include "internal/dispatch/job_sink.hpp"
#include "internal/dispatch/robot_inventory.hpp"
#include "internal/scheduling/advanced_scheduler.hpp"

namespace fleet::factory {

/*
  Application

  Owns all long-lived components used by the service.
  Everything here lives for the lifetime of the process. The scheduler
  is declared last so it is torn down before the dispatcher its
  callback points at.
*/
struct Application {
  std::shared_ptr<affinity::StateAffinityManager>   affinity;
  std::shared_ptr<assignment::JobAssignmentEngine>  engine;
  std::shared_ptr<dispatch::StaticRobotInventory>   inventory;
  std::shared_ptr<dispatch::JobSink>                sink;
  std::shared_ptr<dispatch::JobDispatcher>          dispatcher;
  bool                                              background_cleanup{false};
  bool                                              catch_up_on_start{false};
  std::shared_ptr<scheduling::AdvancedScheduler>    scheduler;
};

/*
  Build

  Constructs the entire runtime from config. Nothing is started.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete inventory and sink types.
  A null sink selects LoggingJobSink.
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config, std::shared_ptr<dispatch::JobSink> sink = nullptr);

// Starts the affinity sweep (when configured), the scheduler, and the
// optional catch-up pass.
void Start(Application& app);

void Stop(Application& app, bool wait = true);

} // namespace fleet::factory
