#include "factory.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/runtime_builders.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::factory {

using observability::IntField;
using observability::StringField;

namespace {

std::vector<model::RobotInfo> BuildInventory(const fleet::runtime::config::RuntimeConfig& config) {
  std::vector<model::RobotInfo> robots;
  std::set<std::string>         seen;
  for (const auto& def : config.robots()) {
    auto robot = config::BuildRobot(def);
    if (!seen.insert(robot.id).second) throw util::InvalidArgument("duplicate robot id '" + robot.id + "'");
    robots.push_back(std::move(robot));
  }
  return robots;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config, std::shared_ptr<dispatch::JobSink> sink) {
  Application app;

  // ------------------------------------------------------------------
  // Affinity + assignment
  // ------------------------------------------------------------------
  app.affinity           = std::make_shared<affinity::StateAffinityManager>(config::BuildAffinityOptions(config.affinity()));
  app.background_cleanup = config.affinity().background_cleanup();

  auto state_ttl = std::chrono::seconds(std::chrono::hours(1));
  if (config.assignment().has_state_ttl()) {
    state_ttl = std::chrono::duration_cast<std::chrono::seconds>(util::FromProto(config.assignment().state_ttl()));
  }
  app.engine = std::make_shared<assignment::JobAssignmentEngine>(config::BuildWeights(config.assignment().weights()), app.affinity, state_ttl);

  // ------------------------------------------------------------------
  // Dispatch
  // ------------------------------------------------------------------
  app.inventory = std::make_shared<dispatch::StaticRobotInventory>(BuildInventory(config));
  app.sink      = sink ? std::move(sink) : std::make_shared<dispatch::LoggingJobSink>();

  dispatch::DispatchOptions dispatch_options;
  dispatch_options.default_affinity_level = config::BuildDefaultAffinityLevel(config.affinity());
  if (!config.assignment().orchestrator_zone().empty()) dispatch_options.orchestrator_zone = config.assignment().orchestrator_zone();
  app.dispatcher = std::make_shared<dispatch::JobDispatcher>(app.inventory, app.engine, app.affinity, app.sink, dispatch_options);

  // ------------------------------------------------------------------
  // Scheduler, calendars, schedules
  // ------------------------------------------------------------------
  app.scheduler         = std::make_shared<scheduling::AdvancedScheduler>(app.dispatcher->AsCallback(),
                                                                    config::BuildSchedulerOptions(config.scheduler()));
  app.catch_up_on_start = config.scheduler().catch_up_on_start();

  for (const auto& def : config.calendars()) {
    if (app.scheduler->GetCalendar(def.id())) throw util::InvalidArgument("duplicate calendar id '" + def.id() + "'");
    app.scheduler->RegisterCalendar(def.id(), config::BuildCalendar(def));
  }

  const auto default_offset = std::chrono::minutes{config.scheduler().default_utc_offset_minutes()};
  for (const auto& def : config.schedules()) {
    auto schedule = config::BuildSchedule(def, default_offset);
    if (schedule.calendar_id && !app.scheduler->GetCalendar(*schedule.calendar_id)) {
      throw util::InvalidArgument("schedule '" + schedule.id + "' references unknown calendar '" + *schedule.calendar_id + "'");
    }
    if (!app.scheduler->AddSchedule(std::move(schedule))) {
      throw util::InvalidArgument("schedule '" + def.id() + "' was rejected");
    }
  }

  FLEET_LOG_INFO("Runtime built", {IntField("robots", config.robots_size()), IntField("calendars", config.calendars_size()),
                                   IntField("schedules", config.schedules_size()),
                                   StringField("default_affinity", affinity::ToString(dispatch_options.default_affinity_level))});
  return app;
}

void Start(Application& app) {
  if (app.background_cleanup) app.affinity->Start();
  app.scheduler->Start();

  if (!app.catch_up_on_start) return;
  for (const auto& schedule : app.scheduler->CheckMissedRuns()) {
    const int runs = app.scheduler->ExecuteCatchUp(schedule.id);
    FLEET_LOG_INFO("Catch-up executed", {StringField("schedule_id", schedule.id), IntField("runs", runs)});
  }
}

void Stop(Application& app, bool wait) {
  if (app.scheduler) app.scheduler->Stop(wait);
  if (app.affinity) app.affinity->Stop();
}

} // namespace fleet::factory
