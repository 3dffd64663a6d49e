#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "internal/config/runtime_builders.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono;
using fleet::config::ConfigLoader;
using fleet::runtime::config::RuntimeConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fleet_scheduler_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

year_month_day Ymd(int y, unsigned m, unsigned d) {
  return year_month_day{year{y}, month{m}, day{d}};
}

class RecordingSink : public fleet::dispatch::JobSink {
 public:
  void Submit(const fleet::dispatch::JobSubmission& job) override {
    jobs.push_back(job);
  }

  std::vector<fleet::dispatch::JobSubmission> jobs;
};

const char* kFullConfig = R"(logging:
  level: debug
assignment:
  orchestrator_zone: us-east
  state_ttl: 1800s
  weights:
    cpu_weight: 0.5
    tag_match_bonus: 80
affinity:
  default_level: soft
  hard_affinity_queue_delay: 15s
  max_queue_attempts: 4
scheduler:
  executor_threads: 2
  misfire_grace: 60s
  default_utc_offset_minutes: -300
calendars:
  - id: us-ops
    preset: us
    working_hours:
      - day: all
        start: "08:00"
        end: "18:00"
    custom_dates: ["2024-12-24"]
    blackouts:
      - name: freeze
        start: "2024-12-20T00:00:00Z"
        end: "2024-12-27T00:00:00Z"
        affects_workflows: [wf-billing]
  - id: plant
    utc_offset_minutes: 60
    allow_weekends: true
    working_hours:
      - day: sat
        start: "10:00"
        end: "14:00"
    holidays:
      - name: Founders Day
        month: 3
        day: 14
      - name: Spring Shutdown
        type: floating
        month: 5
        weekday: fri
        occurrence: -1
robots:
  - id: bot-1
    cpu_percent: 20
    max_concurrent_jobs: 2
    tags: [finance, sap]
    network_zone: us-east
    capabilities:
      browser: {name: chrome, version: "120.0"}
      ocr: true
      memory_total_gb: 16
      office: "2021"
  - id: bot-2
    status: maintenance
    environment: production
schedules:
  - id: billing-nightly
    workflow_id: wf-billing
    type: cron
    cron_expression: "@daily"
    calendar_id: us-ops
    respect_business_hours: true
    priority: 8
    affinity_level: hard
    tags: [finance]
    variables:
      region: "us"
      batch: 500
    sla:
      max_duration: 600s
      consecutive_failure_limit: 2
    rate_limit:
      max_executions: 3
      window: 3600s
  - id: billing-report
    workflow_id: wf-report
    type: dependency
    dependency:
      depends_on: [billing-nightly]
      timeout: 7200s
  - id: inbox
    workflow_id: wf-inbox
    type: event
    event_trigger:
      event_type: file_arrival
      event_source: sftp
      event_filter:
        ext: pdf
      debounce: 30s
  - id: poll
    workflow_id: wf-poll
    type: interval
    interval: 900s
    utc_offset_minutes: 0
    catch_up:
      enabled: true
      max_runs: 2
      window: 7200s
)";

void TestLoadsFullConfig() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("full", kFullConfig).string());

  assert(config.logging().level() == "debug");
  assert(config.calendars_size() == 2);
  assert(config.robots_size() == 2);
  assert(config.schedules_size() == 4);
  assert(config.assignment().state_ttl().seconds() == 1800);
  assert(config.scheduler().default_utc_offset_minutes() == -300);
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(kFullConfig);

  const auto& caps = config.robots(0).capabilities().fields();
  assert(caps.at("office").kind_case() == google::protobuf::Value::kStringValue);
  assert(caps.at("office").string_value() == "2021");
  assert(caps.at("memory_total_gb").number_value() == 16.0);
  assert(caps.at("ocr").bool_value());
  assert(caps.at("browser").struct_value().fields().at("version").string_value() == "120.0");

  const auto& vars = config.schedules(0).variables().fields();
  assert(vars.at("region").string_value() == "us");
  assert(vars.at("batch").number_value() == 500.0);
}

void TestRejectsUnknownAndMalformed() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString("scheduler:\n  executor_threads: 2\n  turbo: true\n");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Invalid configuration") == 0;
  }
  assert(threw);

  threw = false;
  try {
    ConfigLoader::LoadFromYamlString("- a\n- b\n");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("top level must be a mapping") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/fleet/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") == 0;
  }
  assert(threw);

  // empty document: all defaults
  const auto empty = ConfigLoader::LoadFromYamlString("");
  assert(empty.schedules_size() == 0);
}

void TestEnvironmentExpansion() {
  setenv("FLEET_TEST_WORKFLOW", "wf-billing", 1);
  unsetenv("FLEET_TEST_UNSET");

  assert(ConfigLoader::ExpandEnvironment("${FLEET_TEST_WORKFLOW}") == "wf-billing");
  assert(ConfigLoader::ExpandEnvironment("x-${FLEET_TEST_UNSET:-def}-y") == "x-def-y");
  assert(ConfigLoader::ExpandEnvironment("plain $HOME") == "plain $HOME");

  const auto config = ConfigLoader::LoadFromYamlString(
      "scheduler:\n  executor_threads: ${FLEET_TEST_UNSET:-3}\n"
      "schedules:\n  - id: a\n    workflow_id: ${FLEET_TEST_WORKFLOW}\n    name: \"${FLEET_TEST_UNSET:-007}\"\n");
  assert(config.scheduler().executor_threads() == 3);
  assert(config.schedules(0).workflow_id() == "wf-billing");
  assert(config.schedules(0).name() == "007");

  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString("schedules:\n  - id: a\n    workflow_id: ${FLEET_TEST_UNSET}\n");
  } catch (const fleet::util::InvalidArgument& e) {
    threw = std::string(e.what()).find("schedules[0].workflow_id: environment variable FLEET_TEST_UNSET is not set") !=
            std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    ConfigLoader::ExpandEnvironment("${FLEET_TEST_WORKFLOW");
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestBuildersMapConfig() {
  const auto config = ConfigLoader::LoadFromYamlString(kFullConfig);

  const auto weights = fleet::config::BuildWeights(config.assignment().weights());
  assert(weights.cpu_weight == 0.5);
  assert(weights.tag_match_bonus == 80.0);
  assert(weights.memory_weight == fleet::assignment::ScoringWeights{}.memory_weight);

  const auto affinity = fleet::config::BuildAffinityOptions(config.affinity());
  assert(affinity.hard_affinity_queue_delay == seconds{15});
  assert(affinity.max_queue_attempts == 4);
  assert(affinity.session_timeout == hours{1});
  assert(fleet::config::BuildDefaultAffinityLevel(config.affinity()) == fleet::affinity::StateAffinityLevel::kSoft);

  const auto scheduler = fleet::config::BuildSchedulerOptions(config.scheduler());
  assert(scheduler.executor_threads == 2);
  assert(scheduler.misfire_grace == seconds{60});
  assert(scheduler.max_instances == 3);

  // preset plus overrides
  const auto us = fleet::config::BuildCalendar(config.calendars(0));
  assert(us->config().id() == "us-ops");
  assert(us->config().utc_offset() == hours{-5});
  assert(us->config().hours_for(Monday).start == hours{8});
  assert(us->IsHoliday(Ymd(2024, 7, 4)));
  assert(!us->IsWorkingDay(Ymd(2024, 12, 24)));
  assert(us->config().blackouts().size() == 1);

  const auto plant = fleet::config::BuildCalendar(config.calendars(1));
  assert(plant->config().utc_offset() == minutes{60});
  assert(plant->config().allow_weekends());
  assert(plant->config().hours_for(Saturday).start == hours{10});
  assert(plant->IsHoliday(Ymd(2024, 3, 14)));
  assert(plant->IsHoliday(Ymd(2024, 5, 31))); // last Friday of May

  const auto bot = fleet::config::BuildRobot(config.robots(0));
  assert(bot.max_concurrent_jobs == 2);
  assert(bot.NumericResource(fleet::model::kMemoryTotalGb) == 16.0);
  assert(std::holds_alternative<std::string>(bot.capabilities.at("office")));
  assert(std::get<fleet::model::CapabilityDescriptor>(bot.capabilities.at("browser")).name == "chrome");
  assert(bot.HasTag("sap"));

  const auto spare = fleet::config::BuildRobot(config.robots(1));
  assert(spare.status == fleet::model::RobotStatus::kMaintenance);
  assert(spare.environment == "production");
  assert(spare.name == "bot-2");

  const auto billing = fleet::config::BuildSchedule(config.schedules(0), minutes{-300});
  assert(billing.type == fleet::scheduling::ScheduleType::kCron);
  assert(billing.utc_offset == minutes{-300});
  assert(billing.priority == 8);
  assert(billing.metadata.at("affinity_level") == "hard");
  assert(billing.created_by == "config");
  assert(billing.sla && billing.sla->max_duration == seconds{600});
  assert(billing.sla->consecutive_failure_limit == 2);
  assert(billing.rate_limit && billing.rate_limit->max_executions == 3);
  assert(billing.calendar_id == std::string("us-ops"));

  const auto inbox = fleet::config::BuildSchedule(config.schedules(2));
  assert(inbox.event_trigger && inbox.event_trigger->event_type == fleet::scheduling::EventType::kFileArrival);
  assert(inbox.event_trigger->debounce == seconds{30});
  assert(inbox.event_trigger->event_filter->fields().at("ext").string_value() == "pdf");

  const auto poll = fleet::config::BuildSchedule(config.schedules(3), minutes{-300});
  assert(poll.utc_offset == minutes{0});
  assert(poll.interval == seconds{900});
  assert(poll.catch_up && poll.catch_up->window == hours{2});
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn fn) {
  try {
    fn();
  } catch (const fleet::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestBuilderErrors() {
  using fleet::config::ParseClock;
  using fleet::config::ParseDate;

  assert(ParseClock("07:30") == minutes{450});
  assert(ThrowsInvalidArgument([] { ParseClock("25:00"); }));
  assert(ThrowsInvalidArgument([] { ParseClock("0900"); }));
  assert(ThrowsInvalidArgument([] { ParseClock("ab:cd"); }));

  assert(ParseDate("2024-02-29") == Ymd(2024, 2, 29));
  assert(ThrowsInvalidArgument([] { ParseDate("2023-02-29"); }));
  assert(ThrowsInvalidArgument([] { ParseDate("24-1-1"); }));

  const auto schedule = [](const std::string& yaml) {
    return ConfigLoader::LoadFromYamlString("schedules:\n  - " + yaml).schedules(0);
  };
  assert(ThrowsInvalidArgument([&] { fleet::config::BuildSchedule(schedule("{id: s, type: cron, priority: 11}")); }));
  assert(ThrowsInvalidArgument([&] { fleet::config::BuildSchedule(schedule("{id: s, type: hourly}")); }));
  assert(ThrowsInvalidArgument([&] { fleet::config::BuildSchedule(schedule("{id: s, type: cron, affinity_level: sticky}")); }));
  assert(ThrowsInvalidArgument([&] { fleet::config::BuildSchedule(schedule("{type: cron}")); }));

  const auto load = [](const std::string& yaml) { return ConfigLoader::LoadFromYamlString(yaml); };
  assert(ThrowsInvalidArgument([&] { fleet::config::BuildCalendar(load("calendars:\n  - {id: c, preset: mars}\n").calendars(0)); }));
  assert(ThrowsInvalidArgument([&] {
    fleet::config::BuildCalendar(load("calendars:\n  - {id: c, holidays: [{name: h, type: floating, month: 5, weekday: mon}]}\n").calendars(0));
  }));
  assert(ThrowsInvalidArgument([&] {
    fleet::config::BuildWeights(load("assignment:\n  weights: {cpu_medium_threshold: 90, cpu_high_threshold: 80}\n").assignment().weights());
  }));
  assert(ThrowsInvalidArgument([&] { fleet::config::BuildRobot(load("robots:\n  - {id: r, cpu_percent: 120}\n").robots(0)); }));
  assert(ThrowsInvalidArgument([&] { fleet::config::BuildDefaultAffinityLevel(load("affinity: {default_level: strong}\n").affinity()); }));
}

void TestFactoryBuildsRuntime() {
  const auto config = ConfigLoader::LoadFromYamlString(kFullConfig);
  auto       sink   = std::make_shared<RecordingSink>();
  auto       app    = fleet::factory::Build(config, sink);

  assert(app.scheduler->GetAllSchedules().size() == 4);
  assert(app.scheduler->GetCalendar("us-ops"));
  assert(app.scheduler->GetCalendar("plant"));
  assert(app.inventory->Snapshot().size() == 2);
  assert(app.scheduler->options().executor_threads == 2);
  assert(app.affinity->options().max_queue_attempts == 4);
  assert(!app.background_cleanup);
  assert(!app.catch_up_on_start);
  assert(app.scheduler->GetDependencyGraph().at("billing-nightly") == std::vector<std::string>{"billing-report"});

  // bot-2 is in maintenance, so bot-1 takes the run; soft affinity records state
  assert(app.scheduler->ExecuteNow("poll") == fleet::scheduling::ExecutionOutcome::kExecuted);
  assert(sink->jobs.size() == 1);
  assert(sink->jobs.front().robot_id == "bot-1");
  assert(sink->jobs.front().schedule_id == "poll");
  assert(app.affinity->HasStateFor("bot-1", "wf-poll"));

  fleet::factory::Stop(app);
}

void TestFactoryRejectsInconsistentConfig() {
  const auto load = [](const std::string& yaml) { return ConfigLoader::LoadFromYamlString(yaml); };

  assert(ThrowsInvalidArgument([&] {
    fleet::factory::Build(load("schedules:\n  - {id: s, workflow_id: w, type: cron, cron_expression: '@daily', calendar_id: nope}\n"));
  }));
  assert(ThrowsInvalidArgument([&] { fleet::factory::Build(load("robots:\n  - {id: r}\n  - {id: r}\n")); }));
  assert(ThrowsInvalidArgument([&] { fleet::factory::Build(load("calendars:\n  - {id: c}\n  - {id: c}\n")); }));
  assert(ThrowsInvalidArgument([&] {
    fleet::factory::Build(load("schedules:\n  - {id: s, workflow_id: w, type: cron, cron_expression: '99 * * * *'}\n"));
  }));
  assert(ThrowsInvalidArgument([&] {
    fleet::factory::Build(load("schedules:\n"
                               "  - {id: a, workflow_id: w, type: dependency, dependency: {depends_on: [b]}}\n"
                               "  - {id: b, workflow_id: w, type: dependency, dependency: {depends_on: [a]}}\n"));
  }));
}

} // namespace

int main() {
  TestLoadsFullConfig();
  TestQuotedScalarsStayStrings();
  TestRejectsUnknownAndMalformed();
  TestEnvironmentExpansion();
  TestBuildersMapConfig();
  TestBuilderErrors();
  TestFactoryBuildsRuntime();
  TestFactoryRejectsInconsistentConfig();

  std::cout << "fleet_unit_config_loader: pass\n";
  return 0;
}
