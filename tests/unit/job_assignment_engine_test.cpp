#include "internal/assignment/job_assignment_engine.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using fleet::assignment::AssignmentError;
using fleet::assignment::AssignmentResult;
using fleet::assignment::JobAssignmentEngine;
using fleet::model::CapabilityDescriptor;
using fleet::model::CapabilityType;
using fleet::model::JobRequirements;
using fleet::model::RobotCapability;
using fleet::model::RobotInfo;

RobotInfo MakeRobot(const std::string& id, double cpu = 10.0, double memory = 10.0) {
  RobotInfo robot;
  robot.id                  = id;
  robot.name                = id;
  robot.cpu_percent         = cpu;
  robot.memory_percent      = memory;
  robot.max_concurrent_jobs = 2;
  return robot;
}

JobRequirements MakeJob(const std::string& workflow_id = "wf-invoices") {
  JobRequirements job;
  job.workflow_id   = workflow_id;
  job.workflow_name = "Invoice processing";
  return job;
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestTiesKeepInputOrderAndRepeat() {
  JobAssignmentEngine engine;
  const std::vector<RobotInfo> robots = {MakeRobot("r1"), MakeRobot("r2"), MakeRobot("r3")};

  const auto first = engine.AssignJob(MakeJob(), robots);
  assert(first.robot_id == "r1");
  assert(first.candidates == 3);
  assert(first.alternatives.size() == 2);
  assert(first.alternatives[0].first == "r2");

  for (int i = 0; i < 5; ++i) {
    assert(engine.AssignJob(MakeJob(), robots).robot_id == "r1");
  }
}

void TestHardFilter() {
  JobAssignmentEngine engine;

  auto browser = MakeRobot("browser");
  browser.capabilities["browser"] = CapabilityDescriptor{"chrome", "120.0"};

  auto old_browser = MakeRobot("old-browser");
  old_browser.capabilities["browser"] = CapabilityDescriptor{"chrome", "90.0"};

  auto busy = MakeRobot("busy");
  busy.capabilities["browser"] = CapabilityDescriptor{"chrome", "120.0"};
  busy.current_jobs            = 2;

  auto job = MakeJob();
  job.required_capabilities.push_back(RobotCapability{CapabilityType::kBrowser, "chrome", "", ">=100"});

  const auto capable = engine.FilterCapable(job, {old_browser, busy, browser});
  assert(capable.size() == 1);
  assert(capable.front().id == "browser");

  // environment: exact match or a robot in "default"
  auto prod = MakeRobot("prod");
  prod.environment = "production";
  auto staging = MakeRobot("staging");
  staging.environment = "staging";
  auto shared = MakeRobot("shared");

  auto env_job        = MakeJob();
  env_job.environment = "production";
  const auto env_ok   = engine.FilterCapable(env_job, {prod, staging, shared});
  assert(env_ok.size() == 2);
  assert(env_ok[0].id == "prod");
  assert(env_ok[1].id == "shared");

  // numeric resources
  auto big = MakeRobot("big");
  big.capabilities["memory_total_gb"] = 64.0;
  big.capabilities["cpu_count"]       = 16.0;
  auto small = MakeRobot("small");
  small.capabilities["memory_total_gb"] = 8.0;

  auto heavy          = MakeJob();
  heavy.min_memory_gb = 16.0;
  heavy.min_cpu_cores = 8.0;
  const auto fits     = engine.FilterCapable(heavy, {small, big});
  assert(fits.size() == 1);
  assert(fits.front().id == "big");
}

void TestNoCapableRobotCarriesRequirements() {
  JobAssignmentEngine engine;

  auto job = MakeJob();
  job.required_capabilities.push_back(RobotCapability{CapabilityType::kOcr, "abbyy", "", std::nullopt});
  job.required_capabilities.push_back(RobotCapability{CapabilityType::kGpu, "cuda", "", ">=12"});

  bool threw = false;
  try {
    (void)engine.AssignJob(job, {MakeRobot("plain")});
  } catch (const fleet::util::NoCapableRobotError& e) {
    threw = true;
    assert(e.job_name() == "Invoice processing");
    assert(e.required_capabilities().size() == 2);
    assert(e.required_capabilities()[0] == "ocr:abbyy");
    assert(e.required_capabilities()[1] == "gpu:cuda");
  }
  assert(threw);

  const auto outcome = engine.TryAssignJob(job, {});
  assert(std::holds_alternative<AssignmentError>(outcome));
  assert(std::get<AssignmentError>(outcome).required_capabilities.size() == 2);
}

void TestCpuLoadIsMonotonic() {
  JobAssignmentEngine engine;
  const auto          job = MakeJob();

  const auto idle   = engine.Score(MakeRobot("idle", 10.0), job, std::nullopt);
  const auto medium = engine.Score(MakeRobot("medium", 70.0), job, std::nullopt);
  const auto high   = engine.Score(MakeRobot("high", 90.0), job, std::nullopt);

  assert(idle.score > medium.score);
  assert(medium.score > high.score);
  assert(Near(medium.breakdown.at("cpu_load"), -25.0));
  assert(Near(high.breakdown.at("cpu_load"), -50.0));

  const auto result = engine.AssignJob(job, {MakeRobot("high", 90.0), MakeRobot("medium", 70.0), MakeRobot("idle", 10.0)});
  assert(result.robot_id == "idle");
}

void TestBreakdownSumsToScore() {
  fleet::assignment::ScoringWeights weights;
  weights.tag_match_weight = 2.0;
  JobAssignmentEngine engine(weights);

  auto robot         = MakeRobot("tagged", 65.0, 90.0);
  robot.tags         = {"finance", "sap"};
  robot.current_jobs = 1;
  robot.network_zone = "eu-west";

  auto job           = MakeJob();
  job.required_tags  = {"finance"};
  job.preferred_tags = {"sap", "excel"};

  const auto score = engine.Score(robot, job, std::string("eu-west"));

  double sum = 0.0;
  for (const auto& [factor, value] : score.breakdown) sum += value;
  assert(Near(sum, score.score));

  // (20 + 10) * 2.0
  assert(Near(score.breakdown.at("tag_match"), 60.0));
  assert(Near(score.breakdown.at("network_proximity"), 7.5));
  assert(Near(score.breakdown.at("memory_load"), -40.0));
  assert(score.breakdown.count("state_affinity") == 0);

  const auto result = engine.AssignJob(job, {robot}, std::string("eu-west"));
  sum               = 0.0;
  for (const auto& [factor, value] : result.breakdown) sum += value;
  assert(Near(sum, result.score));
}

void TestStateAffinityBonus() {
  JobAssignmentEngine engine;

  auto job           = MakeJob("wf-stateful");
  job.requires_state = true;

  const std::vector<RobotInfo> robots = {MakeRobot("warm", 90.0), MakeRobot("cold", 10.0)};
  assert(engine.AssignJob(job, robots).robot_id == "cold");

  engine.RecordJobCompletion("wf-stateful", "warm", true);
  const auto result = engine.AssignJob(job, robots);
  assert(result.robot_id == "warm");
  assert(Near(result.breakdown.at("state_affinity"), 200.0));

  // failures never record state
  engine.RecordJobCompletion("wf-stateful", "cold", false);
  assert(engine.GetAssignmentStats().tracked_robot_entries == 1);

  engine.ClearStateAffinity("wf-stateful");
  assert(engine.AssignJob(job, robots).robot_id == "cold");
}

void TestStateExpiry() {
  JobAssignmentEngine engine;
  engine.RecordJobCompletion("wf-short", "r1", true, std::chrono::seconds(1));
  assert(engine.GetAssignmentStats().tracked_workflows == 1);

  std::this_thread::sleep_for(std::chrono::milliseconds(2100));
  assert(engine.CleanupExpiredState() == 1);
  assert(engine.GetAssignmentStats().tracked_workflows == 0);
}

void TestAlternativesAreCapped() {
  JobAssignmentEngine    engine;
  std::vector<RobotInfo> robots;
  for (int i = 0; i < 8; ++i) robots.push_back(MakeRobot("r" + std::to_string(i), 10.0 + i));

  const auto result = engine.AssignJob(MakeJob(), robots);
  assert(result.candidates == 8);
  assert(result.alternatives.size() == JobAssignmentEngine::kMaxAlternatives);
  assert(result.decision_latency.count() >= 0.0);
}

} // namespace

int main() {
  TestTiesKeepInputOrderAndRepeat();
  TestHardFilter();
  TestNoCapableRobotCarriesRequirements();
  TestCpuLoadIsMonotonic();
  TestBreakdownSumsToScore();
  TestStateAffinityBonus();
  TestStateExpiry();
  TestAlternativesAreCapped();

  std::cout << "fleet_unit_job_assignment_engine: pass\n";
  return 0;
}
