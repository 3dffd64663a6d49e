#include "job_assignment_engine.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace fleet::assignment {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

std::string JobName(const model::JobRequirements& requirements) {
  return requirements.workflow_name.empty() ? requirements.workflow_id : requirements.workflow_name;
}

std::vector<std::string> CapabilityLabels(const model::JobRequirements& requirements) {
  std::vector<std::string> labels;
  labels.reserve(requirements.required_capabilities.size());
  for (const auto& cap : requirements.required_capabilities) labels.push_back(cap.Label());
  return labels;
}

double LoadPenalty(double load, double high, double medium, const ScoringWeights& w) {
  if (load > high) return -w.high_load_penalty;
  if (load > medium) return -w.medium_load_penalty;
  return 0.0;
}

} // namespace

JobAssignmentEngine::JobAssignmentEngine(ScoringWeights weights, std::shared_ptr<const AffinitySignal> affinity, std::chrono::seconds state_ttl)
    : weights_(weights), tracker_(std::make_shared<StateAffinityTracker>(state_ttl)), affinity_(std::move(affinity)) {
  if (!affinity_) affinity_ = tracker_;
}

bool JobAssignmentEngine::IsCapable(const model::RobotInfo& robot, const model::JobRequirements& requirements) const {
  if (!robot.IsAvailable()) return false;

  if (!requirements.required_capabilities.empty()) {
    const auto offered = robot.Capabilities();
    for (const auto& required : requirements.required_capabilities) {
      const bool found = std::any_of(offered.begin(), offered.end(), [&](const auto& cap) { return model::Matches(cap, required); });
      if (!found) return false;
    }
  }

  // a robot in the "default" environment takes work from any environment
  if (requirements.environment != "default" && robot.environment != requirements.environment && robot.environment != "default") {
    return false;
  }

  if (requirements.min_memory_gb > 0 && robot.NumericResource(model::kMemoryTotalGb) < requirements.min_memory_gb) return false;
  if (requirements.min_cpu_cores > 0 && robot.NumericResource(model::kCpuCount) < requirements.min_cpu_cores) return false;

  return true;
}

std::vector<model::RobotInfo> JobAssignmentEngine::FilterCapable(const model::JobRequirements& requirements,
                                                                 const std::vector<model::RobotInfo>& robots) const {
  std::vector<model::RobotInfo> capable;
  for (const auto& robot : robots) {
    if (IsCapable(robot, requirements)) capable.push_back(robot);
  }
  return capable;
}

RobotScore JobAssignmentEngine::Score(const model::RobotInfo& robot, const model::JobRequirements& requirements,
                                      const std::optional<std::string>& orchestrator_zone) const {
  const auto& w = weights_;

  RobotScore result;
  result.robot_id = robot.id;

  auto& b       = result.breakdown;
  b["base"]     = 100.0;
  b["cpu_load"] = LoadPenalty(robot.cpu_percent, w.cpu_high_threshold, w.cpu_medium_threshold, w) * w.cpu_weight;
  b["memory_load"] =
      LoadPenalty(robot.memory_percent, w.memory_high_threshold, w.memory_medium_threshold, w) * w.memory_weight;

  double job_penalty = 0.0;
  if (robot.max_concurrent_jobs <= 0) {
    job_penalty = -w.high_load_penalty;
  } else {
    const double utilization = static_cast<double>(robot.current_jobs) / robot.max_concurrent_jobs;
    if (utilization > 0.8) {
      job_penalty = -w.high_load_penalty;
    } else if (utilization > 0.5) {
      job_penalty = -w.medium_load_penalty;
    } else {
      job_penalty = -(utilization * 10.0);
    }
  }
  b["job_count"] = job_penalty * w.job_count_weight;

  double tag_bonus = 0.0;
  for (const auto& tag : requirements.required_tags) {
    if (robot.HasTag(tag)) tag_bonus += w.tag_match_bonus;
  }
  for (const auto& tag : requirements.preferred_tags) {
    if (robot.HasTag(tag)) tag_bonus += w.tag_match_bonus * 0.5;
  }
  b["tag_match"] = tag_bonus * w.tag_match_weight;

  if (requirements.requires_state) {
    const bool has_state  = affinity_ && affinity_->HasValidState(requirements.workflow_id, robot.id);
    b["state_affinity"]   = (has_state ? w.state_affinity_bonus : 0.0) * w.state_affinity_weight;
  }

  if (orchestrator_zone) {
    const bool same_zone   = !robot.network_zone.empty() && robot.network_zone == *orchestrator_zone;
    b["network_proximity"] = (same_zone ? w.network_proximity_bonus : 0.0) * w.network_proximity_weight;
  }

  for (const auto& [factor, value] : b) result.score += value;
  return result;
}

AssignmentResult JobAssignmentEngine::AssignJob(const model::JobRequirements& requirements, const std::vector<model::RobotInfo>& robots,
                                                const std::optional<std::string>& orchestrator_zone) const {
  const auto started = std::chrono::steady_clock::now();

  const auto capable = FilterCapable(requirements, robots);
  if (capable.empty()) {
    observability::Metrics::Instance().RecordAssignment(false, 0.0);
    FLEET_LOG_WARN("No capable robot for job",
                   {StringField("workflow_id", requirements.workflow_id), IntField("robots", static_cast<int64_t>(robots.size()))});
    throw util::NoCapableRobotError(JobName(requirements), CapabilityLabels(requirements));
  }

  std::vector<RobotScore> scores;
  scores.reserve(capable.size());
  for (const auto& robot : capable) scores.push_back(Score(robot, requirements, orchestrator_zone));

  // ties keep input order
  std::stable_sort(scores.begin(), scores.end(), [](const RobotScore& a, const RobotScore& b) { return a.score > b.score; });

  AssignmentResult result;
  result.robot_id   = scores.front().robot_id;
  result.score      = scores.front().score;
  result.breakdown  = scores.front().breakdown;
  result.candidates = scores.size();
  for (size_t i = 1; i < scores.size() && result.alternatives.size() < kMaxAlternatives; ++i) {
    result.alternatives.emplace_back(scores[i].robot_id, scores[i].score);
  }
  result.decision_latency = std::chrono::steady_clock::now() - started;

  observability::Metrics::Instance().RecordAssignment(true, result.decision_latency.count());
  FLEET_LOG_INFO("Job assigned", {StringField("workflow_id", requirements.workflow_id), StringField("robot_id", result.robot_id),
                                  DoubleField("score", result.score), IntField("candidates", static_cast<int64_t>(result.candidates)),
                                  DoubleField("latency_ms", result.decision_latency.count())});
  return result;
}

AssignmentOutcome JobAssignmentEngine::TryAssignJob(const model::JobRequirements& requirements, const std::vector<model::RobotInfo>& robots,
                                                    const std::optional<std::string>& orchestrator_zone) const {
  try {
    return AssignJob(requirements, robots, orchestrator_zone);
  } catch (const util::NoCapableRobotError& e) {
    return AssignmentError{e.job_name(), e.required_capabilities(), e.what()};
  }
}

void JobAssignmentEngine::RecordJobCompletion(const std::string& workflow_id, const std::string& robot_id, bool success,
                                              std::optional<std::chrono::seconds> state_ttl) {
  if (success) {
    tracker_->RecordState(workflow_id, robot_id, state_ttl);
  }
  FLEET_LOG_DEBUG("Job completion recorded",
                  {StringField("workflow_id", workflow_id), StringField("robot_id", robot_id), observability::BoolField("success", success)});
}

void JobAssignmentEngine::ClearStateAffinity(const std::string& workflow_id, const std::optional<std::string>& robot_id) {
  tracker_->Clear(workflow_id, robot_id);
}

size_t JobAssignmentEngine::CleanupExpiredState() {
  return tracker_->CleanupExpired();
}

AssignmentStats JobAssignmentEngine::GetAssignmentStats() const {
  AssignmentStats stats;
  stats.tracked_workflows     = tracker_->TrackedWorkflows();
  stats.tracked_robot_entries = tracker_->TrackedEntries();
  stats.weights               = weights_;
  return stats;
}

} // namespace fleet::assignment
