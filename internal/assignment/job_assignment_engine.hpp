#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "internal/assignment/affinity_signal.hpp"
#include "internal/assignment/scoring_weights.hpp"
#include "internal/assignment/state_affinity_tracker.hpp"
#include "internal/model/job.hpp"
#include "internal/model/robot.hpp"

namespace fleet::assignment {

struct RobotScore {
  std::string                   robot_id;
  double                        score{0.0};
  std::map<std::string, double> breakdown;
};

struct AssignmentResult {
  std::string                                  robot_id;
  double                                       score{0.0};
  // weighted contributions; values sum to score
  std::map<std::string, double>                breakdown;
  std::vector<std::pair<std::string, double>>  alternatives;
  std::chrono::duration<double, std::milli>    decision_latency{0};
  size_t                                       candidates{0};
};

struct AssignmentError {
  std::string              job_name;
  std::vector<std::string> required_capabilities;
  std::string              message;
};

using AssignmentOutcome = std::variant<AssignmentResult, AssignmentError>;

struct AssignmentStats {
  size_t         tracked_workflows{0};
  size_t         tracked_robot_entries{0};
  ScoringWeights weights;
};

/*
  JobAssignmentEngine

  Two-phase robot selection:
    1. hard filter (availability, capabilities, environment, resources)
    2. weighted soft scoring, stable-sorted descending

  The engine never caches robot snapshots; callers pass a fresh list on
  every call. It is safe to call from multiple threads: scoring is pure
  and the only mutable state lives behind the affinity signal's lock.
*/
class JobAssignmentEngine {
 public:
  static constexpr size_t kMaxAlternatives = 4;

  explicit JobAssignmentEngine(ScoringWeights weights = {}, std::shared_ptr<const AffinitySignal> affinity = nullptr,
                               std::chrono::seconds state_ttl = std::chrono::hours(1));

  // Throws util::NoCapableRobotError when nothing survives the hard filter.
  AssignmentResult AssignJob(const model::JobRequirements& requirements, const std::vector<model::RobotInfo>& robots,
                             const std::optional<std::string>& orchestrator_zone = std::nullopt) const;

  AssignmentOutcome TryAssignJob(const model::JobRequirements& requirements, const std::vector<model::RobotInfo>& robots,
                                 const std::optional<std::string>& orchestrator_zone = std::nullopt) const;

  std::vector<model::RobotInfo> FilterCapable(const model::JobRequirements& requirements, const std::vector<model::RobotInfo>& robots) const;

  RobotScore Score(const model::RobotInfo& robot, const model::JobRequirements& requirements,
                   const std::optional<std::string>& orchestrator_zone) const;

  // Feeds the built-in tracker; a no-op for state when success is false.
  void RecordJobCompletion(const std::string& workflow_id, const std::string& robot_id, bool success,
                           std::optional<std::chrono::seconds> state_ttl = std::nullopt);

  void ClearStateAffinity(const std::string& workflow_id, const std::optional<std::string>& robot_id = std::nullopt);

  size_t CleanupExpiredState();

  AssignmentStats GetAssignmentStats() const;

  const ScoringWeights& weights() const {
    return weights_;
  }

 private:
  bool IsCapable(const model::RobotInfo& robot, const model::JobRequirements& requirements) const;

  ScoringWeights                        weights_;
  std::shared_ptr<StateAffinityTracker> tracker_;
  std::shared_ptr<const AffinitySignal> affinity_;
};

} // namespace fleet::assignment
