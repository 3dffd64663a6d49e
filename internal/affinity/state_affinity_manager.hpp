#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/affinity/robot_state.hpp"
#include "internal/assignment/affinity_signal.hpp"
#include "internal/model/robot.hpp"

namespace fleet::affinity {

struct StateAffinityOptions {
  std::chrono::seconds      default_state_ttl{std::chrono::hours(1)};
  std::chrono::seconds      session_timeout{std::chrono::hours(1)};
  std::chrono::seconds      hard_affinity_queue_delay{30};
  std::chrono::seconds      max_queue_delay{900};
  int                       max_queue_attempts{10};
  std::chrono::milliseconds cleanup_interval{std::chrono::minutes(5)};
};

// Higher is better.
using RobotScorer = std::function<double(const model::RobotInfo&)>;

// Transfers one state item; throwing marks that item as failed.
using MigrationHandler = std::function<void(const std::string& source_robot, const std::string& target_robot, const RobotState& state)>;

/*
  StateAffinityManager

  Owns the state registry (workflow -> robot -> states), the session
  table (workflow -> session) and HARD-affinity queue counters (job id).

  Consistency model:
    - every registry access goes through mutex_; callers get copies
    - expiry is checked at read time, so expired records are invisible
      even before the background sweep reclaims them
    - migration handlers run outside the lock; the move of each item
      from source to target happens under it
*/
class StateAffinityManager : public assignment::AffinitySignal {
 public:
  explicit StateAffinityManager(StateAffinityOptions options = {});
  ~StateAffinityManager() override;

  StateAffinityManager(const StateAffinityManager&)            = delete;
  StateAffinityManager& operator=(const StateAffinityManager&) = delete;

  // Background expiry sweep.
  void Start();
  void Stop();
  bool IsRunning() const {
    return running_;
  }

  // ttl <= 0 registers state that never expires; nullopt uses the default.
  RobotState RegisterState(const std::string& robot_id, const std::string& workflow_id, const std::string& state_type,
                           std::optional<std::chrono::seconds> ttl = std::nullopt, std::int64_t size_bytes = 0, bool is_migratable = true,
                           std::map<std::string, std::string> metadata = {});

  size_t UnregisterState(const std::string& robot_id, const std::string& workflow_id, const std::optional<std::string>& state_type = std::nullopt);

  bool TouchState(const std::string& robot_id, const std::string& workflow_id);

  bool                     HasStateFor(const std::string& robot_id, const std::string& workflow_id) const;
  std::vector<std::string> GetRobotsWithState(const std::string& workflow_id) const;
  std::vector<RobotState>  GetStateForRobot(const std::string& robot_id, const std::string& workflow_id) const;
  std::map<std::string, std::vector<RobotState>> GetAllStateForWorkflow(const std::string& workflow_id) const;

  bool HasValidState(const std::string& workflow_id, const std::string& robot_id) const override {
    return HasStateFor(robot_id, workflow_id);
  }

  // Replaces any existing session for the workflow.
  WorkflowSession CreateSession(const std::string& workflow_id, const std::string& robot_id, const std::optional<std::string>& chain_id = std::nullopt,
                                std::optional<std::chrono::seconds> timeout = std::nullopt);
  std::optional<WorkflowSession> GetSession(const std::string& workflow_id) const;
  std::optional<std::string>     GetSessionRobot(const std::string& workflow_id) const;
  bool                           RecordSessionJob(const std::string& workflow_id);
  bool                           EndSession(const std::string& workflow_id);

  /*
    Chooses a robot for one job of workflow_id.

    Robots in the list that are not available count as absent. Throws
    util::SessionAffinityError when a SESSION pin cannot be honoured or a
    HARD job has exhausted its queue attempts.
  */
  StateAffinityDecision SelectRobot(const std::string& workflow_id, StateAffinityLevel level, const std::vector<model::RobotInfo>& robots,
                                    const std::optional<std::string>& job_id = std::nullopt, const RobotScorer& scorer = {},
                                    const std::optional<std::string>& chain_id = std::nullopt);

  void RegisterMigrationHandler(const std::string& state_type, MigrationHandler handler);

  MigrationResult MigrateState(const std::string& workflow_id, const std::string& source_robot, const std::string& target_robot,
                               const std::optional<std::vector<std::string>>& state_types = std::nullopt);

  void ClearQueueAttempts(const std::string& job_id);
  int  QueueAttempts(const std::string& job_id) const;

  CleanupCounts CleanupExpired();

  AffinityStatistics   GetStatistics() const;
  WorkflowStateSummary GetWorkflowStateSummary(const std::string& workflow_id) const;

  const StateAffinityOptions& options() const {
    return options_;
  }

 private:
  using RobotStates = std::map<std::string, std::vector<RobotState>>;

  void Loop();

  bool HasStateLocked(const std::string& robot_id, const std::string& workflow_id, util::TimePoint now) const;
  std::vector<std::string> RobotsWithStateLocked(const std::string& workflow_id, util::TimePoint now) const;
  std::optional<WorkflowSession> LiveSessionLocked(const std::string& workflow_id, util::TimePoint now) const;
  WorkflowSession NewSessionLocked(const std::string& workflow_id, const std::string& robot_id, const std::optional<std::string>& chain_id,
                                   std::chrono::seconds timeout, util::TimePoint now);

  StateAffinityDecision SelectHard(const std::string& workflow_id, const std::vector<model::RobotInfo>& available,
                                   const std::vector<model::RobotInfo>& holders, const std::optional<std::string>& job_id,
                                   const RobotScorer& scorer);
  StateAffinityDecision SelectSession(const std::string& workflow_id, const std::vector<model::RobotInfo>& available,
                                      const std::vector<model::RobotInfo>& holders, const RobotScorer& scorer,
                                      const std::optional<std::string>& chain_id);

  StateAffinityOptions options_;

  mutable std::mutex                             mutex_;
  std::map<std::string, RobotStates>             states_;
  std::map<std::string, WorkflowSession>         sessions_;
  struct QueueAttempt {
    int             count{0};
    util::TimePoint last_attempt;
  };

  std::map<std::string, QueueAttempt>            queue_attempts_;
  std::map<std::string, MigrationHandler>        migration_handlers_;

  std::mutex              sweep_mutex_;
  std::condition_variable sweep_cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace fleet::affinity
