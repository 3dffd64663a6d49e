#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "internal/model/robot.hpp"

namespace fleet::dispatch {

/*
  Source of robot snapshots.

  Implementations:
    Static   -> robots declared in the configuration
    (future) -> orchestrator heartbeat feed
*/
class RobotInventory {
 public:
  virtual ~RobotInventory() = default;

  // Fresh copy on every call; the dispatcher never holds on to it.
  virtual std::vector<model::RobotInfo> Snapshot() const = 0;
};

class StaticRobotInventory : public RobotInventory {
 public:
  StaticRobotInventory() = default;
  explicit StaticRobotInventory(std::vector<model::RobotInfo> robots);

  std::vector<model::RobotInfo> Snapshot() const override;

  // Inserts or replaces by id.
  void Upsert(model::RobotInfo robot);
  bool Remove(const std::string& robot_id);

  // Adjusts current_jobs by delta, clamped at zero. False for unknown ids.
  bool AdjustJobs(const std::string& robot_id, int delta);

 private:
  mutable std::mutex            mutex_;
  std::vector<model::RobotInfo> robots_;
};

} // namespace fleet::dispatch
