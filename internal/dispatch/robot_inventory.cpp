#include "robot_inventory.hpp"

#include <algorithm>
#include <utility>

namespace fleet::dispatch {

StaticRobotInventory::StaticRobotInventory(std::vector<model::RobotInfo> robots) : robots_(std::move(robots)) {
}

std::vector<model::RobotInfo> StaticRobotInventory::Snapshot() const {
  std::lock_guard lock(mutex_);
  return robots_;
}

void StaticRobotInventory::Upsert(model::RobotInfo robot) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(robots_.begin(), robots_.end(), [&](const model::RobotInfo& r) { return r.id == robot.id; });
  if (it != robots_.end()) {
    *it = std::move(robot);
    return;
  }
  robots_.push_back(std::move(robot));
}

bool StaticRobotInventory::Remove(const std::string& robot_id) {
  std::lock_guard lock(mutex_);
  const auto before = robots_.size();
  robots_.erase(std::remove_if(robots_.begin(), robots_.end(), [&](const model::RobotInfo& r) { return r.id == robot_id; }), robots_.end());
  return robots_.size() != before;
}

bool StaticRobotInventory::AdjustJobs(const std::string& robot_id, int delta) {
  std::lock_guard lock(mutex_);
  for (auto& robot : robots_) {
    if (robot.id != robot_id) continue;
    robot.current_jobs = std::max(0, robot.current_jobs + delta);
    return true;
  }
  return false;
}

} // namespace fleet::dispatch
