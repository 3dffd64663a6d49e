#include "state_affinity_tracker.hpp"

#include <iterator>

namespace fleet::assignment {

StateAffinityTracker::StateAffinityTracker(std::chrono::seconds default_ttl) : default_ttl_(default_ttl) {
}

void StateAffinityTracker::RecordState(const std::string& workflow_id, const std::string& robot_id, std::optional<std::chrono::seconds> ttl) {
  std::lock_guard lock(mutex_);
  expiries_[workflow_id][robot_id] = util::Now() + ttl.value_or(default_ttl_);
}

bool StateAffinityTracker::HasValidState(const std::string& workflow_id, const std::string& robot_id) const {
  std::lock_guard lock(mutex_);

  auto wf = expiries_.find(workflow_id);
  if (wf == expiries_.end()) return false;

  auto it = wf->second.find(robot_id);
  if (it == wf->second.end()) return false;

  return util::Now() <= it->second;
}

void StateAffinityTracker::Clear(const std::string& workflow_id, const std::optional<std::string>& robot_id) {
  std::lock_guard lock(mutex_);

  if (!robot_id) {
    expiries_.erase(workflow_id);
    return;
  }

  auto wf = expiries_.find(workflow_id);
  if (wf == expiries_.end()) return;

  wf->second.erase(*robot_id);
  if (wf->second.empty()) expiries_.erase(wf);
}

size_t StateAffinityTracker::CleanupExpired() {
  std::lock_guard lock(mutex_);

  const auto now     = util::Now();
  size_t     removed = 0;

  for (auto wf = expiries_.begin(); wf != expiries_.end();) {
    for (auto it = wf->second.begin(); it != wf->second.end();) {
      if (now > it->second) {
        it = wf->second.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    wf = wf->second.empty() ? expiries_.erase(wf) : std::next(wf);
  }
  return removed;
}

size_t StateAffinityTracker::TrackedWorkflows() const {
  std::lock_guard lock(mutex_);
  return expiries_.size();
}

size_t StateAffinityTracker::TrackedEntries() const {
  std::lock_guard lock(mutex_);
  size_t total = 0;
  for (const auto& [workflow, robots] : expiries_) total += robots.size();
  return total;
}

} // namespace fleet::assignment
