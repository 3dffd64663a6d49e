#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "internal/assignment/affinity_signal.hpp"
#include "internal/util/time.hpp"

namespace fleet::assignment {

/*
  Lightweight robot/workflow state memory owned by the assignment engine.

  Entries are written when a job completes successfully and expire after a
  TTL. Expired entries are ignored by HasValidState() and reclaimed by
  CleanupExpired().
*/
class StateAffinityTracker : public AffinitySignal {
 public:
  explicit StateAffinityTracker(std::chrono::seconds default_ttl = std::chrono::hours(1));

  void RecordState(const std::string& workflow_id, const std::string& robot_id, std::optional<std::chrono::seconds> ttl = std::nullopt);

  bool HasValidState(const std::string& workflow_id, const std::string& robot_id) const override;

  // Without robot_id the whole workflow is forgotten.
  void Clear(const std::string& workflow_id, const std::optional<std::string>& robot_id = std::nullopt);

  size_t CleanupExpired();

  size_t TrackedWorkflows() const;
  size_t TrackedEntries() const;

 private:
  std::chrono::seconds default_ttl_;

  mutable std::mutex mutex_;
  // workflow -> robot -> expiry
  std::map<std::string, std::map<std::string, util::TimePoint>> expiries_;
};

} // namespace fleet::assignment
