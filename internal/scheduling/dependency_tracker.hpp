#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/scheduling/schedule.hpp"
#include "internal/util/time.hpp"

namespace fleet::scheduling {

struct CompletionRecord {
  std::string                            schedule_id;
  util::TimePoint                        completed_at;
  bool                                   success{false};
  std::optional<google::protobuf::Value> result;
};

struct DependencyCheck {
  bool                     satisfied{false};
  std::vector<std::string> unsatisfied;
};

struct DependencyValidation {
  bool valid{true};
  // Closed path, e.g. a -> b -> a.
  std::vector<std::string> cycle;
};

/*
  DependencyTracker

  Completion history per schedule id, kept for `ttl`. Feeds DEPENDENCY
  schedules and dependency gates. Thread-safe.
*/
class DependencyTracker {
 public:
  explicit DependencyTracker(util::Seconds ttl = util::Seconds{86400});

  void RecordCompletion(const std::string& schedule_id, bool success, std::optional<google::protobuf::Value> result = std::nullopt,
                        util::TimePoint now = util::Now());

  bool IsDependencySatisfied(const std::string& dependency_id, std::optional<util::TimePoint> since = std::nullopt,
                             bool require_success = true);

  // All or any of config.depends_on, per wait_for_all.
  DependencyCheck AreDependenciesSatisfied(const DependencyConfig& config, std::optional<util::TimePoint> since = std::nullopt);

  std::optional<CompletionRecord> GetLatestCompletion(const std::string& schedule_id);

  // Drops expired records; returns how many went.
  size_t Cleanup(util::TimePoint now = util::Now());

 private:
  void PruneLocked(std::vector<CompletionRecord>& records, util::TimePoint now) const;

  util::Seconds ttl_;

  std::mutex                                                     mutex_;
  std::unordered_map<std::string, std::vector<CompletionRecord>> completions_;
};

// node -> the nodes it depends on.
DependencyValidation ValidateDependencyGraph(const std::map<std::string, std::vector<std::string>>& graph);

} // namespace fleet::scheduling
