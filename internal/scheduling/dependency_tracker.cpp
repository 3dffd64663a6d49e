#include "dependency_tracker.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "internal/observability/logging.hpp"

namespace fleet::scheduling {

using observability::BoolField;
using observability::StringField;

DependencyTracker::DependencyTracker(util::Seconds ttl) : ttl_(ttl) {
}

void DependencyTracker::PruneLocked(std::vector<CompletionRecord>& records, util::TimePoint now) const {
  const auto cutoff = now - ttl_;
  records.erase(std::remove_if(records.begin(), records.end(), [&](const CompletionRecord& r) { return r.completed_at <= cutoff; }),
                records.end());
}

void DependencyTracker::RecordCompletion(const std::string& schedule_id, bool success, std::optional<google::protobuf::Value> result,
                                         util::TimePoint now) {
  {
    std::lock_guard lock(mutex_);
    auto&           records = completions_[schedule_id];
    records.push_back(CompletionRecord{schedule_id, now, success, std::move(result)});
    PruneLocked(records, now);
  }
  FLEET_LOG_DEBUG("Recorded schedule completion", {StringField("schedule_id", schedule_id), BoolField("success", success)});
}

bool DependencyTracker::IsDependencySatisfied(const std::string& dependency_id, std::optional<util::TimePoint> since, bool require_success) {
  std::lock_guard lock(mutex_);
  auto            it = completions_.find(dependency_id);
  if (it == completions_.end()) return false;

  PruneLocked(it->second, util::Now());
  for (auto r = it->second.rbegin(); r != it->second.rend(); ++r) {
    if (since && r->completed_at < *since) continue;
    if (require_success && !r->success) continue;
    return true;
  }
  return false;
}

DependencyCheck DependencyTracker::AreDependenciesSatisfied(const DependencyConfig& config, std::optional<util::TimePoint> since) {
  DependencyCheck check;
  size_t          satisfied = 0;
  for (const auto& dep : config.depends_on) {
    if (IsDependencySatisfied(dep, since, config.trigger_on_success_only)) {
      ++satisfied;
    } else {
      check.unsatisfied.push_back(dep);
    }
  }

  check.satisfied = config.wait_for_all ? check.unsatisfied.empty() : satisfied > 0;
  return check;
}

std::optional<CompletionRecord> DependencyTracker::GetLatestCompletion(const std::string& schedule_id) {
  std::lock_guard lock(mutex_);
  auto            it = completions_.find(schedule_id);
  if (it == completions_.end() || it->second.empty()) return std::nullopt;
  return it->second.back();
}

size_t DependencyTracker::Cleanup(util::TimePoint now) {
  std::lock_guard lock(mutex_);
  size_t          removed = 0;
  for (auto it = completions_.begin(); it != completions_.end();) {
    const auto before = it->second.size();
    PruneLocked(it->second, now);
    removed += before - it->second.size();
    if (it->second.empty()) {
      it = completions_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

namespace {

bool FindCycle(const std::map<std::string, std::vector<std::string>>& graph, const std::string& node, std::set<std::string>& visited,
               std::set<std::string>& on_stack, std::vector<std::string>& path, std::vector<std::string>& cycle) {
  visited.insert(node);
  on_stack.insert(node);
  path.push_back(node);

  if (auto it = graph.find(node); it != graph.end()) {
    for (const auto& next : it->second) {
      if (!visited.count(next)) {
        if (FindCycle(graph, next, visited, on_stack, path, cycle)) return true;
      } else if (on_stack.count(next)) {
        cycle.assign(std::find(path.begin(), path.end(), next), path.end());
        cycle.push_back(next);
        return true;
      }
    }
  }

  path.pop_back();
  on_stack.erase(node);
  return false;
}

} // namespace

DependencyValidation ValidateDependencyGraph(const std::map<std::string, std::vector<std::string>>& graph) {
  DependencyValidation  result;
  std::set<std::string> visited;
  std::set<std::string> on_stack;

  for (const auto& [node, deps] : graph) {
    if (visited.count(node)) continue;
    std::vector<std::string> path;
    if (FindCycle(graph, node, visited, on_stack, path, result.cycle)) {
      result.valid = false;
      return result;
    }
  }
  return result;
}

} // namespace fleet::scheduling
