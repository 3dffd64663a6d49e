#include "sla_monitor.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/uuid.hpp"

namespace fleet::scheduling {

using observability::StringField;

SlaMonitor::SlaMonitor(size_t history_limit) : history_limit_(std::max<size_t>(2, history_limit)) {
}

void SlaMonitor::AddAlertCallback(SlaAlertCallback callback) {
  std::lock_guard lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

std::string SlaMonitor::RecordStart(const std::string& schedule_id, std::optional<util::TimePoint> scheduled_time, util::TimePoint now) {
  ExecutionMetrics metrics;
  metrics.execution_id   = util::GenerateId(util::IdKind::kExecution);
  metrics.schedule_id    = schedule_id;
  metrics.started_at     = now;
  metrics.scheduled_time = scheduled_time;
  if (scheduled_time && now > *scheduled_time) {
    metrics.start_delay = std::chrono::duration_cast<std::chrono::milliseconds>(now - *scheduled_time);
  }

  std::lock_guard lock(mutex_);
  active_[metrics.execution_id] = metrics;
  return metrics.execution_id;
}

std::optional<ExecutionMetrics> SlaMonitor::RecordCompletion(const std::string& execution_id, bool success,
                                                             const std::optional<SlaConfig>& sla, std::optional<std::string> error,
                                                             util::TimePoint now) {
  ExecutionMetrics metrics;
  {
    std::lock_guard lock(mutex_);
    auto            it = active_.find(execution_id);
    if (it == active_.end()) return std::nullopt;

    metrics = std::move(it->second);
    active_.erase(it);

    metrics.completed_at = now;
    metrics.success      = success;
    metrics.error        = std::move(error);
    metrics.duration     = std::chrono::duration_cast<std::chrono::milliseconds>(now - metrics.started_at);

    auto& history = history_[metrics.schedule_id];
    history.push_back(metrics);
    if (history.size() > history_limit_) {
      history.erase(history.begin(), history.begin() + static_cast<std::ptrdiff_t>(history.size() - history_limit_ / 2));
    }
  }

  if (sla) CheckSla(metrics, *sla);
  return metrics;
}

void SlaMonitor::CheckSla(const ExecutionMetrics& metrics, const SlaConfig& sla) {
  std::vector<std::string> breaches;

  if (sla.max_duration && sla.max_duration->count() > 0) {
    const auto limit = std::chrono::duration_cast<std::chrono::milliseconds>(*sla.max_duration);
    if (metrics.duration > limit) {
      breaches.push_back("Duration " + std::to_string(metrics.duration.count()) + "ms exceeded limit " + std::to_string(limit.count()) + "ms");
      observability::Metrics::Instance().RecordSlaBreach("duration");
    }
  }
  if (sla.max_start_delay && sla.max_start_delay->count() > 0) {
    const auto limit = std::chrono::duration_cast<std::chrono::milliseconds>(*sla.max_start_delay);
    if (metrics.start_delay > limit) {
      breaches.push_back("Start delay " + std::to_string(metrics.start_delay.count()) + "ms exceeded limit " + std::to_string(limit.count()) +
                         "ms");
      observability::Metrics::Instance().RecordSlaBreach("start_delay");
    }
  }
  if (breaches.empty()) return;

  std::string message;
  for (size_t i = 0; i < breaches.size(); ++i) {
    if (i > 0) message += "; ";
    message += breaches[i];
  }
  FLEET_LOG_WARN("SLA breach", {StringField("schedule_id", metrics.schedule_id), StringField("detail", message)});

  std::vector<SlaAlertCallback> callbacks;
  {
    std::lock_guard lock(mutex_);
    callbacks = callbacks_;
  }
  for (const auto& callback : callbacks) {
    try {
      callback(metrics.schedule_id, SlaStatus::kBreached, message);
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("SLA alert callback failed", {StringField("schedule_id", metrics.schedule_id), StringField("error", e.what())});
    }
  }
  if (sla.on_breach) {
    try {
      sla.on_breach(metrics.schedule_id, message);
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("SLA breach handler failed", {StringField("schedule_id", metrics.schedule_id), StringField("error", e.what())});
    }
  }
}

std::vector<ExecutionMetrics> SlaMonitor::GetMetrics(const std::string& schedule_id, std::optional<util::TimePoint> since, size_t limit) const {
  std::lock_guard lock(mutex_);
  std::vector<ExecutionMetrics> out;

  auto it = history_.find(schedule_id);
  if (it == history_.end()) return out;

  for (auto m = it->second.rbegin(); m != it->second.rend() && out.size() < limit; ++m) {
    if (since && m->started_at < *since) continue;
    out.push_back(*m);
  }
  return out;
}

std::vector<ExecutionMetrics> SlaMonitor::WindowLocked(const std::string& schedule_id, util::TimePoint since) const {
  std::vector<ExecutionMetrics> out;
  auto                          it = history_.find(schedule_id);
  if (it == history_.end()) return out;
  for (const auto& m : it->second) {
    if (m.started_at >= since) out.push_back(m);
  }
  return out;
}

double SlaMonitor::GetSuccessRate(const std::string& schedule_id, std::chrono::hours window) const {
  std::lock_guard lock(mutex_);
  const auto      runs = WindowLocked(schedule_id, util::Now() - window);
  if (runs.empty()) return 100.0;

  const auto ok = std::count_if(runs.begin(), runs.end(), [](const ExecutionMetrics& m) { return m.success; });
  return static_cast<double>(ok) / static_cast<double>(runs.size()) * 100.0;
}

std::chrono::milliseconds SlaMonitor::GetAverageDuration(const std::string& schedule_id, std::chrono::hours window) const {
  std::lock_guard lock(mutex_);
  const auto      runs = WindowLocked(schedule_id, util::Now() - window);
  if (runs.empty()) return std::chrono::milliseconds{0};

  std::chrono::milliseconds total{0};
  for (const auto& m : runs) {
    total += m.duration;
  }
  return total / static_cast<int64_t>(runs.size());
}

size_t SlaMonitor::ActiveExecutions() const {
  std::lock_guard lock(mutex_);
  return active_.size();
}

} // namespace fleet::scheduling
