#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/scheduling/schedule.hpp"
#include "internal/util/time.hpp"

namespace fleet::scheduling {

struct ExecutionMetrics {
  std::string                    execution_id;
  std::string                    schedule_id;
  util::TimePoint                started_at;
  std::optional<util::TimePoint> completed_at;
  std::optional<util::TimePoint> scheduled_time;
  bool                           success{false};
  std::chrono::milliseconds      duration{0};
  std::chrono::milliseconds      start_delay{0};
  std::optional<std::string>     error;
};

// (schedule_id, status, message)
using SlaAlertCallback = std::function<void(const std::string&, SlaStatus, const std::string&)>;

/*
  SlaMonitor

  Tracks execution starts and completions per schedule and raises alerts
  when a completed run breaks its duration or start-delay limit.

  History per schedule is capped at `history_limit`; when the cap is
  exceeded the oldest half is dropped.
*/
class SlaMonitor {
 public:
  explicit SlaMonitor(size_t history_limit = 1000);

  void AddAlertCallback(SlaAlertCallback callback);

  // Returns the execution id to pass to RecordCompletion.
  std::string RecordStart(const std::string& schedule_id, std::optional<util::TimePoint> scheduled_time = std::nullopt,
                          util::TimePoint now = util::Now());

  // nullopt for unknown execution ids.
  std::optional<ExecutionMetrics> RecordCompletion(const std::string& execution_id, bool success,
                                                   const std::optional<SlaConfig>& sla = std::nullopt,
                                                   std::optional<std::string> error = std::nullopt, util::TimePoint now = util::Now());

  // Newest first.
  std::vector<ExecutionMetrics> GetMetrics(const std::string& schedule_id, std::optional<util::TimePoint> since = std::nullopt,
                                           size_t limit = 100) const;

  // Percent over the window; 100 with no history.
  double GetSuccessRate(const std::string& schedule_id, std::chrono::hours window = std::chrono::hours{24}) const;

  std::chrono::milliseconds GetAverageDuration(const std::string& schedule_id, std::chrono::hours window = std::chrono::hours{24}) const;

  size_t ActiveExecutions() const;

 private:
  std::vector<ExecutionMetrics> WindowLocked(const std::string& schedule_id, util::TimePoint since) const;
  void CheckSla(const ExecutionMetrics& metrics, const SlaConfig& sla);

  size_t history_limit_;

  mutable std::mutex                                             mutex_;
  std::unordered_map<std::string, std::vector<ExecutionMetrics>> history_;
  std::unordered_map<std::string, ExecutionMetrics>              active_;
  std::vector<SlaAlertCallback>                                  callbacks_;
};

} // namespace fleet::scheduling
