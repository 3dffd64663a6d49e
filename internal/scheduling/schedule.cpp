#include "schedule.hpp"

#include <algorithm>
#include <cctype>

namespace fleet::scheduling {

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::string_view ToString(ScheduleType type) {
  switch (type) {
    case ScheduleType::kInterval:
      return "interval";
    case ScheduleType::kCron:
      return "cron";
    case ScheduleType::kEvent:
      return "event";
    case ScheduleType::kDependency:
      return "dependency";
    case ScheduleType::kOneTime:
      return "one_time";
  }
  return "unknown";
}

std::string_view ToString(ScheduleStatus status) {
  switch (status) {
    case ScheduleStatus::kActive:
      return "active";
    case ScheduleStatus::kPaused:
      return "paused";
    case ScheduleStatus::kDisabled:
      return "disabled";
    case ScheduleStatus::kCompleted:
      return "completed";
    case ScheduleStatus::kError:
      return "error";
  }
  return "unknown";
}

std::string_view ToString(SlaStatus status) {
  switch (status) {
    case SlaStatus::kOk:
      return "ok";
    case SlaStatus::kAtRisk:
      return "at_risk";
    case SlaStatus::kBreached:
      return "breached";
    case SlaStatus::kUnknown:
      return "unknown";
  }
  return "unknown";
}

std::string_view ToString(EventType type) {
  switch (type) {
    case EventType::kFileArrival:
      return "file_arrival";
    case EventType::kWebhook:
      return "webhook";
    case EventType::kDatabaseChange:
      return "database_change";
    case EventType::kQueueMessage:
      return "queue_message";
    case EventType::kWorkflowCompleted:
      return "workflow_completed";
    case EventType::kCustom:
      return "custom";
  }
  return "unknown";
}

std::optional<ScheduleType> ParseScheduleType(std::string_view value) {
  const auto v = Lower(value);
  if (v == "interval") return ScheduleType::kInterval;
  if (v == "cron") return ScheduleType::kCron;
  if (v == "event") return ScheduleType::kEvent;
  if (v == "dependency") return ScheduleType::kDependency;
  if (v == "one_time" || v == "once") return ScheduleType::kOneTime;
  return std::nullopt;
}

std::optional<ScheduleStatus> ParseScheduleStatus(std::string_view value) {
  const auto v = Lower(value);
  if (v == "active") return ScheduleStatus::kActive;
  if (v == "paused") return ScheduleStatus::kPaused;
  if (v == "disabled") return ScheduleStatus::kDisabled;
  if (v == "completed") return ScheduleStatus::kCompleted;
  if (v == "error") return ScheduleStatus::kError;
  return std::nullopt;
}

std::optional<EventType> ParseEventType(std::string_view value) {
  const auto v = Lower(value);
  if (v == "file_arrival") return EventType::kFileArrival;
  if (v == "webhook") return EventType::kWebhook;
  if (v == "database_change") return EventType::kDatabaseChange;
  if (v == "queue_message") return EventType::kQueueMessage;
  if (v == "workflow_completed") return EventType::kWorkflowCompleted;
  if (v == "custom") return EventType::kCustom;
  return std::nullopt;
}

double AdvancedSchedule::SuccessRate() const {
  if (run_count == 0) return 100.0;
  return static_cast<double>(success_count) / static_cast<double>(run_count) * 100.0;
}

SlaStatus AdvancedSchedule::GetSlaStatus() const {
  if (!sla) return SlaStatus::kUnknown;
  if (consecutive_failures >= sla->consecutive_failure_limit) return SlaStatus::kBreached;

  const double rate = SuccessRate();
  if (rate < sla->success_rate_threshold - 5.0) return SlaStatus::kBreached;
  if (rate < sla->success_rate_threshold) return SlaStatus::kAtRisk;
  return SlaStatus::kOk;
}

} // namespace fleet::scheduling
