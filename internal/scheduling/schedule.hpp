#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/util/time.hpp"

namespace fleet::scheduling {

enum class ScheduleType { kInterval, kCron, kEvent, kDependency, kOneTime };

enum class ScheduleStatus { kActive, kPaused, kDisabled, kCompleted, kError };

enum class SlaStatus { kOk, kAtRisk, kBreached, kUnknown };

enum class EventType { kFileArrival, kWebhook, kDatabaseChange, kQueueMessage, kWorkflowCompleted, kCustom };

std::string_view ToString(ScheduleType type);
std::string_view ToString(ScheduleStatus status);
std::string_view ToString(SlaStatus status);
std::string_view ToString(EventType type);

std::optional<ScheduleType>   ParseScheduleType(std::string_view value);
std::optional<ScheduleStatus> ParseScheduleStatus(std::string_view value);
std::optional<EventType>      ParseEventType(std::string_view value);

struct AdvancedSchedule;

// (schedule_id, message)
using SlaBreachHandler = std::function<void(const std::string&, const std::string&)>;

struct SlaConfig {
  std::optional<util::Seconds> max_duration;
  std::optional<util::Seconds> max_start_delay{util::Seconds{300}};
  double                       success_rate_threshold{95.0};
  int                          consecutive_failure_limit{3};
  SlaBreachHandler             on_breach;
};

struct RateLimitConfig {
  int           max_executions{10};
  util::Seconds window{3600};
  bool          queue_overflow{true};
};

struct DependencyConfig {
  std::vector<std::string> depends_on;
  bool                     wait_for_all{true};
  // Completions older than this do not count.
  util::Seconds timeout{3600};
  bool          trigger_on_success_only{true};
};

struct ConditionalConfig {
  std::function<bool(const AdvancedSchedule&)> condition;
  bool                                         retry_on_false{false};
  util::Seconds                                retry_interval{60};
  int                                          max_retries{5};
};

struct CatchUpConfig {
  bool                 enabled{false};
  int                  max_runs{5};
  std::chrono::hours   window{24};
  bool                 sequential{true};
  util::Seconds        sequential_delay{1};
};

struct EventTriggerConfig {
  EventType                                event_type{EventType::kCustom};
  std::string                              event_source;
  std::optional<google::protobuf::Struct>  event_filter;
  util::Seconds                            debounce{0};
};

/*
  AdvancedSchedule

  Definition plus run statistics. The scheduler owns the live copy;
  accessors hand out snapshots.
*/
struct AdvancedSchedule {
  std::string    id;
  std::string    name;
  std::string    workflow_id;
  std::string    workflow_name;
  ScheduleType   type{ScheduleType::kCron};
  ScheduleStatus status{ScheduleStatus::kActive};
  bool           enabled{true};

  // Local time for cron evaluation.
  std::chrono::minutes utc_offset{0};

  std::string                     cron_expression;
  util::Seconds                   interval{0};
  std::optional<util::TimePoint>  start_at; // interval anchor, defaults to the add time
  std::optional<util::TimePoint>  run_at;

  std::optional<std::string> calendar_id;
  bool                       respect_business_hours{false};

  std::optional<SlaConfig>          sla;
  std::optional<RateLimitConfig>    rate_limit;
  std::optional<DependencyConfig>   dependency;
  std::optional<ConditionalConfig>  conditional;
  std::optional<CatchUpConfig>      catch_up;
  std::optional<EventTriggerConfig> event_trigger;

  int                                priority{1};
  std::optional<std::string>         robot_id;
  google::protobuf::Struct           variables;
  std::vector<std::string>           tags;
  std::map<std::string, std::string> metadata;

  std::optional<util::TimePoint> last_run;
  std::optional<util::TimePoint> next_run;
  int64_t                        run_count{0};
  int64_t                        success_count{0};
  int64_t                        failure_count{0};
  int                            consecutive_failures{0};
  int                            consecutive_successes{0};

  std::optional<util::TimePoint> created_at;
  std::string                    created_by;
  std::optional<util::TimePoint> updated_at;

  // 100 when never run.
  double SuccessRate() const;

  // BREACHED at the failure limit or 5 points under the threshold,
  // AT_RISK under the threshold, UNKNOWN without an SLA.
  SlaStatus GetSlaStatus() const;
};

} // namespace fleet::scheduling
