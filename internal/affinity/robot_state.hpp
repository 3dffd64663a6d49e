#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace fleet::affinity {

enum class StateAffinityLevel : std::uint8_t {
  kNone    = 0,
  kSoft    = 1,
  kHard    = 2,
  kSession = 3,
};

constexpr std::string_view ToString(StateAffinityLevel level) {
  switch (level) {
    case StateAffinityLevel::kSoft:
      return "soft";
    case StateAffinityLevel::kHard:
      return "hard";
    case StateAffinityLevel::kSession:
      return "session";
    case StateAffinityLevel::kNone:
    default:
      return "none";
  }
}

std::optional<StateAffinityLevel> ParseAffinityLevel(std::string_view value);

// Well-known state kinds; any other string is accepted as a custom kind.
namespace state_type {
constexpr std::string_view kBrowserSession     = "browser_session";
constexpr std::string_view kFileSystem         = "file_system";
constexpr std::string_view kMemoryCache        = "memory_cache";
constexpr std::string_view kCredentials        = "credentials";
constexpr std::string_view kDatabaseConnection = "database_connection";
constexpr std::string_view kCustom             = "custom";
} // namespace state_type

/*
  One unit of recoverable state held by a robot for a workflow.
  Owned by StateAffinityManager; callers only ever see copies.
*/
struct RobotState {
  std::string                        state_id;
  std::string                        robot_id;
  std::string                        workflow_id;
  std::string                        state_type;
  util::TimePoint                    created_at{};
  util::TimePoint                    last_accessed{};
  std::optional<util::TimePoint>     expires_at;
  std::int64_t                       size_bytes{0};
  bool                               is_migratable{true};
  std::map<std::string, std::string> metadata;

  bool IsExpired(util::TimePoint now) const {
    return expires_at && now > *expires_at;
  }
};

struct WorkflowSession {
  std::string          session_id;
  std::string          workflow_id;
  std::string          robot_id;
  std::string          chain_id;
  util::TimePoint      started_at{};
  util::TimePoint      last_activity{};
  int                  job_count{0};
  std::chrono::seconds timeout{std::chrono::hours(1)};

  bool IsExpired(util::TimePoint now) const {
    return now - last_activity > timeout;
  }
};

struct StateAffinityDecision {
  std::optional<std::string> selected_robot_id;
  StateAffinityLevel         affinity_level{StateAffinityLevel::kNone};
  std::string                decision_reason;
  bool                       has_state{false};
  std::vector<std::string>   state_robots;
  bool                       fallback_used{false};
  bool                       should_queue{false};
  std::chrono::seconds       queue_delay{0};
  bool                       migration_required{false};
  std::optional<std::string> migration_source_robot;
  std::optional<std::string> session_id;
};

struct MigrationResult {
  size_t succeeded{0};
  size_t failed{0};
};

struct CleanupCounts {
  size_t states{0};
  size_t sessions{0};
  size_t queue_attempts{0};
};

struct AffinityStatistics {
  size_t                        total_states{0};
  std::map<std::string, size_t> states_by_type;
  size_t                        tracked_workflows{0};
  size_t                        robots_with_state{0};
  std::int64_t                  total_state_bytes{0};
  size_t                        active_sessions{0};
  size_t                        pending_queue_attempts{0};
  size_t                        migration_handlers{0};
};

struct WorkflowStateSummary {
  std::string                                     workflow_id;
  std::map<std::string, std::vector<std::string>> state_types_by_robot;
  std::int64_t                                    total_bytes{0};
  std::optional<WorkflowSession>                  session;
};

} // namespace fleet::affinity
