#include "state_affinity_manager.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace fleet::affinity {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

namespace {

double DefaultScore(const model::RobotInfo& robot) {
  return 100.0 - (robot.Utilization() + robot.cpu_percent) / 2.0;
}

// First best wins, so equal scores keep input order.
std::optional<std::string> ScoreAndSelect(const std::vector<model::RobotInfo>& candidates, const RobotScorer& scorer) {
  if (candidates.empty()) return std::nullopt;

  const model::RobotInfo* best       = nullptr;
  double                  best_score = 0.0;
  for (const auto& robot : candidates) {
    const double score = scorer ? scorer(robot) : DefaultScore(robot);
    if (!best || score > best_score) {
      best       = &robot;
      best_score = score;
    }
  }
  return best->id;
}

std::string JoinIds(const std::vector<std::string>& ids) {
  std::ostringstream out;
  out << '[';
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) out << ", ";
    out << ids[i];
  }
  out << ']';
  return out.str();
}

std::string ShortId(const std::string& id) {
  return id.substr(0, 8);
}

void RecordDecision(const StateAffinityDecision& decision) {
  std::string_view outcome = "none";
  if (decision.selected_robot_id) {
    outcome = "selected";
  } else if (decision.should_queue) {
    outcome = "queued";
  }
  observability::Metrics::Instance().RecordAffinityDecision(ToString(decision.affinity_level), outcome);
}

} // namespace

std::optional<StateAffinityLevel> ParseAffinityLevel(std::string_view value) {
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "none" || lower.empty()) return StateAffinityLevel::kNone;
  if (lower == "soft") return StateAffinityLevel::kSoft;
  if (lower == "hard") return StateAffinityLevel::kHard;
  if (lower == "session") return StateAffinityLevel::kSession;
  return std::nullopt;
}

StateAffinityManager::StateAffinityManager(StateAffinityOptions options) : options_(options) {
}

StateAffinityManager::~StateAffinityManager() {
  try {
    Stop();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("State affinity sweep shutdown failed", {StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Background sweep
// ------------------------------------------------------------

void StateAffinityManager::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&StateAffinityManager::Loop, this);
  FLEET_LOG_INFO("State affinity sweep started", {DurationField("interval", options_.cleanup_interval)});
}

void StateAffinityManager::Stop() {
  {
    std::lock_guard lock(sweep_mutex_);
    if (!running_) return;
    running_ = false;
  }
  sweep_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void StateAffinityManager::Loop() {
  std::unique_lock lock(sweep_mutex_);
  while (running_) {
    sweep_cv_.wait_for(lock, options_.cleanup_interval, [&] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      const auto counts = CleanupExpired();
      if (counts.states > 0 || counts.sessions > 0) {
        FLEET_LOG_DEBUG("State affinity cleanup", {IntField("states", static_cast<int64_t>(counts.states)),
                                                   IntField("sessions", static_cast<int64_t>(counts.sessions))});
      }
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("State affinity cleanup failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

// ------------------------------------------------------------
// State registry
// ------------------------------------------------------------

RobotState StateAffinityManager::RegisterState(const std::string& robot_id, const std::string& workflow_id, const std::string& state_type,
                                               std::optional<std::chrono::seconds> ttl, std::int64_t size_bytes, bool is_migratable,
                                               std::map<std::string, std::string> metadata) {
  const auto now       = util::Now();
  const auto effective = ttl.value_or(options_.default_state_ttl);

  RobotState state;
  state.state_id      = util::GenerateId(util::IdKind::kState);
  state.robot_id      = robot_id;
  state.workflow_id   = workflow_id;
  state.state_type    = state_type;
  state.created_at    = now;
  state.last_accessed = now;
  if (effective.count() > 0) state.expires_at = now + effective;
  state.size_bytes    = size_bytes;
  state.is_migratable = is_migratable;
  state.metadata      = std::move(metadata);

  {
    std::lock_guard lock(mutex_);
    states_[workflow_id][robot_id].push_back(state);
  }

  FLEET_LOG_DEBUG("Registered robot state",
                  {StringField("workflow_id", workflow_id), StringField("robot_id", robot_id), StringField("state_type", state_type)});
  return state;
}

size_t StateAffinityManager::UnregisterState(const std::string& robot_id, const std::string& workflow_id,
                                             const std::optional<std::string>& state_type) {
  std::lock_guard lock(mutex_);

  auto wf = states_.find(workflow_id);
  if (wf == states_.end()) return 0;

  auto robot = wf->second.find(robot_id);
  if (robot == wf->second.end()) return 0;

  auto&  items   = robot->second;
  size_t removed = 0;
  if (state_type) {
    const auto before = items.size();
    items.erase(std::remove_if(items.begin(), items.end(), [&](const RobotState& s) { return s.state_type == *state_type; }), items.end());
    removed = before - items.size();
  } else {
    removed = items.size();
    items.clear();
  }

  if (items.empty()) wf->second.erase(robot);
  if (wf->second.empty()) states_.erase(wf);
  return removed;
}

bool StateAffinityManager::TouchState(const std::string& robot_id, const std::string& workflow_id) {
  std::lock_guard lock(mutex_);

  auto wf = states_.find(workflow_id);
  if (wf == states_.end()) return false;
  auto robot = wf->second.find(robot_id);
  if (robot == wf->second.end()) return false;

  const auto now     = util::Now();
  bool       touched = false;
  for (auto& state : robot->second) {
    if (state.IsExpired(now)) continue;
    state.last_accessed = now;
    touched             = true;
  }
  return touched;
}

bool StateAffinityManager::HasStateLocked(const std::string& robot_id, const std::string& workflow_id, util::TimePoint now) const {
  auto wf = states_.find(workflow_id);
  if (wf == states_.end()) return false;
  auto robot = wf->second.find(robot_id);
  if (robot == wf->second.end()) return false;
  return std::any_of(robot->second.begin(), robot->second.end(), [&](const RobotState& s) { return !s.IsExpired(now); });
}

std::vector<std::string> StateAffinityManager::RobotsWithStateLocked(const std::string& workflow_id, util::TimePoint now) const {
  std::vector<std::string> robots;
  auto                     wf = states_.find(workflow_id);
  if (wf == states_.end()) return robots;

  for (const auto& [robot_id, items] : wf->second) {
    if (std::any_of(items.begin(), items.end(), [&](const RobotState& s) { return !s.IsExpired(now); })) {
      robots.push_back(robot_id);
    }
  }
  return robots;
}

bool StateAffinityManager::HasStateFor(const std::string& robot_id, const std::string& workflow_id) const {
  std::lock_guard lock(mutex_);
  return HasStateLocked(robot_id, workflow_id, util::Now());
}

std::vector<std::string> StateAffinityManager::GetRobotsWithState(const std::string& workflow_id) const {
  std::lock_guard lock(mutex_);
  return RobotsWithStateLocked(workflow_id, util::Now());
}

std::vector<RobotState> StateAffinityManager::GetStateForRobot(const std::string& robot_id, const std::string& workflow_id) const {
  std::lock_guard lock(mutex_);

  std::vector<RobotState> out;
  auto                    wf = states_.find(workflow_id);
  if (wf == states_.end()) return out;
  auto robot = wf->second.find(robot_id);
  if (robot == wf->second.end()) return out;

  const auto now = util::Now();
  for (const auto& state : robot->second) {
    if (!state.IsExpired(now)) out.push_back(state);
  }
  return out;
}

std::map<std::string, std::vector<RobotState>> StateAffinityManager::GetAllStateForWorkflow(const std::string& workflow_id) const {
  std::lock_guard lock(mutex_);

  std::map<std::string, std::vector<RobotState>> out;
  auto                                           wf = states_.find(workflow_id);
  if (wf == states_.end()) return out;

  const auto now = util::Now();
  for (const auto& [robot_id, items] : wf->second) {
    for (const auto& state : items) {
      if (!state.IsExpired(now)) out[robot_id].push_back(state);
    }
  }
  return out;
}

// ------------------------------------------------------------
// Sessions
// ------------------------------------------------------------

WorkflowSession StateAffinityManager::NewSessionLocked(const std::string& workflow_id, const std::string& robot_id,
                                                       const std::optional<std::string>& chain_id, std::chrono::seconds timeout,
                                                       util::TimePoint now) {
  WorkflowSession session;
  session.session_id    = util::GenerateId(util::IdKind::kSession);
  session.workflow_id   = workflow_id;
  session.robot_id      = robot_id;
  session.chain_id      = chain_id.value_or(session.session_id);
  session.started_at    = now;
  session.last_activity = now;
  session.timeout       = timeout;
  sessions_[workflow_id] = session;
  return session;
}

WorkflowSession StateAffinityManager::CreateSession(const std::string& workflow_id, const std::string& robot_id,
                                                    const std::optional<std::string>& chain_id, std::optional<std::chrono::seconds> timeout) {
  WorkflowSession session;
  {
    std::lock_guard lock(mutex_);
    session = NewSessionLocked(workflow_id, robot_id, chain_id, timeout.value_or(options_.session_timeout), util::Now());
  }

  FLEET_LOG_INFO("Workflow session created", {StringField("workflow_id", workflow_id), StringField("robot_id", robot_id),
                                              StringField("session_id", ShortId(session.session_id))});
  return session;
}

std::optional<WorkflowSession> StateAffinityManager::LiveSessionLocked(const std::string& workflow_id, util::TimePoint now) const {
  auto it = sessions_.find(workflow_id);
  if (it == sessions_.end() || it->second.IsExpired(now)) return std::nullopt;
  return it->second;
}

std::optional<WorkflowSession> StateAffinityManager::GetSession(const std::string& workflow_id) const {
  std::lock_guard lock(mutex_);
  return LiveSessionLocked(workflow_id, util::Now());
}

std::optional<std::string> StateAffinityManager::GetSessionRobot(const std::string& workflow_id) const {
  auto session = GetSession(workflow_id);
  if (!session) return std::nullopt;
  return session->robot_id;
}

bool StateAffinityManager::RecordSessionJob(const std::string& workflow_id) {
  std::lock_guard lock(mutex_);

  const auto now = util::Now();
  auto       it  = sessions_.find(workflow_id);
  if (it == sessions_.end() || it->second.IsExpired(now)) return false;

  it->second.job_count += 1;
  it->second.last_activity = now;
  return true;
}

bool StateAffinityManager::EndSession(const std::string& workflow_id) {
  std::lock_guard lock(mutex_);
  return sessions_.erase(workflow_id) > 0;
}

// ------------------------------------------------------------
// Selection
// ------------------------------------------------------------

StateAffinityDecision StateAffinityManager::SelectRobot(const std::string& workflow_id, StateAffinityLevel level,
                                                        const std::vector<model::RobotInfo>& robots, const std::optional<std::string>& job_id,
                                                        const RobotScorer& scorer, const std::optional<std::string>& chain_id) {
  std::vector<model::RobotInfo> available;
  for (const auto& robot : robots) {
    if (robot.IsAvailable()) available.push_back(robot);
  }

  std::vector<model::RobotInfo> holders;
  std::vector<std::string>      holder_ids;
  {
    std::lock_guard lock(mutex_);
    const auto      now = util::Now();
    for (const auto& robot : available) {
      if (HasStateLocked(robot.id, workflow_id, now)) {
        holders.push_back(robot);
        holder_ids.push_back(robot.id);
      }
    }
  }

  StateAffinityDecision decision;
  decision.affinity_level = level;
  decision.state_robots   = holder_ids;

  switch (level) {
    case StateAffinityLevel::kHard:
      decision = SelectHard(workflow_id, available, holders, job_id, scorer);
      break;

    case StateAffinityLevel::kSession:
      decision = SelectSession(workflow_id, available, holders, scorer, chain_id);
      break;

    case StateAffinityLevel::kSoft:
      if (!holders.empty()) {
        decision.selected_robot_id = ScoreAndSelect(holders, scorer);
        decision.has_state         = true;
        decision.decision_reason   = "Selected robot with existing state";
        break;
      }

      decision.fallback_used     = true;
      decision.selected_robot_id = ScoreAndSelect(available, scorer);
      decision.decision_reason   = available.empty() ? "No available robots" : "No robot with state available, falling back to best available";

      // state stranded on a robot that is not available right now
      for (const auto& source : GetRobotsWithState(workflow_id)) {
        const bool is_available =
            std::any_of(available.begin(), available.end(), [&](const model::RobotInfo& r) { return r.id == source; });
        if (is_available) continue;

        const auto items = GetStateForRobot(source, workflow_id);
        if (std::any_of(items.begin(), items.end(), [](const RobotState& s) { return s.is_migratable; })) {
          decision.migration_required     = true;
          decision.migration_source_robot = source;
          decision.decision_reason += " (migration possible)";
          break;
        }
      }
      break;

    case StateAffinityLevel::kNone:
    default:
      decision.selected_robot_id = ScoreAndSelect(available, scorer);
      decision.decision_reason   = available.empty() ? "No available robots" : "No affinity required, selected best available robot";
      break;
  }

  RecordDecision(decision);
  FLEET_LOG_DEBUG("Affinity decision", {StringField("workflow_id", workflow_id), StringField("level", ToString(level)),
                                        StringField("robot_id", decision.selected_robot_id.value_or("")),
                                        StringField("reason", decision.decision_reason)});
  return decision;
}

StateAffinityDecision StateAffinityManager::SelectHard(const std::string& workflow_id, const std::vector<model::RobotInfo>& available,
                                                       const std::vector<model::RobotInfo>& holders, const std::optional<std::string>& job_id,
                                                       const RobotScorer& scorer) {
  StateAffinityDecision decision;
  decision.affinity_level = StateAffinityLevel::kHard;

  if (!holders.empty()) {
    for (const auto& robot : holders) decision.state_robots.push_back(robot.id);
    decision.selected_robot_id = ScoreAndSelect(holders, scorer);
    decision.has_state         = true;
    decision.decision_reason   = "Selected robot with required state";
    if (job_id) ClearQueueAttempts(*job_id);
    return decision;
  }

  const auto all_holders = GetRobotsWithState(workflow_id);
  decision.state_robots  = all_holders;

  if (all_holders.empty() && !available.empty()) {
    // first run of a workflow: nothing to stick to yet
    decision.selected_robot_id = ScoreAndSelect(available, scorer);
    decision.fallback_used     = true;
    decision.decision_reason   = "No state exists yet, allowing any robot for initial execution";
    if (job_id) ClearQueueAttempts(*job_id);
    return decision;
  }

  int attempt = 0;
  if (job_id) {
    std::lock_guard lock(mutex_);
    attempt = queue_attempts_[*job_id].count;
    if (attempt >= options_.max_queue_attempts) {
      observability::Metrics::Instance().RecordAffinityDecision("hard", "exhausted");
      throw util::SessionAffinityError("Max queue attempts (" + std::to_string(options_.max_queue_attempts) + ") exceeded, required robots " +
                                           JoinIds(all_holders) + " unavailable",
                                       workflow_id, all_holders.empty() ? std::string{} : all_holders.front());
    }
    queue_attempts_[*job_id] = QueueAttempt{attempt + 1, util::Now()};
  }

  auto delay = options_.hard_affinity_queue_delay;
  for (int i = 0; i < attempt && delay < options_.max_queue_delay; ++i) delay *= 2;
  decision.queue_delay  = std::min(delay, options_.max_queue_delay);
  decision.should_queue = true;

  if (all_holders.empty()) {
    decision.decision_reason = "No available robots";
  } else {
    decision.decision_reason = "Required robots " + JoinIds(all_holders) + " unavailable, requeuing (attempt " + std::to_string(attempt + 1) + "/" +
                               std::to_string(options_.max_queue_attempts) + ")";
  }
  return decision;
}

StateAffinityDecision StateAffinityManager::SelectSession(const std::string& workflow_id, const std::vector<model::RobotInfo>& available,
                                                          const std::vector<model::RobotInfo>& holders, const RobotScorer& scorer,
                                                          const std::optional<std::string>& chain_id) {
  StateAffinityDecision decision;
  decision.affinity_level = StateAffinityLevel::kSession;

  // scored before locking; the scorer is caller code
  const auto candidate = holders.empty() ? ScoreAndSelect(available, scorer) : ScoreAndSelect(holders, scorer);

  // lookup, create-if-absent and job accounting are one step so concurrent
  // selections for a workflow always agree on its session
  std::optional<WorkflowSession> existing;
  std::optional<WorkflowSession> created;
  bool                           pinned_available = false;
  {
    std::lock_guard lock(mutex_);
    const auto      now = util::Now();

    existing = LiveSessionLocked(workflow_id, now);
    if (existing) {
      pinned_available =
          std::any_of(available.begin(), available.end(), [&](const model::RobotInfo& r) { return r.id == existing->robot_id; });
      if (pinned_available) {
        auto& live = sessions_[workflow_id];
        live.job_count += 1;
        live.last_activity = now;
      }
    } else if (candidate) {
      created = NewSessionLocked(workflow_id, *candidate, chain_id, options_.session_timeout, now);
      auto& live = sessions_[workflow_id];
      live.job_count += 1;
      live.last_activity = now;
    }
  }

  if (existing) {
    if (!pinned_available) {
      observability::Metrics::Instance().RecordAffinityDecision("session", "error");
      throw util::SessionAffinityError("Session robot " + existing->robot_id + " is not available. Session has " +
                                           std::to_string(existing->job_count) + " previous jobs.",
                                       workflow_id, existing->robot_id);
    }

    decision.selected_robot_id = existing->robot_id;
    decision.has_state         = true;
    decision.state_robots      = {existing->robot_id};
    decision.session_id        = existing->session_id;
    decision.decision_reason   = "Using session robot (session " + ShortId(existing->session_id) + ", " +
                               std::to_string(existing->job_count) + " previous jobs)";
    return decision;
  }

  for (const auto& robot : holders) decision.state_robots.push_back(robot.id);

  if (!created) {
    decision.decision_reason = "No available robots";
    return decision;
  }

  FLEET_LOG_INFO("Workflow session created", {StringField("workflow_id", workflow_id), StringField("robot_id", created->robot_id),
                                              StringField("session_id", ShortId(created->session_id))});

  decision.selected_robot_id = created->robot_id;
  decision.has_state         = !holders.empty();
  decision.session_id        = created->session_id;
  decision.decision_reason   = holders.empty() ? "Starting new session" : "Starting new session with existing state";
  return decision;
}

// ------------------------------------------------------------
// Migration
// ------------------------------------------------------------

void StateAffinityManager::RegisterMigrationHandler(const std::string& state_type, MigrationHandler handler) {
  std::lock_guard lock(mutex_);
  migration_handlers_[state_type] = std::move(handler);
}

MigrationResult StateAffinityManager::MigrateState(const std::string& workflow_id, const std::string& source_robot, const std::string& target_robot,
                                                   const std::optional<std::vector<std::string>>& state_types) {
  auto items = GetStateForRobot(source_robot, workflow_id);
  if (state_types) {
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const RobotState& s) {
                                 return std::find(state_types->begin(), state_types->end(), s.state_type) == state_types->end();
                               }),
                items.end());
  }

  MigrationResult result;
  for (const auto& item : items) {
    if (!item.is_migratable) {
      FLEET_LOG_WARN("State is not migratable", {StringField("workflow_id", workflow_id), StringField("state_type", item.state_type)});
      ++result.failed;
      continue;
    }

    MigrationHandler handler;
    {
      std::lock_guard lock(mutex_);
      auto            it = migration_handlers_.find(item.state_type);
      if (it != migration_handlers_.end()) handler = it->second;
    }
    if (!handler) {
      FLEET_LOG_WARN("No migration handler for state type", {StringField("state_type", item.state_type)});
      ++result.failed;
      continue;
    }

    try {
      handler(source_robot, target_robot, item);
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("State migration failed", {StringField("state_type", item.state_type), StringField("source", source_robot),
                                                 StringField("target", target_robot), StringField("error", e.what())});
      ++result.failed;
      continue;
    }

    // move the item under the lock; it may have expired or been removed meanwhile
    bool moved = false;
    {
      std::lock_guard lock(mutex_);
      auto            wf = states_.find(workflow_id);
      if (wf != states_.end()) {
        auto source = wf->second.find(source_robot);
        if (source != wf->second.end()) {
          auto& list = source->second;
          auto  it   = std::find_if(list.begin(), list.end(), [&](const RobotState& s) { return s.state_id == item.state_id; });
          if (it != list.end()) {
            RobotState migrated = *it;
            list.erase(it);
            if (list.empty()) wf->second.erase(source);

            const auto now         = util::Now();
            migrated.robot_id      = target_robot;
            migrated.last_accessed = now;
            if (migrated.expires_at) migrated.expires_at = now + (*migrated.expires_at - migrated.created_at);
            migrated.created_at = now;
            wf->second[target_robot].push_back(std::move(migrated));
            moved = true;
          }
        }
      }
    }

    if (moved) {
      ++result.succeeded;
      FLEET_LOG_INFO("State migrated",
                     {StringField("state_type", item.state_type), StringField("source", source_robot), StringField("target", target_robot)});
    } else {
      ++result.failed;
    }
  }
  return result;
}

void StateAffinityManager::ClearQueueAttempts(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  queue_attempts_.erase(job_id);
}

int StateAffinityManager::QueueAttempts(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  auto            it = queue_attempts_.find(job_id);
  return it == queue_attempts_.end() ? 0 : it->second.count;
}

// ------------------------------------------------------------
// Cleanup / statistics
// ------------------------------------------------------------

CleanupCounts StateAffinityManager::CleanupExpired() {
  std::lock_guard lock(mutex_);

  const auto    now = util::Now();
  CleanupCounts counts;

  for (auto wf = states_.begin(); wf != states_.end();) {
    for (auto robot = wf->second.begin(); robot != wf->second.end();) {
      auto& items  = robot->second;
      auto  before = items.size();
      items.erase(std::remove_if(items.begin(), items.end(), [&](const RobotState& s) { return s.IsExpired(now); }), items.end());
      counts.states += before - items.size();
      robot = items.empty() ? wf->second.erase(robot) : std::next(robot);
    }
    wf = wf->second.empty() ? states_.erase(wf) : std::next(wf);
  }

  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second.IsExpired(now)) {
      it = sessions_.erase(it);
      ++counts.sessions;
    } else {
      ++it;
    }
  }

  // a requeued job retries within max_queue_delay; older counters belong to
  // jobs that were dropped or rerouted
  const auto stale_before = now - 2 * options_.max_queue_delay;
  for (auto it = queue_attempts_.begin(); it != queue_attempts_.end();) {
    if (it->second.count >= options_.max_queue_attempts || it->second.last_attempt < stale_before) {
      it = queue_attempts_.erase(it);
      ++counts.queue_attempts;
    } else {
      ++it;
    }
  }
  return counts;
}

AffinityStatistics StateAffinityManager::GetStatistics() const {
  std::lock_guard lock(mutex_);

  const auto            now = util::Now();
  AffinityStatistics    stats;
  std::set<std::string> robots;

  for (const auto& [workflow_id, by_robot] : states_) {
    bool workflow_has_state = false;
    for (const auto& [robot_id, items] : by_robot) {
      for (const auto& state : items) {
        if (state.IsExpired(now)) continue;
        ++stats.total_states;
        ++stats.states_by_type[state.state_type];
        stats.total_state_bytes += state.size_bytes;
        robots.insert(robot_id);
        workflow_has_state = true;
      }
    }
    if (workflow_has_state) ++stats.tracked_workflows;
  }
  stats.robots_with_state = robots.size();

  for (const auto& [workflow_id, session] : sessions_) {
    if (!session.IsExpired(now)) ++stats.active_sessions;
  }
  stats.pending_queue_attempts = queue_attempts_.size();
  stats.migration_handlers     = migration_handlers_.size();
  return stats;
}

WorkflowStateSummary StateAffinityManager::GetWorkflowStateSummary(const std::string& workflow_id) const {
  std::lock_guard lock(mutex_);

  const auto           now = util::Now();
  WorkflowStateSummary summary;
  summary.workflow_id = workflow_id;

  auto wf = states_.find(workflow_id);
  if (wf != states_.end()) {
    for (const auto& [robot_id, items] : wf->second) {
      for (const auto& state : items) {
        if (state.IsExpired(now)) continue;
        summary.state_types_by_robot[robot_id].push_back(state.state_type);
        summary.total_bytes += state.size_bytes;
      }
    }
  }
  summary.session = LiveSessionLocked(workflow_id, now);
  return summary;
}

} // namespace fleet::affinity
