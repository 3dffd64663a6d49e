#include "rate_limiter.hpp"

#include <algorithm>

namespace fleet::scheduling {

SlidingWindowRateLimiter::SlidingWindowRateLimiter(int max_executions, util::Seconds window)
    : max_executions_(std::max(0, max_executions)), window_(window) {
}

std::deque<util::TimePoint>& SlidingWindowRateLimiter::PruneLocked(const std::string& schedule_id, util::TimePoint now) {
  auto&      entries = executions_[schedule_id];
  const auto cutoff  = now - window_;
  while (!entries.empty() && entries.front() <= cutoff) {
    entries.pop_front();
  }
  return entries;
}

bool SlidingWindowRateLimiter::CanExecute(const std::string& schedule_id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  return static_cast<int>(PruneLocked(schedule_id, now).size()) < max_executions_;
}

void SlidingWindowRateLimiter::RecordExecution(const std::string& schedule_id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  auto&           entries = PruneLocked(schedule_id, now);
  // Keep the deque ordered even if callers pass stale timestamps.
  entries.insert(std::upper_bound(entries.begin(), entries.end(), now), now);
}

util::Seconds SlidingWindowRateLimiter::GetWaitTime(const std::string& schedule_id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  const auto&     entries = PruneLocked(schedule_id, now);
  if (static_cast<int>(entries.size()) < max_executions_) return util::Seconds{0};
  if (entries.empty()) return window_;

  // The slot frees once the oldest entry leaves the window.
  const auto wait = std::chrono::ceil<util::Seconds>(entries.front() + window_ - now);
  return std::max(util::Seconds{0}, wait);
}

int SlidingWindowRateLimiter::GetRemainingCapacity(const std::string& schedule_id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  return std::max(0, max_executions_ - static_cast<int>(PruneLocked(schedule_id, now).size()));
}

} // namespace fleet::scheduling
