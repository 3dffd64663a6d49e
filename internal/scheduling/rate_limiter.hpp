#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace fleet::scheduling {

/*
  Sliding-window rate limiter keyed by schedule id.

  An execution counts against the window for `window` after it was
  recorded. Thread-safe.
*/
class SlidingWindowRateLimiter {
 public:
  SlidingWindowRateLimiter(int max_executions, util::Seconds window);

  bool CanExecute(const std::string& schedule_id, util::TimePoint now = util::Now());

  void RecordExecution(const std::string& schedule_id, util::TimePoint now = util::Now());

  // Zero when a slot is free.
  util::Seconds GetWaitTime(const std::string& schedule_id, util::TimePoint now = util::Now());

  int GetRemainingCapacity(const std::string& schedule_id, util::TimePoint now = util::Now());

  int max_executions() const {
    return max_executions_;
  }

  util::Seconds window() const {
    return window_;
  }

 private:
  std::deque<util::TimePoint>& PruneLocked(const std::string& schedule_id, util::TimePoint now);

  int           max_executions_;
  util::Seconds window_;

  std::mutex                                                   mutex_;
  std::unordered_map<std::string, std::deque<util::TimePoint>> executions_;
};

} // namespace fleet::scheduling
