#include "execution_queue.hpp"

#include <utility>

namespace fleet::scheduling {

std::string_view ToString(ExecutionKind kind) {
  switch (kind) {
    case ExecutionKind::kScheduled:
      return "scheduled";
    case ExecutionKind::kEvent:
      return "event";
    case ExecutionKind::kDependency:
      return "dependency";
    case ExecutionKind::kCatchUp:
      return "catch_up";
    case ExecutionKind::kManual:
      return "manual";
  }
  return "unknown";
}

bool ExecutionQueue::Enqueue(ExecutionTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<ExecutionTask> ExecutionQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  ExecutionTask task = std::move(queue_.front());
  queue_.pop_front();
  return task;
}

size_t ExecutionQueue::Shutdown(bool drain) {
  size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    if (!drain) {
      dropped = queue_.size();
      queue_.clear();
    }
  }
  cv_.notify_all();
  return dropped;
}

void ExecutionQueue::Reset() {
  std::lock_guard lock(mutex_);
  queue_.clear();
  shutdown_ = false;
}

size_t ExecutionQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace fleet::scheduling
