#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/scheduling/execution_task.hpp"

namespace fleet::scheduling {

/*
  Thread-safe blocking queue for execution workers.
*/
class ExecutionQueue {
 public:
  // False once shut down.
  bool Enqueue(ExecutionTask task);

  // blocking wait
  std::optional<ExecutionTask> Dequeue();

  // drain=true lets workers finish what is queued; false drops it.
  // Returns the number of dropped tasks.
  size_t Shutdown(bool drain);

  void Reset();

  size_t Size() const;

 private:
  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::deque<ExecutionTask> queue_;
  bool                      shutdown_ = false;
};

} // namespace fleet::scheduling
