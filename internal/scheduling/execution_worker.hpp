#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

#include "internal/scheduling/execution_queue.hpp"

namespace fleet::scheduling {

using ExecutionHandler = std::function<void(const ExecutionTask&)>;

/*
  Background worker that runs queued schedule executions.

  Exits when the queue is shut down and empty.
*/
class ExecutionWorker {
 public:
  ExecutionWorker(std::shared_ptr<ExecutionQueue> queue, ExecutionHandler handler);
  ~ExecutionWorker();

  void Start();

  // Joins; the queue must already be shut down.
  void Stop();

 private:
  void Run();

  std::shared_ptr<ExecutionQueue> queue_;
  ExecutionHandler                handler_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace fleet::scheduling
