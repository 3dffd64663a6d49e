#include "execution_worker.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace fleet::scheduling {

using observability::StringField;

ExecutionWorker::ExecutionWorker(std::shared_ptr<ExecutionQueue> queue, ExecutionHandler handler)
    : queue_(std::move(queue)), handler_(std::move(handler)) {
}

ExecutionWorker::~ExecutionWorker() {
  try {
    Stop();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Execution worker shutdown failed", {StringField("error", e.what())});
  }
}

void ExecutionWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ExecutionWorker::Run, this);
}

void ExecutionWorker::Stop() {
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void ExecutionWorker::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      handler_(*task);
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("Schedule execution failed", {StringField("schedule_id", task->schedule_id), StringField("error", e.what())});
    } catch (...) {
      FLEET_LOG_ERROR("Schedule execution failed", {StringField("schedule_id", task->schedule_id), StringField("error", "non-standard exception")});
    }
  }
}

} // namespace fleet::scheduling
