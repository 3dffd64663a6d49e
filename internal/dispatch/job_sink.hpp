#pragma once

#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/scheduling/execution_task.hpp"
#include "internal/util/time.hpp"

namespace fleet::dispatch {

struct JobSubmission {
  std::string                    job_id;
  std::string                    schedule_id;
  std::string                    schedule_name;
  std::string                    workflow_id;
  std::string                    workflow_name;
  std::string                    robot_id;
  int                            priority{1};
  scheduling::ExecutionKind      kind{scheduling::ExecutionKind::kScheduled};
  bool                           is_catch_up{false};
  std::optional<util::TimePoint> scheduled_time;
  google::protobuf::Struct       variables;
  std::vector<std::string>       tags;
};

/*
  Where assigned jobs go. Submit() throws on rejection; the dispatcher
  lets the exception reach the scheduler, which counts a failed run.
*/
class JobSink {
 public:
  virtual ~JobSink() = default;

  virtual void Submit(const JobSubmission& job) = 0;
};

// Logs each submission at info level.
class LoggingJobSink : public JobSink {
 public:
  void Submit(const JobSubmission& job) override;
};

} // namespace fleet::dispatch
