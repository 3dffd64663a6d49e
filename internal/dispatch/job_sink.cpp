#include "job_sink.hpp"

#include "internal/observability/logging.hpp"

namespace fleet::dispatch {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

void LoggingJobSink::Submit(const JobSubmission& job) {
  FLEET_LOG_INFO("Job submitted", {StringField("job_id", job.job_id), StringField("schedule_id", job.schedule_id),
                                   StringField("workflow_id", job.workflow_id), StringField("robot_id", job.robot_id),
                                   StringField("kind", scheduling::ToString(job.kind)), IntField("priority", job.priority),
                                   BoolField("catch_up", job.is_catch_up)});
}

} // namespace fleet::dispatch
