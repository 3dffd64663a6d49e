#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fleet::util {

/*
  Central error types.

  Assignment and affinity failures bubble to the job-submission layer.
  Scheduler tick failures are caught and counted where they happen.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidCronExpression : public std::runtime_error {
 public:
  explicit InvalidCronExpression(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Zero robots survived hard filtering. Carries the unmet capability list
  ("type:name" entries) so the caller can decide between retry and queueing.
*/
class NoCapableRobotError : public std::runtime_error {
 public:
  NoCapableRobotError(std::string job_name, std::vector<std::string> required_capabilities)
      : std::runtime_error(BuildMessage(job_name, required_capabilities)),
        job_name_(std::move(job_name)),
        required_capabilities_(std::move(required_capabilities)) {
  }

  const std::string& job_name() const {
    return job_name_;
  }

  const std::vector<std::string>& required_capabilities() const {
    return required_capabilities_;
  }

 private:
  static std::string BuildMessage(const std::string& job_name, const std::vector<std::string>& caps) {
    std::string msg = "No robot can execute job '" + job_name + "'. Required capabilities: [";
    for (size_t i = 0; i < caps.size(); ++i) {
      if (i > 0) msg += ", ";
      msg += caps[i];
    }
    msg += "]";
    return msg;
  }

  std::string              job_name_;
  std::vector<std::string> required_capabilities_;
};

/*
  SESSION affinity's pinned robot is gone, or HARD affinity ran out of
  queue attempts. Never retried by this core.
*/
class SessionAffinityError : public std::runtime_error {
 public:
  SessionAffinityError(const std::string& msg, std::string workflow_id, std::string robot_id = {})
      : std::runtime_error(msg), workflow_id_(std::move(workflow_id)), robot_id_(std::move(robot_id)) {
  }

  const std::string& workflow_id() const {
    return workflow_id_;
  }

  const std::string& robot_id() const {
    return robot_id_;
  }

 private:
  std::string workflow_id_;
  std::string robot_id_;
};

} // namespace fleet::util
