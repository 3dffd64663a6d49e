#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/robot.hpp"

namespace fleet::model {

struct JobRequirements {
  std::string                  workflow_id;
  std::string                  workflow_name;
  std::vector<std::string>     required_tags;
  std::vector<std::string>     preferred_tags;
  std::vector<RobotCapability> required_capabilities;
  double                       min_memory_gb{0.0};
  double                       min_cpu_cores{0.0};
  std::string                  environment{"default"};
  bool                         requires_state{false};
  int                          priority{1};
  // informational; the engine never forces it
  std::optional<std::string>   preferred_robot_id;
};

} // namespace fleet::model
