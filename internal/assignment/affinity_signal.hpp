#pragma once

#include <string>

namespace fleet::assignment {

/*
  Answers "does this robot hold valid state for this workflow".
  Consulted only for jobs that declare requires_state.
*/
class AffinitySignal {
 public:
  virtual ~AffinitySignal() = default;

  virtual bool HasValidState(const std::string& workflow_id, const std::string& robot_id) const = 0;
};

} // namespace fleet::assignment
