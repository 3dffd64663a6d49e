#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/util/time.hpp"

namespace fleet::scheduling {

enum class ExecutionKind { kScheduled, kEvent, kDependency, kCatchUp, kManual };

std::string_view ToString(ExecutionKind kind);

/*
  A pending run of one schedule.

  Produced by the timer, TriggerEvent and NotifyCompletion; consumed by
  the execution workers.
*/
struct ExecutionTask {
  std::string   schedule_id;
  ExecutionKind kind{ExecutionKind::kScheduled};

  std::optional<google::protobuf::Struct> event_data;
  std::optional<util::TimePoint>          scheduled_time;
};

} // namespace fleet::scheduling
