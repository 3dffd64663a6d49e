#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fleet::util {

/*
  Identifier helpers

  Jobs, state records, sessions and SLA executions are keyed by RFC4122 v4
  ids. Each id carries a short kind prefix so a bare id in a log line or
  report says what it refers to:

    job-3f0c...      dispatched job
    state-9a41...    robot state record
    sess-77b2...     affinity session
    exec-c01d...     SLA execution record
*/

enum class IdKind { kJob, kState, kSession, kExecution };

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Canonical 8-4-4-4-12 lowercase hex form.
std::string ToString(const UUID& id);

std::string_view IdPrefix(IdKind kind);

std::string GenerateId(IdKind kind);

// nullopt unless `id` is a prefix followed by a canonical uuid.
std::optional<IdKind> ParseIdKind(std::string_view id);

} // namespace fleet::util
