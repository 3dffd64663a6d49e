#pragma once

#include <string_view>

#ifdef ENABLE_OTEL
#include <memory>
#endif

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::observability {

bool InitializeMetrics(const fleet::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide metrics facade.

  Without ENABLE_OTEL every call is an inline no-op, so the scheduling
  core can record unconditionally.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordAssignment(bool success, double latency_ms);
  void RecordAffinityDecision(std::string_view level, std::string_view outcome);
  void RecordScheduleExecution(std::string_view outcome, double duration_ms);
  void RecordSlaBreach(std::string_view kind);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const fleet::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordAssignment(bool, double) {
}

inline void Metrics::RecordAffinityDecision(std::string_view, std::string_view) {
}

inline void Metrics::RecordScheduleExecution(std::string_view, double) {
}

inline void Metrics::RecordSlaBreach(std::string_view) {
}
#endif

} // namespace fleet::observability
