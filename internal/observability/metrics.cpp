#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define FLEET_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define FLEET_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace fleet::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const fleet::runtime::config::MetricsConfig& config, bool http) {
  if (!config.endpoint().empty()) {
    return config.endpoint();
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return http ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

using Counter   = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;
using Histogram = opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>;
using Labels    = std::initializer_list<std::pair<const char*, std::string_view>>;

/*
  Instruments by scheduling stage:

    fleet.assignment.*          JobAssignmentEngine decisions
    fleet.affinity.*            StateAffinityManager outcomes per level
    fleet.schedule.execution.*  AdvancedScheduler pipeline outcomes
    fleet.sla.*                 SlaMonitor breaches
*/
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  Counter   assignments;
  Histogram assignment_latency_ms;
  Counter   affinity_decisions;
  Counter   executions;
  Histogram execution_duration_ms;
  Counter   sla_breaches;

  void Count(const Counter& counter, Labels labels) {
    std::vector<std::string>   owned;
    std::vector<AttributePair> attributes;
    owned.reserve(labels.size());
    attributes.reserve(labels.size());
    for (const auto& [key, value] : labels) {
      owned.emplace_back(value);
      const auto& stored = owned.back();
      attributes.emplace_back(opentelemetry::nostd::string_view(key),
                              opentelemetry::nostd::string_view(stored.data(), stored.size()));
    }
    AddWithAttributes(counter, static_cast<std::uint64_t>(1), attributes);
  }

  void Observe(const Histogram& histogram, double value) {
    RecordWithAttributes(histogram, value, std::initializer_list<AttributePair>{});
  }
};

bool InitializeMetrics(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& metric_config = config.observability().metrics();
  if (!metric_config.enabled()) {
    ShutdownMetrics();
    return false;
  }

  const bool http     = metric_config.transport() == "http";
  auto       endpoint = ResolveEndpoint(metric_config, http);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = false;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metric_config.export_interval_ms() > 0 ? metric_config.export_interval_ms() : 1000);
#ifdef FLEET_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  const std::string service_name = metric_config.service_name().empty() ? "fleet-scheduler" : metric_config.service_name();
  resource::ResourceAttributes attrs = {{"service.name", service_name}};
  auto res = resource::Resource::Create(attrs);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto& m = *impl_;
  m.meter = metrics_api::Provider::GetMeterProvider()->GetMeter("fleet-scheduler", "0.1.0");

  m.assignments           = m.meter->CreateUInt64Counter("fleet.assignment.count", "1", "Job assignment decisions");
  m.assignment_latency_ms = m.meter->CreateDoubleHistogram("fleet.assignment.latency_ms", "ms", "Job assignment decision latency");
  m.affinity_decisions    = m.meter->CreateUInt64Counter("fleet.affinity.decision.count", "1", "State affinity decisions");
  m.executions            = m.meter->CreateUInt64Counter("fleet.schedule.execution.count", "1", "Schedule pipeline outcomes");
  m.execution_duration_ms = m.meter->CreateDoubleHistogram("fleet.schedule.execution.duration_ms", "ms", "Trigger callback duration");
  m.sla_breaches          = m.meter->CreateUInt64Counter("fleet.sla.breach.count", "1", "SLA breaches detected");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAssignment(bool success, double latency_ms) {
  impl_->Count(impl_->assignments, {{"outcome", success ? "assigned" : "no_capable_robot"}});
  if (success) impl_->Observe(impl_->assignment_latency_ms, latency_ms);
}

void Metrics::RecordAffinityDecision(std::string_view level, std::string_view outcome) {
  impl_->Count(impl_->affinity_decisions, {{"level", level}, {"outcome", outcome}});
}

void Metrics::RecordScheduleExecution(std::string_view outcome, double duration_ms) {
  impl_->Count(impl_->executions, {{"outcome", outcome}});
  // skipped executions never ran a callback
  if (duration_ms > 0) impl_->Observe(impl_->execution_duration_ms, duration_ms);
}

void Metrics::RecordSlaBreach(std::string_view kind) {
  impl_->Count(impl_->sla_breaches, {{"kind", kind}});
}

} // namespace fleet::observability

#endif
