#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace graphflow::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

// views the caller's buffer; it outlives the attribute list
opentelemetry::nostd::string_view View(std::string_view s) {
  return opentelemetry::nostd::string_view(s.data(), s.size());
}
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const std::string& configured, OtlpTransport transport) {
  if (!configured.empty()) {
    return configured;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
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

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>      node_executions;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>           node_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>           routing_confidence;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>      checkpoints;
  opentelemetry::nostd::shared_ptr<metrics_api::UpDownCounter<std::int64_t>> active_executions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>      finished_executions;
};

bool InitializeMetrics(const graphflow::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto transport =
      observability.transport() == graphflow::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  const auto endpoint = ResolveEndpoint(observability.otlp_endpoint(), transport);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint = endpoint;
    exporter         = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  const std::string service_name = observability.service_name().empty() ? "graphflow" : observability.service_name();
  auto              res          = resource::Resource::Create(resource::ResourceAttributes{{"service.name", service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  g_provider->AddMetricReader(std::move(reader));

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
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("graphflow", "0.1.0");

  impl_->node_executions    = impl_->meter->CreateUInt64Counter("graphflow.node.executions", "Node invocations", "1");
  impl_->node_latency_ms    = impl_->meter->CreateDoubleHistogram("graphflow.node.latency_ms", "Node invocation latency", "ms");
  impl_->routing_confidence = impl_->meter->CreateDoubleHistogram("graphflow.router.confidence", "Selected edge confidence", "1");
  impl_->checkpoints        = impl_->meter->CreateUInt64Counter("graphflow.checkpoints", "Checkpoints written", "1");
  impl_->active_executions  = impl_->meter->CreateInt64UpDownCounter("graphflow.executions.active", "Executions in flight", "1");
  impl_->finished_executions =
      impl_->meter->CreateUInt64Counter("graphflow.executions.finished", "Executions that reached a terminal status", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordNodeExecution(std::string_view node, bool success) {
  const std::initializer_list<AttributePair> attributes = {{"node", View(node)}, {"success", success}};
  AddWithAttributes(impl_->node_executions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveNodeLatencyMs(std::string_view node, double latency_ms) {
  const std::initializer_list<AttributePair> attributes = {{"node", View(node)}};
  RecordWithAttributes(impl_->node_latency_ms, latency_ms, attributes);
}

void Metrics::RecordRoutingDecision(std::string_view strategy, double confidence) {
  const std::initializer_list<AttributePair> attributes = {{"strategy", View(strategy)}};
  RecordWithAttributes(impl_->routing_confidence, confidence, attributes);
}

void Metrics::RecordCheckpoint(std::string_view type) {
  const std::initializer_list<AttributePair> attributes = {{"type", View(type)}};
  AddWithAttributes(impl_->checkpoints, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::AddActiveExecutions(std::int64_t delta) {
  AddWithAttributes(impl_->active_executions, delta, std::initializer_list<AttributePair>{});
}

void Metrics::RecordExecutionFinished(std::string_view workflow_id, std::string_view status) {
  const std::initializer_list<AttributePair> attributes = {{"workflow", View(workflow_id)}, {"status", View(status)}};
  AddWithAttributes(impl_->finished_executions, static_cast<std::uint64_t>(1), attributes);
}

} // namespace graphflow::observability

#endif
