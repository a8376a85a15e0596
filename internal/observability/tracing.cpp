#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace graphflow::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kInstrumentationName    = "graphflow.engine";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

OtlpConfig ToOtlpConfig(const graphflow::runtime::config::ObservabilityConfig& observability) {
  OtlpConfig out;
  out.endpoint  = observability.otlp_endpoint();
  out.transport = observability.transport() == graphflow::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                               : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) out.service_name = observability.service_name();

  if (out.endpoint.empty()) {
    if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) {
      out.endpoint = env;
    } else if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
      out.endpoint = shared;
    } else {
      out.endpoint = out.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
    }
  }
  return out;
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = config.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = config.endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard lock(g_mutex);
  if (!g_tracer) {
    // spans still work against whatever provider the host process installed
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const graphflow::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) return false;

  const auto otlp_config = ToOtlpConfig(config.observability());

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(
      std::move(processor), resource::Resource::Create(resource::ResourceAttributes{{"service.name", otlp_config.service_name},
                                                                                    {"service.version", kInstrumentationVersion}}));

  std::lock_guard lock(g_mutex);
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);

  GRAPHFLOW_LOG_INFO("tracing enabled", {StringField("endpoint", otlp_config.endpoint), StringField("service", otlp_config.service_name)});
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::lock_guard lock(g_mutex);
    provider = std::move(g_sdk_provider);
    g_tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 active;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  impl_->span   = tracer->StartSpan(std::string(name));
  impl_->active = std::make_unique<trace_api::Scope>(trace_api::Tracer::WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_) return;
  impl_->active.reset();
  if (impl_->span) impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

void SpanScope::Detach() {
  if (impl_) impl_->active.reset();
}

} // namespace graphflow::observability

#endif
