#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace graphflow::runtime::config {
class RuntimeConfig;
}

namespace graphflow::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"graphflow"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const graphflow::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const graphflow::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span. The span is the active one on the constructing thread until
  Detach() (or destruction); work that finishes on another thread must
  Detach() before handing the scope over, the span itself ends whenever
  the scope is destroyed.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);
  void Detach();

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordNodeExecution(std::string_view node, bool success);
  void ObserveNodeLatencyMs(std::string_view node, double latency_ms);
  void RecordRoutingDecision(std::string_view strategy, double confidence);
  void RecordCheckpoint(std::string_view type);
  void AddActiveExecutions(std::int64_t delta);
  void RecordExecutionFinished(std::string_view workflow_id, std::string_view status);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const graphflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const graphflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline void SpanScope::Detach() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordNodeExecution(std::string_view, bool) {
}

inline void Metrics::ObserveNodeLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordRoutingDecision(std::string_view, double) {
}

inline void Metrics::RecordCheckpoint(std::string_view) {
}

inline void Metrics::AddActiveExecutions(std::int64_t) {
}

inline void Metrics::RecordExecutionFinished(std::string_view, std::string_view) {
}
#endif

} // namespace graphflow::observability
