#pragma once

#include <memory>
#include <string_view>

namespace caretask::runtime::config {
class RuntimeConfig;
}

namespace caretask::observability {

/*
  OpenTelemetry export for the care-task server.

  Built without ENABLE_OTEL every call below is an inline no-op, so the
  service and scheduler instrument unconditionally.
*/

// Each returns true when the signal is exported. Re-initializing replaces
// the previous exporter.
bool InitializeTracing(const caretask::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const caretask::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Server span for one RPC, active on the calling thread until destroyed.
class SpanScope {
 public:
  explicit SpanScope(std::string_view rpc_name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // exhausted == the completion moved the schedule to its terminal state
  void RecordCompletion(bool exhausted);
  void RecordDueCheck(bool due);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const caretask::runtime::config::RuntimeConfig&) {
  return false;
}
inline bool InitializeMetrics(const caretask::runtime::config::RuntimeConfig&) {
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
inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}
inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}
inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}
inline void Metrics::RecordRequest(std::string_view, bool) {
}
inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}
inline void Metrics::RecordCompletion(bool) {
}
inline void Metrics::RecordDueCheck(bool) {
}
#endif

} // namespace caretask::observability
