#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_exporter.hpp"

namespace caretask::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

constexpr std::chrono::milliseconds kDefaultCollectionInterval{1000};

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const caretask::runtime::config::RuntimeConfig& config) {
  ShutdownMetrics();
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    return false;
  }

  const auto interval = observability.collection_interval_ms() > 0 ? std::chrono::milliseconds(observability.collection_interval_ms())
                                                                   : kDefaultCollectionInterval;

  // the export timeout must stay below the interval
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;
  reader_options.export_timeout_millis  = interval / 2;

  const auto target = ResolveOtlpTarget(observability, "metrics");
  auto       reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(target), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), ServiceResource());
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  CARETASK_LOG_INFO("metric export enabled", {StringField("endpoint", target.endpoint), IntField("interval_ms", interval.count())});
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> completions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> due_checks;
};

// Instruments bind to whichever provider is installed on first use.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kInstrumentationScope, kInstrumentationVersion);

  impl_->rpc_requests   = impl_->meter->CreateUInt64Counter("caretask.rpc.requests", "Care-task RPCs handled", "1");
  impl_->rpc_latency_ms = impl_->meter->CreateDoubleHistogram("caretask.rpc.latency", "Care-task RPC latency", "ms");
  impl_->completions    = impl_->meter->CreateUInt64Counter("caretask.schedule.completions", "Occurrences marked completed", "1");
  impl_->due_checks     = impl_->meter->CreateUInt64Counter("caretask.schedule.due_checks", "Due-notification polls", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::string rpc(route);
  impl_->rpc_requests->Add(1, {{"rpc.method", rpc}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::string rpc(route);
  impl_->rpc_latency_ms->Record(latency_ms, {{"rpc.method", rpc}}, opentelemetry::context::Context{});
}

void Metrics::RecordCompletion(bool exhausted) {
  impl_->completions->Add(1, {{"exhausted", exhausted}});
}

void Metrics::RecordDueCheck(bool due) {
  impl_->due_checks->Add(1, {{"due", due}});
}

} // namespace caretask::observability

#endif
