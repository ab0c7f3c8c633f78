#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_exporter.hpp"

namespace caretask::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const caretask::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  const auto target    = ResolveOtlpTarget(config.observability(), "traces");
  auto       processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(target), sdktrace::BatchSpanProcessorOptions{});
  g_provider           = sdktrace::TracerProviderFactory::Create(std::move(processor), ServiceResource());

  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kInstrumentationScope, kInstrumentationVersion);

  CARETASK_LOG_INFO("span export enabled", {StringField("endpoint", target.endpoint), StringField("transport", target.http ? "http" : "grpc")});
  return true;
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

struct SpanScope::Impl {
  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> started) : span(std::move(started)), scope(span) {
  }

  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;
};

SpanScope::SpanScope(std::string_view rpc_name) {
  if (!g_tracer) {
    return;
  }

  trace_api::StartSpanOptions options;
  options.kind = trace_api::SpanKind::kServer;
  impl_        = std::make_unique<Impl>(g_tracer->StartSpan(std::string(rpc_name), options));
  impl_->span->SetAttribute("rpc.system", "grpc");
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) {
    return;
  }
  const std::string message(description);
  impl_->span->AddEvent("exception", {{"exception.message", message}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace caretask::observability

#endif
