#pragma once

#include <opentelemetry/sdk/resource/resource.h>

#include <string>
#include <string_view>

namespace caretask::runtime::config {
class ObservabilityConfig;
}

namespace caretask::observability {

inline constexpr const char* kInstrumentationScope   = "caretask";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

// Where one OTLP signal is shipped.
struct OtlpTarget {
  bool        http = false;
  std::string endpoint;
};

// signal is "traces" or "metrics". The configured endpoint wins, then
// OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT, then
// the local collector default for the transport.
OtlpTarget ResolveOtlpTarget(const caretask::runtime::config::ObservabilityConfig& config, std::string_view signal);

opentelemetry::sdk::resource::Resource ServiceResource();

} // namespace caretask::observability
