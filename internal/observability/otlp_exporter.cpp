#include "internal/observability/otlp_exporter.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace caretask::observability {

OtlpTarget ResolveOtlpTarget(const caretask::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  OtlpTarget target;
  target.http = config.transport() == caretask::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
    return target;
  }

  std::string upper(signal);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  const std::string signal_variable = "OTEL_EXPORTER_OTLP_" + upper + "_ENDPOINT";

  for (const char* variable : {signal_variable.c_str(), "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(variable)) {
      target.endpoint = value;
      return target;
    }
  }

  target.endpoint = target.http ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
  return target;
}

opentelemetry::sdk::resource::Resource ServiceResource() {
  opentelemetry::sdk::resource::ResourceAttributes attributes = {
      {"service.name", std::string(kInstrumentationScope)},
      {"service.version", std::string(kInstrumentationVersion)},
  };
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace caretask::observability
