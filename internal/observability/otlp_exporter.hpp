#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>
#include <string_view>

namespace livetv::runtime::config {
class RuntimeConfig;
}

namespace livetv::observability::otlp_export {

inline constexpr std::string_view kServiceName    = "livetv-broker";
inline constexpr std::string_view kServiceVersion = "0.1.0";

struct ExporterSettings {
  std::string endpoint;
  bool        http     = false;
  bool        insecure = true;
};

// signal is "traces" or "metrics". Endpoint precedence: config, then
// OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
// then the collector default for the transport.
ExporterSettings ResolveExporter(const livetv::runtime::config::RuntimeConfig& config, std::string_view signal);

opentelemetry::sdk::resource::Resource BrokerResource();

} // namespace livetv::observability::otlp_export

#endif
