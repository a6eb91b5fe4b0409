#include "internal/observability/otlp_exporter.hpp"

#ifdef ENABLE_OTEL

#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace livetv::observability::otlp_export {

namespace {

std::string SignalEnvName(std::string_view signal) {
  std::string name = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) {
    name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return name + "_ENDPOINT";
}

} // namespace

ExporterSettings ResolveExporter(const livetv::runtime::config::RuntimeConfig& config, std::string_view signal) {
  const auto& observability = config.observability();

  ExporterSettings settings;
  settings.http = observability.transport() == livetv::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
  } else if (const char* specific = std::getenv(SignalEnvName(signal).c_str())) {
    settings.endpoint = specific;
  } else if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = shared;
  } else if (settings.http) {
    settings.endpoint = "http://localhost:4318/v1/" + std::string(signal);
  } else {
    settings.endpoint = "localhost:4317";
  }

  settings.insecure = settings.endpoint.rfind("https://", 0) != 0;
  return settings;
}

opentelemetry::sdk::resource::Resource BrokerResource() {
  const std::string name(kServiceName);
  const std::string version(kServiceVersion);

  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", name}, {"service.version", version}};
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace livetv::observability::otlp_export

#endif
