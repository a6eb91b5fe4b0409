#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <atomic>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define LIVETV_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define LIVETV_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp_exporter.hpp"

namespace livetv::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

template <typename T>
using Ptr = opentelemetry::nostd::shared_ptr<T>;

namespace {

using Labels = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Which instrument families are recorded; all on until config says otherwise.
struct Families {
  std::atomic<bool> rpc{true};
  std::atomic<bool> rpc_latency{true};
  std::atomic<bool> route_labels{true};
  std::atomic<bool> sessions{true};
  std::atomic<bool> resources{true};
};

Families g_families;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const otlp_export::ExporterSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(const livetv::runtime::config::ObservabilityConfig::MetricsConfig& config,
                                                     std::unique_ptr<sdkmetrics::PushMetricExporter>                     exporter) {
  const uint32_t interval_ms = std::max(config.min_collection_interval_ms(), config.collection_interval_ms() > 0 ? config.collection_interval_ms() : 5000u);

  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  if (config.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(std::min(config.export_timeout_ms(), interval_ms));
  }

#ifdef LIVETV_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), options);
#endif
}

// The SDK changed AddMetricReader and the instrument Add/Record signatures
// between releases; accept either shape.
template <typename Provider>
void AttachReader(Provider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Count(const Ptr<Instrument>& instrument, Value value, Labels labels) {
  if (!instrument) return;
  if constexpr (requires { instrument->Add(value, labels, opentelemetry::context::Context{}); }) {
    instrument->Add(value, labels, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, labels);
  }
}

template <typename Instrument, typename Value>
void Sample(const Ptr<Instrument>& instrument, Value value, Labels labels) {
  if (!instrument) return;
  if constexpr (requires { instrument->Record(value, labels, opentelemetry::context::Context{}); }) {
    instrument->Record(value, labels, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, labels);
  }
}

} // namespace

bool InitializeMetrics(const livetv::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& families = observability.metrics();
  g_families.rpc          = families.request_metrics_enabled();
  g_families.rpc_latency  = families.request_latency_histograms_enabled();
  g_families.route_labels = families.route_labels_enabled();
  g_families.sessions     = families.session_metrics_enabled();
  g_families.resources    = families.resource_metrics_enabled();

  auto resource = otlp_export::BrokerResource();
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource);
  AttachReader(*g_provider, MakeReader(families, MakeExporter(otlp_export::ResolveExporter(config, "metrics"))));

  metrics_api::Provider::SetMeterProvider(Ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

struct Metrics::Impl {
  Ptr<metrics_api::Meter> meter;

  Ptr<metrics_api::Counter<uint64_t>> rpc_count;
  Ptr<metrics_api::Histogram<double>> rpc_latency_ms;
  Ptr<metrics_api::Counter<uint64_t>> admissions;
  Ptr<metrics_api::Counter<uint64_t>> sessions_ended;
  Ptr<metrics_api::Histogram<double>> session_held_s;
  Ptr<metrics_api::Counter<uint64_t>> queue_timeouts;
  Ptr<metrics_api::Counter<uint64_t>> tuner_failures;

  // One observable gauge per occupancy field, read from the last snapshot.
  struct Gauge {
    Ptr<metrics_api::ObservableInstrument> instrument;
    std::atomic<int64_t>                   value{0};
  };
  Gauge active_sessions;
  Gauge queue_depth;
  Gauge busy_tuners;
  Gauge failed_tuners;
  Gauge credential_connections;

  void Observe(Gauge& gauge, const char* name, const char* description) {
    gauge.instrument = meter->CreateInt64ObservableGauge(name, description, "1");
    gauge.instrument->AddCallback(
        [](metrics_api::ObserverResult result, void* state) {
          const auto* source = static_cast<const std::atomic<int64_t>*>(state);
          opentelemetry::nostd::get<Ptr<metrics_api::ObserverResultT<int64_t>>>(result)->Observe(source->load());
        },
        &gauge.value);
  }
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto& m = *impl_;
  m.meter = metrics_api::Provider::GetMeterProvider()->GetMeter(std::string(otlp_export::kServiceName), std::string(otlp_export::kServiceVersion));

  m.rpc_count      = m.meter->CreateUInt64Counter("livetv.rpc.count", "Broker RPCs by route and outcome", "1");
  m.rpc_latency_ms = m.meter->CreateDoubleHistogram("livetv.rpc.latency_ms", "Broker RPC latency", "ms");
  m.admissions     = m.meter->CreateUInt64Counter("livetv.admission.count", "Channel requests by resource kind and outcome", "1");
  m.sessions_ended = m.meter->CreateUInt64Counter("livetv.session.ended", "Ended sessions by reason", "1");
  m.session_held_s = m.meter->CreateDoubleHistogram("livetv.session.held_s", "How long ended sessions held their resource", "s");
  m.queue_timeouts = m.meter->CreateUInt64Counter("livetv.queue.timeouts", "Queued requests dropped for waiting too long", "1");
  m.tuner_failures = m.meter->CreateUInt64Counter("livetv.tuner.failures", "Tuners taken out of service as failed", "1");

  m.Observe(m.active_sessions, "livetv.sessions.active", "Sessions currently holding a tuner or credential slot");
  m.Observe(m.queue_depth, "livetv.queue.depth", "Requests waiting across all queues");
  m.Observe(m.busy_tuners, "livetv.tuners.busy", "Tuners tuned to a channel");
  m.Observe(m.failed_tuners, "livetv.tuners.failed", "Tuners marked failed");
  m.Observe(m.credential_connections, "livetv.credentials.connections", "Open Xtream connections across all credentials");
}

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, bool ok, double latency_ms) {
  if (!g_families.rpc) return;

  const std::string route_label = g_families.route_labels ? std::string(route) : std::string("*");
  Count(impl_->rpc_count, uint64_t{1}, {{"route", route_label}, {"ok", ok}});
  if (g_families.rpc_latency) {
    Sample(impl_->rpc_latency_ms, latency_ms, {{"route", route_label}});
  }
}

void Metrics::RecordAdmission(model::ResourceKind kind, AdmissionOutcome outcome) {
  if (!g_families.sessions) return;
  Count(impl_->admissions, uint64_t{1}, {{"kind", model::ToString(kind).data()}, {"outcome", ToString(outcome).data()}});
}

void Metrics::RecordSessionEnded(model::EndReason reason, std::chrono::seconds held) {
  if (!g_families.sessions) return;
  Count(impl_->sessions_ended, uint64_t{1}, {{"reason", model::ToString(reason).data()}});
  Sample(impl_->session_held_s, static_cast<double>(held.count()), {{"reason", model::ToString(reason).data()}});
}

void Metrics::RecordQueueTimeout(model::ResourceKind kind) {
  if (!g_families.sessions) return;
  Count(impl_->queue_timeouts, uint64_t{1}, {{"kind", model::ToString(kind).data()}});
}

void Metrics::RecordTunerFailed(std::uint32_t tuner_id) {
  if (!g_families.resources) return;
  Count(impl_->tuner_failures, uint64_t{1}, {{"tuner_id", static_cast<int64_t>(tuner_id)}});
}

void Metrics::Publish(const BrokerGauges& gauges) {
  if (!g_families.resources) return;
  impl_->active_sessions.value        = gauges.active_sessions;
  impl_->queue_depth.value            = gauges.queue_depth;
  impl_->busy_tuners.value            = gauges.busy_tuners;
  impl_->failed_tuners.value          = gauges.failed_tuners;
  impl_->credential_connections.value = gauges.credential_connections;
}

} // namespace livetv::observability

#endif
