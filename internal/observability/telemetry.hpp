#pragma once

#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace livetv::observability {

// Owns the process-wide OTLP providers; flushes and shuts them down when
// the broker exits, including on the fatal-error path.
class Telemetry {
 public:
  explicit Telemetry(const livetv::runtime::config::RuntimeConfig& config)
      : tracing_(InitializeTracing(config)), metrics_(InitializeMetrics(config)) {
  }

  ~Telemetry() {
    if (metrics_) ShutdownMetrics();
    if (tracing_) ShutdownTracing();
  }

  Telemetry(const Telemetry&)            = delete;
  Telemetry& operator=(const Telemetry&) = delete;

  bool tracing() const {
    return tracing_;
  }

  bool metrics() const {
    return metrics_;
  }

 private:
  bool tracing_;
  bool metrics_;
};

} // namespace livetv::observability
