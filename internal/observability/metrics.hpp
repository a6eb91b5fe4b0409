#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

#include "internal/model/resource_kind.hpp"

namespace livetv::runtime::config {
class RuntimeConfig;
}

namespace livetv::observability {

bool InitializeMetrics(const livetv::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

enum class AdmissionOutcome {
  kShared,
  kAllocated,
  kQueued,
  kPromoted,
};

constexpr std::string_view ToString(AdmissionOutcome outcome) {
  switch (outcome) {
    case AdmissionOutcome::kShared:
      return "shared";
    case AdmissionOutcome::kAllocated:
      return "allocated";
    case AdmissionOutcome::kQueued:
      return "queued";
    case AdmissionOutcome::kPromoted:
      return "promoted";
  }
  return "unknown";
}

// Occupancy snapshot, published after every broker mutation.
struct BrokerGauges {
  std::int64_t active_sessions        = 0;
  std::int64_t queue_depth            = 0;
  std::int64_t busy_tuners            = 0;
  std::int64_t failed_tuners          = 0;
  std::int64_t credential_connections = 0;
};

/*
  Broker instruments. Without ENABLE_OTEL every recorder is an inline no-op,
  so call sites never need their own guards.

    livetv.rpc.count / livetv.rpc.latency_ms    per route
    livetv.admission.count                      kind x outcome
    livetv.session.ended / livetv.session.held_s per end reason
    livetv.queue.timeouts                       per resource kind
    livetv.tuner.failures                       per tuner
    livetv.sessions.active, livetv.queue.depth, livetv.tuners.busy,
    livetv.tuners.failed, livetv.credentials.connections   gauges
*/
class Metrics {
 public:
  static Metrics& Instance();
  ~Metrics();

  void RecordRpc(std::string_view route, bool ok, double latency_ms);
  void RecordAdmission(model::ResourceKind kind, AdmissionOutcome outcome);
  void RecordSessionEnded(model::EndReason reason, std::chrono::seconds held);
  void RecordQueueTimeout(model::ResourceKind kind);
  void RecordTunerFailed(std::uint32_t tuner_id);
  void Publish(const BrokerGauges& gauges);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const livetv::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() = default;

inline Metrics::~Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, bool, double) {
}

inline void Metrics::RecordAdmission(model::ResourceKind, AdmissionOutcome) {
}

inline void Metrics::RecordSessionEnded(model::EndReason, std::chrono::seconds) {
}

inline void Metrics::RecordQueueTimeout(model::ResourceKind) {
}

inline void Metrics::RecordTunerFailed(std::uint32_t) {
}

inline void Metrics::Publish(const BrokerGauges&) {
}
#endif

} // namespace livetv::observability
