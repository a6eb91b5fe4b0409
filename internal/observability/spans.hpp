#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace livetv::runtime::config {
class RuntimeConfig;
}

namespace livetv::observability {

// Installs the OTLP tracer provider when observability.tracing_enabled is
// set. Returns whether spans will be exported.
bool InitializeTracing(const livetv::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  Span that is current for the lifetime of the scope. RPC handlers and the
  liveness sweep open one each; nested broker logs pick up its trace ids.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void MarkFailed(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const livetv::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::MarkFailed(std::string_view) {
}
#endif

} // namespace livetv::observability
