#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace livetv::service {

inline bool IsBrokerError(const std::exception& ex) {
  return dynamic_cast<const util::InvalidArgument*>(&ex) || dynamic_cast<const util::NotFound*>(&ex) ||
         dynamic_cast<const util::SessionNotFound*>(&ex) || dynamic_cast<const util::NoCapacityConfigured*>(&ex) ||
         dynamic_cast<const util::ResourceFailed*>(&ex) || dynamic_cast<const util::QueueTimeout*>(&ex) ||
         dynamic_cast<const util::PermissionDenied*>(&ex) || dynamic_cast<const util::InvalidState*>(&ex);
}

/*
  Wraps one RPC in a span and records its outcome and latency. Broker
  errors (unknown session, bad channel, queue timeout) are part of normal
  viewer traffic and log at warn; anything else is an internal failure.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, std::string_view subject, Fn&& fn) {
  namespace obs = livetv::observability;

  obs::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool ok) {
    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started_at;
    obs::Metrics::Instance().RecordRpc(route, ok, elapsed.count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    finish(false);
    span.MarkFailed(ex.what());
    if (IsBrokerError(ex)) {
      LIVETV_LOG_WARN("RPC rejected", {obs::StringField("route", route), obs::StringField(subject_key, subject), obs::StringField("error", ex.what())});
    } else {
      LIVETV_LOG_ERROR("RPC failed", {obs::StringField("route", route), obs::StringField(subject_key, subject), obs::StringField("error", ex.what())});
    }
    throw;
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  return ObserveRpc(route, "subject", "", std::forward<Fn>(fn));
}

} // namespace livetv::service
