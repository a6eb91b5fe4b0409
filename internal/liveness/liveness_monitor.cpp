#include "liveness_monitor.hpp"

#include <stdexcept>

#include "internal/core/tuner_broker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace livetv::liveness {

LivenessMonitor::LivenessMonitor(std::shared_ptr<livetv::core::TunerBroker> broker, std::chrono::milliseconds interval)
    : broker_(std::move(broker)), interval_(interval) {
  if (!broker_) {
    throw std::invalid_argument("liveness monitor requires a broker");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("liveness sweep interval must be positive");
  }
}

LivenessMonitor::~LivenessMonitor() {
  Stop();
}

void LivenessMonitor::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&LivenessMonitor::Run, this);
  LIVETV_LOG_INFO("Liveness monitor started", {observability::MillisField("interval", interval_)});
}

void LivenessMonitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void LivenessMonitor::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (wake_.wait_for(lock, interval_, [this] { return !running_; })) break;

    lock.unlock();
    observability::SpanScope span("LivenessMonitor.Sweep");
    try {
      const auto report = broker_->Sweep();
      span.SetAttribute("expired_sessions", static_cast<std::int64_t>(report.expired_sessions));
      span.SetAttribute("expired_tickets", static_cast<std::int64_t>(report.expired_tickets));
      span.SetAttribute("promoted", static_cast<std::int64_t>(report.promoted));
    } catch (const std::exception& e) {
      span.MarkFailed(e.what());
      LIVETV_LOG_ERROR("Liveness sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace livetv::liveness
