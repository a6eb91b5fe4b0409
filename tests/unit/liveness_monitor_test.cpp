#include "internal/liveness/liveness_monitor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "tests/support/broker_fixtures.hpp"

namespace {

using livetv::core::TunerBroker;
using livetv::liveness::LivenessMonitor;
using livetv::testing::FakeClock;
using livetv::testing::FakeResolver;
using livetv::testing::MakeOptions;
using livetv::testing::Throws;
using livetv::testing::TunerRequest;

using namespace std::chrono_literals;

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 2s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

void TestSweepsStaleSessionsInBackground() {
  FakeClock clock;
  auto      broker = std::make_shared<TunerBroker>(MakeOptions(1), std::make_shared<FakeResolver>(), nullptr, clock.Fn());

  auto granted = broker->RequestChannel(TunerRequest("alice", "10.1"));
  auto queued  = broker->RequestChannel(TunerRequest("bob", "5.1"));
  assert(granted.Granted());
  assert(!queued.Granted());

  LivenessMonitor monitor(broker, 20ms);
  monitor.Start();
  assert(monitor.Running());

  // nothing is stale yet
  std::this_thread::sleep_for(60ms);
  assert(broker->GetStatus().sessions.size() == 1);

  clock.Advance(91s);
  assert(WaitFor([&] {
    const auto status = broker->GetStatus();
    return status.sessions.size() == 1 && status.sessions.front().user_id == "bob";
  }));
  assert(broker->PollQueue(queued.ticket_id).Granted());

  monitor.Stop();
  assert(!monitor.Running());
}

void TestStartAndStopAreIdempotent() {
  FakeClock clock;
  auto      broker = std::make_shared<TunerBroker>(MakeOptions(1), std::make_shared<FakeResolver>(), nullptr, clock.Fn());

  LivenessMonitor monitor(broker, 10ms);
  monitor.Stop();
  monitor.Start();
  monitor.Start();
  monitor.Stop();
  monitor.Stop();
  assert(!monitor.Running());
}

void TestConstructorRejectsBadArguments() {
  FakeClock clock;
  auto      broker = std::make_shared<TunerBroker>(MakeOptions(1), std::make_shared<FakeResolver>(), nullptr, clock.Fn());

  assert(Throws<std::invalid_argument>([] { LivenessMonitor monitor(nullptr, 10ms); }));
  assert(Throws<std::invalid_argument>([&] { LivenessMonitor monitor(broker, 0ms); }));
}

} // namespace

int main() {
  TestSweepsStaleSessionsInBackground();
  TestStartAndStopAreIdempotent();
  TestConstructorRejectsBadArguments();

  std::cout << "livetv_unit_liveness_monitor: pass\n";
  return 0;
}
