#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace livetv::core {
class TunerBroker;
}

namespace livetv::liveness {

/*
  Background worker that runs the broker's liveness sweep.

  Every interval:
      expire stale sessions and timed-out tickets
      recover cooled-down tuners
      promote placeable queue heads
*/
class LivenessMonitor {
 public:
  LivenessMonitor(std::shared_ptr<livetv::core::TunerBroker> broker, std::chrono::milliseconds interval);
  ~LivenessMonitor();

  LivenessMonitor(const LivenessMonitor&)            = delete;
  LivenessMonitor& operator=(const LivenessMonitor&) = delete;

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

 private:
  void Run();

  std::shared_ptr<livetv::core::TunerBroker> broker_;
  std::chrono::milliseconds                  interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable wake_;
};

} // namespace livetv::liveness
