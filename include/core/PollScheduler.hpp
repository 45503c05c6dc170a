#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ddns::core {

/// Human-readable interval: "45s", "5m", "5m 30s", "2h", "1h 30m".
std::string formatInterval(std::chrono::seconds durInterval);

/// Runs one cycle function back to back on a background thread, waiting a
/// fixed interval between runs. The first cycle runs immediately on start().
/// A stop request interrupts the wait but not a cycle in progress.
/// Class abbreviation: ps
class PollScheduler {
 public:
  PollScheduler(std::chrono::seconds durInterval, std::function<void()> fnCycle);
  ~PollScheduler();

  void start();
  void stop();

  /// Number of cycles completed (successfully or not) so far.
  int cyclesRun() const;

 private:
  std::chrono::seconds _durInterval;
  std::function<void()> _fnCycle;
  std::jthread _thread;
  mutable std::mutex _mtx;
  std::condition_variable _cv;
  bool _bRunning = false;
  int _iCyclesRun = 0;
};

}  // namespace ddns::core
