#include "core/PollScheduler.hpp"

#include "common/Logger.hpp"

#include <exception>
#include <utility>

namespace ddns::core {

std::string formatInterval(std::chrono::seconds durInterval) {
  long long iSeconds = durInterval.count();
  if (iSeconds < 60) {
    return std::to_string(iSeconds) + "s";
  }

  long long iMinutes = iSeconds / 60;
  iSeconds %= 60;
  if (iMinutes < 60) {
    if (iSeconds == 0) {
      return std::to_string(iMinutes) + "m";
    }
    return std::to_string(iMinutes) + "m " + std::to_string(iSeconds) + "s";
  }

  const long long iHours = iMinutes / 60;
  iMinutes %= 60;
  if (iMinutes == 0) {
    return std::to_string(iHours) + "h";
  }
  return std::to_string(iHours) + "h " + std::to_string(iMinutes) + "m";
}

PollScheduler::PollScheduler(std::chrono::seconds durInterval, std::function<void()> fnCycle)
    : _durInterval(durInterval), _fnCycle(std::move(fnCycle)) {}

PollScheduler::~PollScheduler() {
  stop();
}

void PollScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  _thread = std::jthread([this](std::stop_token stToken) {
    auto spLog = ddns::common::Logger::get();

    while (!stToken.stop_requested()) {
      try {
        _fnCycle();
      } catch (const std::exception& ex) {
        spLog->error("PollScheduler: cycle failed: {}", ex.what());
      } catch (...) {
        spLog->error("PollScheduler: cycle failed with unknown error");
      }

      std::unique_lock<std::mutex> ulock(_mtx);
      ++_iCyclesRun;
      if (stToken.stop_requested()) {
        break;
      }

      spLog->info("Checking again in {}", formatInterval(_durInterval));

      // Sleep for the interval, or until stop is requested
      _cv.wait_for(ulock, _durInterval, [&stToken]() {
        return stToken.stop_requested();
      });
    }
  });
}

void PollScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
  }

  _thread.request_stop();
  {
    // Pairs with the predicate check under the same mutex in the worker.
    std::lock_guard<std::mutex> lock(_mtx);
    _cv.notify_all();
  }

  if (_thread.joinable()) {
    _thread.join();
  }
}

int PollScheduler::cyclesRun() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _iCyclesRun;
}

}  // namespace ddns::core
