#pragma once

#include "condor/events/event.hpp"
#include "condor/time/i_time_provider.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// TimerThread
// -----------------------------------------------------------------------------
//
// @brief  The scheduler tick: pushes TimerEvent{clock.now_ms()} into every
//         registered sink at a fixed wall-clock cadence.
//
// @details
// Retry deadlines, ack timeouts, polling reconciliation and time-based exits
// are all evaluated on these events, so nothing in the decision loop sleeps
// or owns a timer of its own.
//
// Sinks are registered before start() and are not touched afterwards.
// An interval of 0 leaves the thread unstarted.
// -----------------------------------------------------------------------------
class TimerThread {
 public:
  using EventSink = std::function<void(Event)>;

  TimerThread(const ITimeProvider& clock, std::int64_t interval_ms);
  ~TimerThread();

  TimerThread(const TimerThread&) = delete;
  TimerThread& operator=(const TimerThread&) = delete;

  void addSink(EventSink sink);

  void start();
  void stop();

  bool running() const { return thread_.joinable(); }
  std::int64_t intervalMs() const { return interval_ms_; }

 private:
  void run();

  const ITimeProvider& clock_;
  std::int64_t interval_ms_;
  std::vector<EventSink> sinks_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::thread thread_;
};

}  // namespace condor
