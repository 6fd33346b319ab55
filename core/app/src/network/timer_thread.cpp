#include "condor/network/timer_thread.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace condor {

TimerThread::TimerThread(const ITimeProvider& clock, std::int64_t interval_ms)
    : clock_(clock), interval_ms_(interval_ms) {}

TimerThread::~TimerThread() { stop(); }

void TimerThread::addSink(EventSink sink) { sinks_.push_back(std::move(sink)); }

void TimerThread::start() {
  if (thread_.joinable() || interval_ms_ <= 0) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] { run(); });
  std::cout << "[TimerThread] started (interval=" << interval_ms_ << "ms).\n";
}

void TimerThread::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// run(): sleep on the condition variable so stop() wakes it immediately
// -----------------------------------------------------------------------------
void TimerThread::run() {
  const auto interval = std::chrono::milliseconds(interval_ms_);
  auto next = std::chrono::steady_clock::now() + interval;

  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    if (cv_.wait_until(lock, next, [this] { return stop_requested_; })) {
      break;
    }
    next += interval;

    lock.unlock();
    const TimerEvent tick{clock_.now_ms()};
    for (const auto& sink : sinks_) {
      sink(tick);
    }
    lock.lock();
  }
}

}  // namespace condor
