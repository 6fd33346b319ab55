#include "condor/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace condor {

namespace {

constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  wake_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): try_pop + short timed wait so that stop() is observed promptly
// without a close() on the queue.
//
// dispatching_ is raised before the pop and lowered after publish so that
// isIdle() never sees "queue empty" for an event that has been taken but
// not yet handled.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    dispatching_.store(true);
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      try {
        bus_.publish(*event);
      } catch (const std::exception& e) {
        // A throwing subscriber must not take the loop down with it.
        std::cerr << "[" << name_ << "] ERROR: subscriber threw: " << e.what()
                  << "\n";
      }
      dispatching_.store(false);
      continue;
    }
    dispatching_.store(false);

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
      return !running_.load() || !queue_.empty();
    });
  }
}

}  // namespace condor
