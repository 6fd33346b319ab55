#pragma once

#include "condor/concurrent/thread_safe_queue.hpp"
#include "condor/eventbus/event_bus.hpp"
#include "condor/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace condor {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread draining a ThreadSafeQueue<Event> into an owned
//         EventBus.
//
// @details
// Every subscriber of eventBus() runs on the worker thread, one event at a
// time, in queue order. The engine runs two of these: the decision loop
// (chain, strategy, risk, execution bookkeeping) and the order routing loop
// (broker I/O).
//
// isIdle() reports "queue empty and no event being dispatched". Tests and
// the live engine's waitUntilIdle() use it to know that everything pushed so
// far has been fully processed.
//
// Thread model: push(), isIdle(), start() and stop() are callable from any
// thread. Subscribers run only on the worker.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "event_loop");
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent. Spawns the worker.
  void start();

  // Idempotent. Joins the worker; events still queued are dropped.
  void stop();

  void push(Event event) {
    queue_.push(std::move(event));
    wake_cv_.notify_all();
  }

  bool isIdle() const { return !dispatching_.load() && queue_.empty(); }

  bool running() const { return running_.load(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<bool> dispatching_{false};

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  std::thread thread_;
};

}  // namespace condor
