#pragma once

#include "condor/feed/feed_adapter.hpp"

#include <memory>
#include <thread>

namespace condor {

// -----------------------------------------------------------------------------
// MarketDataThread
// -----------------------------------------------------------------------------
//
// @brief  Dedicated I/O thread for the feed: runs FeedAdapter::run() so that
//         socket receives and reconnect backoff never block the decision loop.
//
// @details
// The adapter has its own blocking receive loop (transport receive with a
// timeout) and does not consume from a ThreadSafeQueue, so this is a raw
// std::thread rather than an EventLoopThread. The adapter's EventSink pushes
// into the decision loop's queue; it never publishes on a bus directly.
//
// start() performs the initial handshake on the calling thread so that a
// ConnectionError reaches main() (exit code 4) instead of dying on the
// worker. Only then is the receive loop spawned.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the FeedAdapter.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  explicit MarketDataThread(std::unique_ptr<FeedAdapter> adapter);

  // RAII: stop() if still running.
  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Handshake (throws ConnectionError), then spawns the receive loop.
  // No-op when already running.
  void start();

  // Signals the adapter and joins. Idempotent.
  void stop();

  bool running() const { return thread_.joinable(); }

  const FeedAdapter& adapter() const { return *adapter_; }

 private:
  std::unique_ptr<FeedAdapter> adapter_;
  std::thread thread_;
};

}  // namespace condor
