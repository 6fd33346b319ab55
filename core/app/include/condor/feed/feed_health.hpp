#pragma once

#include <atomic>
#include <cstdint>

namespace condor {

// -----------------------------------------------------------------------------
// FeedHealth
// -----------------------------------------------------------------------------
//
// @brief  Connection-health handle shared by the feed adapter (writer) and
//         the decision pipeline (reader).
//
// @details
// Created by the orchestrator and passed explicitly to both sides.
// init() is called on connect, teardown() on shutdown or when the feed is
// declared unavailable; outside that window the feed counts as stale.
//
// lastTickMs() is in the decision clock's time base: market time when the
// engine runs on a simulated clock, wall time otherwise.
//
// Thread-safety: lock-free atomics, any thread.
// -----------------------------------------------------------------------------
class FeedHealth {
 public:
  void init(std::int64_t now_ms) {
    last_tick_ms_.store(now_ms);
    active_.store(true);
    connected_.store(true);
  }

  void teardown() {
    connected_.store(false);
    active_.store(false);
  }

  void markConnected() { connected_.store(true); }
  void markDisconnected() { connected_.store(false); }

  void recordTick(std::int64_t timestamp_ms) {
    std::int64_t prev = last_tick_ms_.load();
    while (timestamp_ms > prev &&
           !last_tick_ms_.compare_exchange_weak(prev, timestamp_ms)) {
    }
  }

  bool active() const { return active_.load(); }
  bool connected() const { return connected_.load(); }
  std::int64_t lastTickMs() const { return last_tick_ms_.load(); }

  // Stale when not connected, or when no tick arrived for longer than
  // threshold_ms (threshold 0 disables the age check).
  bool isStale(std::int64_t now_ms, std::int64_t threshold_ms) const {
    if (!active_.load() || !connected_.load()) {
      return true;
    }
    return threshold_ms > 0 && now_ms - last_tick_ms_.load() > threshold_ms;
  }

 private:
  std::atomic<bool> active_{false};
  std::atomic<bool> connected_{false};
  std::atomic<std::int64_t> last_tick_ms_{0};
};

}  // namespace condor
