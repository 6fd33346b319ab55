#pragma once

#include "condor/events/event.hpp"
#include "condor/feed/feed_health.hpp"
#include "condor/feed/i_feed_transport.hpp"
#include "condor/time/i_time_provider.hpp"
#include "condor/time/simulation_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace condor {

struct FeedParams {
  std::int64_t heartbeat_timeout_ms{5000};
  std::int64_t reconnect_base_ms{500};
  std::int64_t reconnect_cap_ms{30000};
  int max_reconnect_attempts{5};
  // Age of the last tick after which the decision loop treats the market as
  // stale; 0 disables the age check.
  std::int64_t stale_after_ms{10000};
  int receive_timeout_ms{100};
};

// -----------------------------------------------------------------------------
// FeedAdapter
// -----------------------------------------------------------------------------
//
// @brief  Turns an IFeedTransport into an ordered stream of TickEvents and
//         owns reconnect with exponential backoff.
//
// @details
// State machine, advanced by step():
//
//   Disconnected --connect()--> Connected
//   Connected --heartbeat timeout / stream closed--> Backoff
//   Backoff --reconnect ok--> Connected (emit Resynced, request snapshot)
//   Backoff --reconnect failed, attempts left--> Backoff
//   Backoff --max_reconnect_attempts failures--> Failed (emit Unavailable)
//
// Backoff is explicit state (attempt count and next retry time) compared
// against the wall clock on each step(), never a nested sleep-and-retry
// loop, so tests drive it by advancing a SimulationTimeProvider. The delay
// before reconnect attempt n is min(base * 2^(n-1), cap).
//
// Ordering: while connected, a tick older than the last delivered tick of
// the same instrument is dropped. Ordering state is reset on reconnect; the
// Resynced status tells consumers a gap happened.
//
// If a market clock is given it is advanced to each delivered tick's
// timestamp before the tick is handed to the sink (mocked-live runs).
//
// Thread model: connect() on the owning thread before run(); step()/run()
// on the market data thread; stop() from any thread.
// -----------------------------------------------------------------------------
class FeedAdapter {
 public:
  using EventSink = std::function<void(Event)>;

  enum class State { Disconnected, Connected, Backoff, Failed };

  FeedAdapter(std::unique_ptr<IFeedTransport> transport, FeedParams params,
              std::vector<std::string> instruments,
              const ITimeProvider& wall_clock, FeedHealth& health,
              EventSink sink, SimulationTimeProvider* market_clock = nullptr);
  ~FeedAdapter();

  FeedAdapter(const FeedAdapter&) = delete;
  FeedAdapter& operator=(const FeedAdapter&) = delete;

  // Initial handshake. Throws ConnectionError.
  void connect();

  // One unit of work: receive one message, or attempt a due reconnect.
  void step();

  // Loops step() until stop() or Failed.
  void run();
  void stop();

  State state() const { return state_.load(); }
  int failedAttempts() const { return failed_attempts_; }
  std::int64_t nextRetryMs() const { return next_retry_ms_; }
  std::uint64_t ticksDelivered() const { return delivered_; }
  std::uint64_t outOfOrderDropped() const { return out_of_order_; }

 private:
  void receiveOne();
  void deliver(const domain::Tick& tick);
  void enterBackoff(const std::string& why);
  void attemptReconnect();
  void emitStatus(FeedStatus status, const std::string& detail);
  std::int64_t backoffDelay(int attempt) const;

  std::unique_ptr<IFeedTransport> transport_;
  FeedParams params_;
  std::vector<std::string> instruments_;
  const ITimeProvider& wall_clock_;
  FeedHealth& health_;
  EventSink sink_;
  SimulationTimeProvider* market_clock_;

  std::atomic<State> state_{State::Disconnected};
  std::atomic<bool> stop_requested_{false};

  int failed_attempts_{0};
  std::int64_t next_retry_ms_{0};
  std::int64_t last_message_ms_{0};
  std::unordered_map<std::string, std::int64_t> last_tick_ts_;
  std::uint64_t delivered_{0};
  std::uint64_t out_of_order_{0};
};

const char* toString(FeedAdapter::State state);

}  // namespace condor
