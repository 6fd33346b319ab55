#pragma once

#include "condor/domain/tick.hpp"

#include <cstdint>
#include <string>

namespace condor {

// -----------------------------------------------------------------------------
// TickEvent
// -----------------------------------------------------------------------------
// One normalized tick, pushed by the feed thread (live) or the replay loop
// (backtest) into the decision loop. The decision loop is the single writer
// of the option chain, so every TickEvent is applied in queue order.
// -----------------------------------------------------------------------------
struct TickEvent {
  domain::Tick tick;
};

// -----------------------------------------------------------------------------
// TimerEvent
// -----------------------------------------------------------------------------
// Scheduler tick. Drives everything that is due "at a time" rather than on
// data: order retries, ack timeouts, reconciliation polling, time-based
// exits and release of delayed simulated fills.
// -----------------------------------------------------------------------------
struct TimerEvent {
  std::int64_t now_ms{0};
};

enum class FeedStatus {
  Connected,     // Initial handshake succeeded
  Disconnected,  // Stream closed or heartbeat missed; reconnecting
  Resynced,      // Reconnected after a gap; a snapshot was requested
  Unavailable,   // Reconnect budget exhausted (fatal)
};

const char* toString(FeedStatus status);

struct FeedStatusEvent {
  FeedStatus status{FeedStatus::Connected};
  int attempt{0};
  std::string detail;
  std::int64_t timestamp_ms{0};
};

enum class FatalReason {
  FeedUnavailable,
  AuthExpired,
};

// Published on the decision bus when the process must shut down. The
// orchestrator turns it into a non-zero exit code.
struct EngineFatalEvent {
  FatalReason reason{FatalReason::FeedUnavailable};
  std::string detail;
  std::int64_t timestamp_ms{0};
};

}  // namespace condor
