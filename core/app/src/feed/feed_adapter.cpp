#include "condor/feed/feed_adapter.hpp"
#include "condor/domain/errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

namespace condor {

FeedAdapter::FeedAdapter(std::unique_ptr<IFeedTransport> transport,
                         FeedParams params,
                         std::vector<std::string> instruments,
                         const ITimeProvider& wall_clock, FeedHealth& health,
                         EventSink sink,
                         SimulationTimeProvider* market_clock)
    : transport_(std::move(transport)),
      params_(params),
      instruments_(std::move(instruments)),
      wall_clock_(wall_clock),
      health_(health),
      sink_(std::move(sink)),
      market_clock_(market_clock) {}

FeedAdapter::~FeedAdapter() {
  stop();
  transport_->close();
}

// -----------------------------------------------------------------------------
// connect(): initial handshake
// -----------------------------------------------------------------------------
void FeedAdapter::connect() {
  transport_->open(instruments_);

  const std::int64_t now = wall_clock_.now_ms();
  last_message_ms_ = now;
  failed_attempts_ = 0;
  last_tick_ts_.clear();
  health_.init(market_clock_ != nullptr ? market_clock_->now_ms() : now);
  state_.store(State::Connected);

  std::cout << "[FeedAdapter] connected, " << instruments_.size()
            << " instruments subscribed.\n";
  emitStatus(FeedStatus::Connected, "");
}

// -----------------------------------------------------------------------------
// step()
// -----------------------------------------------------------------------------
void FeedAdapter::step() {
  switch (state_.load()) {
    case State::Connected:
      receiveOne();
      break;
    case State::Backoff:
      if (wall_clock_.now_ms() >= next_retry_ms_) {
        attemptReconnect();
      }
      break;
    case State::Disconnected:
    case State::Failed:
      break;
  }
}

void FeedAdapter::receiveOne() {
  std::optional<FeedMessage> message;
  try {
    message = transport_->receive(params_.receive_timeout_ms);
  } catch (const ConnectionError& e) {
    enterBackoff(std::string("stream closed: ") + e.what());
    return;
  }

  const std::int64_t now = wall_clock_.now_ms();
  if (!message) {
    if (params_.heartbeat_timeout_ms > 0 &&
        now - last_message_ms_ > params_.heartbeat_timeout_ms) {
      enterBackoff("no heartbeat for " +
                   std::to_string(now - last_message_ms_) + " ms");
    }
    return;
  }

  last_message_ms_ = now;
  if (const auto* tick = std::get_if<domain::Tick>(&*message)) {
    deliver(*tick);
  }
}

void FeedAdapter::deliver(const domain::Tick& tick) {
  auto it = last_tick_ts_.find(tick.instrument_id);
  if (it != last_tick_ts_.end() && tick.timestamp_ms < it->second) {
    ++out_of_order_;
    std::cerr << "[FeedAdapter] out-of-order tick for " << tick.instrument_id
              << " (" << tick.timestamp_ms << " < " << it->second
              << "). Dropped.\n";
    return;
  }
  last_tick_ts_[tick.instrument_id] = tick.timestamp_ms;

  if (market_clock_ != nullptr) {
    if (tick.timestamp_ms > market_clock_->now_ms()) {
      market_clock_->advance_time(tick.timestamp_ms);
    }
    health_.recordTick(tick.timestamp_ms);
  } else {
    health_.recordTick(wall_clock_.now_ms());
  }

  ++delivered_;
  sink_(TickEvent{tick});
}

// -----------------------------------------------------------------------------
// Reconnect state machine
// -----------------------------------------------------------------------------
void FeedAdapter::enterBackoff(const std::string& why) {
  std::cerr << "[FeedAdapter] WARNING: " << why << ". Reconnecting.\n";
  transport_->close();
  health_.markDisconnected();

  failed_attempts_ = 0;
  next_retry_ms_ = wall_clock_.now_ms() + backoffDelay(1);
  state_.store(State::Backoff);
  emitStatus(FeedStatus::Disconnected, why);
}

void FeedAdapter::attemptReconnect() {
  try {
    transport_->open(instruments_);
  } catch (const ConnectionError& e) {
    ++failed_attempts_;
    std::cerr << "[FeedAdapter] reconnect attempt " << failed_attempts_ << "/"
              << params_.max_reconnect_attempts << " failed: " << e.what()
              << "\n";
    if (failed_attempts_ >= params_.max_reconnect_attempts) {
      state_.store(State::Failed);
      health_.teardown();
      std::cerr << "[FeedAdapter] FATAL: feed unavailable after "
                << failed_attempts_ << " attempts.\n";
      emitStatus(FeedStatus::Unavailable, e.what());
      return;
    }
    next_retry_ms_ =
        wall_clock_.now_ms() + backoffDelay(failed_attempts_ + 1);
    return;
  }

  const int attempts = failed_attempts_ + 1;
  last_message_ms_ = wall_clock_.now_ms();
  last_tick_ts_.clear();
  failed_attempts_ = 0;
  health_.markConnected();
  state_.store(State::Connected);
  std::cout << "[FeedAdapter] reconnected after " << attempts
            << " attempt(s). Requesting snapshot.\n";
  emitStatus(FeedStatus::Resynced, "");

  try {
    for (const auto& tick : transport_->requestSnapshot(instruments_)) {
      deliver(tick);
    }
  } catch (const ConnectionError& e) {
    std::cerr << "[FeedAdapter] WARNING: snapshot request failed: "
              << e.what() << "\n";
  }
}

std::int64_t FeedAdapter::backoffDelay(int attempt) const {
  std::int64_t delay = params_.reconnect_base_ms;
  for (int i = 1; i < attempt && delay < params_.reconnect_cap_ms; ++i) {
    delay *= 2;
  }
  return std::min(delay, params_.reconnect_cap_ms);
}

void FeedAdapter::emitStatus(FeedStatus status, const std::string& detail) {
  FeedStatusEvent event;
  event.status = status;
  event.attempt = failed_attempts_;
  event.detail = detail;
  event.timestamp_ms = wall_clock_.now_ms();
  sink_(event);
}

// -----------------------------------------------------------------------------
// run() / stop()
// -----------------------------------------------------------------------------
void FeedAdapter::run() {
  while (!stop_requested_.load()) {
    const State s = state_.load();
    if (s == State::Failed) {
      break;
    }
    step();
    if (s != State::Connected) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
}

void FeedAdapter::stop() { stop_requested_.store(true); }

const char* toString(FeedAdapter::State state) {
  switch (state) {
    case FeedAdapter::State::Disconnected:
      return "DISCONNECTED";
    case FeedAdapter::State::Connected:
      return "CONNECTED";
    case FeedAdapter::State::Backoff:
      return "BACKOFF";
    case FeedAdapter::State::Failed:
      return "FAILED";
  }
  return "UNKNOWN";
}

}  // namespace condor
