#pragma once

#include "condor/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Synchronous publish/subscribe channel. Each event loop owns one bus and is
// the only thread that publishes on it, which is what serializes decisions.
// The backtest harness drives the same bus type from a single thread.
//
// Subscribers are invoked in subscription order, on the publishing thread,
// before publish() returns. Components register in their constructor and
// unregister in their destructor.
//
// Thread-safety: subscribe/unsubscribe/publish may be called from any thread.
// A callback may publish or unsubscribe re-entrantly.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every event regardless of type.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored. A publish already in progress may still invoke
  // the removed callback for the current event.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* typed = std::get_if<EventType>(&event)) {
      cb(*typed);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace condor
