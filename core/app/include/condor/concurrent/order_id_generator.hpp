#pragma once

#include <atomic>
#include <cstdint>

namespace condor {

// -----------------------------------------------------------------------------
// OrderIdGenerator
// -----------------------------------------------------------------------------
// @brief  Source of client order ids. Ids start at 1 and never repeat within
//         one generator instance.
//
// @details
// The client order id is what the venue uses to make a retried placement
// idempotent, so ids must also stay unique across a crash/restart. Crash
// recovery calls seed() with the highest id found in the order-event log
// before any new order is created.
//
// Thread-safety: next_id() and seed() are safe from any thread.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Guarantees that every id handed out from now on is > last_used.
  void seed(std::uint64_t last_used) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= last_used &&
           !next_id_.compare_exchange_weak(current, last_used + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace condor
