#pragma once

#include <cstdint>
#include <string>

namespace condor {
namespace domain {

// -----------------------------------------------------------------------------
// Tick
// -----------------------------------------------------------------------------
// Immutable quote for one instrument as normalized by the feed adapter.
// timestamp_ms is exchange time in epoch milliseconds.
// -----------------------------------------------------------------------------
struct Tick {
  std::string instrument_id;
  double last_price{0.0};
  double bid{0.0};
  double ask{0.0};
  double volume{0.0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};

  // Price used for valuation: last trade, or the quote mid when no trade
  // has printed yet. 0 means no usable price.
  double markPrice() const {
    if (last_price > 0.0) {
      return last_price;
    }
    if (bid > 0.0 && ask > 0.0) {
      return 0.5 * (bid + ask);
    }
    return 0.0;
  }
};

}  // namespace domain
}  // namespace condor
