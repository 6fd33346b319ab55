#pragma once

#include "condor/domain/instrument.hpp"

#include <cstdint>
#include <string>

namespace condor {
namespace domain {

// Position of a leg inside an Iron Condor. The numeric values are the leg
// indices, in the order the legs are stored.
enum class LegRole {
  ShortCall = 0,
  LongCall = 1,
  ShortPut = 2,
  LongPut = 3,
};

// -----------------------------------------------------------------------------
// OptionLeg
// -----------------------------------------------------------------------------
// @brief  One single-option component of a Position.
//
// @details
// quantity is the intended size in units (lots x lot size). open_quantity is
// what the venue has actually filled and not yet closed; a leg is flat when
// open_quantity is 0. entry_price and exit_price are volume-weighted averages
// of the opening and closing fills respectively.
//
// A leg is owned by exactly one Position and never shared.
// -----------------------------------------------------------------------------
struct OptionLeg {
  Strike strike{0};
  OptionType option_type{OptionType::Call};
  std::int64_t expiry_ms{0};
  std::string instrument_id;
  Side side{Side::Sell};
  std::int64_t quantity{0};
  double entry_price{0.0};

  LegRole role{LegRole::ShortCall};
  std::int64_t open_quantity{0};
  std::int64_t closed_quantity{0};
  double exit_price{0.0};

  bool isShort() const { return side == Side::Sell; }

  // +1 for long legs, -1 for short legs. PnL per unit is
  // sign * (mark - entry_price).
  double pnlSign() const { return side == Side::Buy ? 1.0 : -1.0; }
};

}  // namespace domain
}  // namespace condor
