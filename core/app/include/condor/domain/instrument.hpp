#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace condor {
namespace domain {

// Strike prices are whole index points (NIFTY strikes are multiples of 50,
// SENSEX of 100). Using an integer keeps chain keys exact.
using Strike = std::int64_t;

enum class IndexId {
  Nifty,
  Sensex,
};

enum class OptionType {
  Call,
  Put,
};

enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// IndexSpec
// -----------------------------------------------------------------------------
// Exchange facts about a tradable index. Lot size is the exchange default and
// may be overridden in configuration when the exchange revises it.
// -----------------------------------------------------------------------------
struct IndexSpec {
  IndexId id{IndexId::Nifty};
  std::string name;           // "NIFTY" / "SENSEX", also the underlying id
  std::int64_t lot_size{0};   // Units per lot
  Strike strike_step{0};      // Distance between listed strikes
  std::string exchange;       // Options segment ("NFO" / "BFO")
};

enum class InstrumentKind {
  Underlying,
  Option,
};

// -----------------------------------------------------------------------------
// InstrumentSpec
// -----------------------------------------------------------------------------
// One subscribable instrument. For the underlying, strike/type/expiry are
// unused.
// -----------------------------------------------------------------------------
struct InstrumentSpec {
  std::string instrument_id;
  InstrumentKind kind{InstrumentKind::Option};
  IndexId index{IndexId::Nifty};
  Strike strike{0};
  OptionType option_type{OptionType::Call};
  std::int64_t expiry_ms{0};
  std::int64_t lot_size{0};
  std::string trading_symbol;
};

IndexSpec indexSpec(IndexId index);

const char* toString(IndexId index);
const char* toString(OptionType type);
const char* toString(Side side);

std::optional<IndexId> parseIndex(const std::string& text);

// "CE" / "PE", the exchange suffix for calls and puts.
const char* optionSuffix(OptionType type);

inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

}  // namespace domain
}  // namespace condor
