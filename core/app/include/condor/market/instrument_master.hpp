#pragma once

#include "condor/domain/instrument.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// InstrumentMaster
// -----------------------------------------------------------------------------
//
// @brief  The subscribable universe for one index and one expiry: the
//         underlying plus its listed calls and puts.
//
// @details
// Option ids follow "<INDEX>-<strike>-<CE|PE>" (e.g. "NIFTY-22300-CE"); the
// underlying's id is the index name itself. Built once at startup, from an
// explicit list in configuration or by generate(), then read-only.
//
// Thread-safety: immutable after construction; safe to share by const&.
// -----------------------------------------------------------------------------
class InstrumentMaster {
 public:
  InstrumentMaster(domain::IndexId index, std::int64_t expiry_ms,
                   std::int64_t lot_size);

  // Underlying plus strikes at center +/- k*step for k in [0, strikes_each_side].
  static InstrumentMaster generate(domain::IndexId index,
                                   std::int64_t expiry_ms,
                                   domain::Strike center_strike,
                                   int strikes_each_side,
                                   std::int64_t lot_size);

  static std::string optionId(domain::IndexId index, domain::Strike strike,
                              domain::OptionType type);

  // Throws ConfigInvalid on duplicates, off-step strikes or a foreign expiry.
  void addOption(domain::Strike strike, domain::OptionType type,
                 const std::string& trading_symbol = "");

  const domain::InstrumentSpec* find(const std::string& instrument_id) const;
  const domain::InstrumentSpec* findOption(domain::Strike strike,
                                           domain::OptionType type) const;

  // Listed strikes for one option type, ascending.
  std::vector<domain::Strike> strikes(domain::OptionType type) const;

  std::vector<std::string> instrumentIds() const;

  const std::string& underlyingId() const { return underlying_.instrument_id; }
  domain::IndexId index() const { return index_; }
  std::int64_t expiryMs() const { return expiry_ms_; }
  std::int64_t lotSize() const { return lot_size_; }
  domain::Strike strikeStep() const { return strike_step_; }
  std::size_t optionCount() const { return options_.size(); }

 private:
  using Key = std::pair<domain::Strike, domain::OptionType>;

  domain::IndexId index_;
  std::int64_t expiry_ms_;
  std::int64_t lot_size_;
  domain::Strike strike_step_;
  domain::InstrumentSpec underlying_;

  std::map<Key, domain::InstrumentSpec> options_;
  std::unordered_map<std::string, Key> by_id_;
};

}  // namespace condor
