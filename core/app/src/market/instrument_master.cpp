#include "condor/market/instrument_master.hpp"
#include "condor/domain/errors.hpp"

namespace condor {

InstrumentMaster::InstrumentMaster(domain::IndexId index,
                                   std::int64_t expiry_ms,
                                   std::int64_t lot_size)
    : index_(index),
      expiry_ms_(expiry_ms),
      lot_size_(lot_size),
      strike_step_(domain::indexSpec(index).strike_step) {
  if (lot_size_ <= 0) {
    throw ConfigInvalid("lot size must be positive");
  }
  underlying_.instrument_id = domain::indexSpec(index).name;
  underlying_.kind = domain::InstrumentKind::Underlying;
  underlying_.index = index;
  underlying_.lot_size = lot_size;
  underlying_.trading_symbol = underlying_.instrument_id;
}

InstrumentMaster InstrumentMaster::generate(domain::IndexId index,
                                            std::int64_t expiry_ms,
                                            domain::Strike center_strike,
                                            int strikes_each_side,
                                            std::int64_t lot_size) {
  InstrumentMaster master(index, expiry_ms, lot_size);
  const domain::Strike step = master.strike_step_;
  if (center_strike % step != 0) {
    throw ConfigInvalid("center strike " + std::to_string(center_strike) +
                        " is not a multiple of " + std::to_string(step));
  }
  for (int k = -strikes_each_side; k <= strikes_each_side; ++k) {
    const domain::Strike strike = center_strike + k * step;
    if (strike <= 0) {
      continue;
    }
    master.addOption(strike, domain::OptionType::Call);
    master.addOption(strike, domain::OptionType::Put);
  }
  return master;
}

std::string InstrumentMaster::optionId(domain::IndexId index,
                                       domain::Strike strike,
                                       domain::OptionType type) {
  return std::string(domain::toString(index)) + "-" + std::to_string(strike) +
         "-" + domain::optionSuffix(type);
}

void InstrumentMaster::addOption(domain::Strike strike,
                                 domain::OptionType type,
                                 const std::string& trading_symbol) {
  if (strike <= 0 || strike % strike_step_ != 0) {
    throw ConfigInvalid("strike " + std::to_string(strike) +
                        " is not a listed " + domain::toString(index_) +
                        " strike");
  }
  const Key key{strike, type};
  if (options_.count(key) != 0) {
    throw ConfigInvalid("duplicate option " + optionId(index_, strike, type));
  }

  domain::InstrumentSpec spec;
  spec.instrument_id = optionId(index_, strike, type);
  spec.kind = domain::InstrumentKind::Option;
  spec.index = index_;
  spec.strike = strike;
  spec.option_type = type;
  spec.expiry_ms = expiry_ms_;
  spec.lot_size = lot_size_;
  spec.trading_symbol =
      trading_symbol.empty() ? spec.instrument_id : trading_symbol;

  by_id_.emplace(spec.instrument_id, key);
  options_.emplace(key, std::move(spec));
}

const domain::InstrumentSpec* InstrumentMaster::find(
    const std::string& instrument_id) const {
  if (instrument_id == underlying_.instrument_id) {
    return &underlying_;
  }
  auto it = by_id_.find(instrument_id);
  if (it == by_id_.end()) {
    return nullptr;
  }
  return &options_.at(it->second);
}

const domain::InstrumentSpec* InstrumentMaster::findOption(
    domain::Strike strike, domain::OptionType type) const {
  auto it = options_.find(Key{strike, type});
  return it == options_.end() ? nullptr : &it->second;
}

std::vector<domain::Strike> InstrumentMaster::strikes(
    domain::OptionType type) const {
  std::vector<domain::Strike> result;
  for (const auto& [key, spec] : options_) {
    if (key.second == type) {
      result.push_back(key.first);
    }
  }
  return result;
}

std::vector<std::string> InstrumentMaster::instrumentIds() const {
  std::vector<std::string> ids;
  ids.reserve(options_.size() + 1);
  ids.push_back(underlying_.instrument_id);
  for (const auto& [key, spec] : options_) {
    ids.push_back(spec.instrument_id);
  }
  return ids;
}

}  // namespace condor
