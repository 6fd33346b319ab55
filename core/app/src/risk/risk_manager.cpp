#include "condor/risk/risk_manager.hpp"

#include <cmath>

namespace condor {

namespace {

std::optional<double> legValue(const domain::OptionLeg& leg,
                               const OptionChainSnapshot& chain) {
  if (leg.open_quantity == 0) {
    return 0.0;
  }
  const ChainEntry* entry = chain.find(leg.strike, leg.option_type);
  if (entry == nullptr) {
    return std::nullopt;
  }
  return leg.pnlSign() * (entry->price - leg.entry_price) *
         static_cast<double>(leg.open_quantity);
}

}  // namespace

std::optional<double> RiskManager::markToMarket(
    const domain::Position& position, const OptionChainSnapshot& chain) {
  double total = 0.0;
  for (const auto& leg : position.legs) {
    std::optional<double> v = legValue(leg, chain);
    if (!v) {
      return std::nullopt;
    }
    total += *v;
  }
  if (position.roll) {
    for (const auto& r : position.roll->replacements) {
      std::optional<double> v = legValue(r.replacement, chain);
      if (!v) {
        return std::nullopt;
      }
      total += *v;
    }
  }
  return total;
}

domain::RiskDecision RiskManager::evaluateEntry(
    const RiskContext& context) const {
  if (context.feed_stale) {
    return domain::ForceExit{domain::ExitReason::FeedStale, 1.0, 0.0};
  }
  if (context.open_positions >= limits_.max_positions) {
    return domain::ForceExit{domain::ExitReason::MaxPositionsExceeded,
                             static_cast<double>(context.open_positions),
                             static_cast<double>(limits_.max_positions)};
  }
  return domain::Continue{};
}

domain::RiskDecision RiskManager::evaluate(const domain::Position& position,
                                           const OptionChainSnapshot& chain,
                                           const RiskContext& context) const {
  if (context.feed_stale) {
    return domain::ForceExit{domain::ExitReason::FeedStale, 1.0, 0.0};
  }

  if (position.last_rejection) {
    return domain::ForceExit{domain::ExitReason::OrderRejected,
                             static_cast<double>(*position.last_rejection),
                             0.0};
  }

  // --- PnL limits -------------------------------------------------------------
  if (std::optional<double> unrealized = markToMarket(position, chain)) {
    const double stop = -limits_.stop_loss_pct * limits_.max_loss_per_position;
    if (*unrealized <= stop) {
      return domain::ForceExit{domain::ExitReason::StopLossBreached,
                               *unrealized, stop};
    }
    const double total = position.realized_pnl + *unrealized;
    if (total <= -limits_.max_loss_per_position) {
      return domain::ForceExit{domain::ExitReason::MaxLossBreached, total,
                               -limits_.max_loss_per_position};
    }

    if (limits_.short_premium_stop_multiple > 0.0) {
      for (const auto& leg : position.legs) {
        if (!leg.isShort() || leg.open_quantity == 0 ||
            leg.entry_price <= 0.0) {
          continue;
        }
        const ChainEntry* entry = chain.find(leg.strike, leg.option_type);
        const double limit =
            leg.entry_price * limits_.short_premium_stop_multiple;
        if (entry != nullptr && entry->price >= limit) {
          return domain::ForceExit{domain::ExitReason::PremiumStop,
                                   entry->price, limit};
        }
      }
    }
  }

  // --- Directional breach -------------------------------------------------------
  if (position.state != domain::PositionState::Entered || position.roll) {
    return domain::Continue{};
  }

  std::optional<domain::Hedge> worst;
  for (std::size_t i = 0; i < position.legs.size(); ++i) {
    const domain::OptionLeg& leg = position.legs[i];
    if (!leg.isShort() || leg.open_quantity == 0) {
      continue;
    }
    const ChainEntry* entry = chain.find(leg.strike, leg.option_type);
    if (entry == nullptr || !entry->has_greeks || entry->expired) {
      continue;
    }
    const double breach = std::fabs(entry->delta) - limits_.hedge_trigger_delta;
    if (breach < 0.0) {
      continue;
    }
    if (!worst || breach > worst->breach) {
      worst = domain::Hedge{static_cast<int>(i), entry->delta, breach};
    }
  }
  if (worst) {
    return *worst;
  }
  return domain::Continue{};
}

}  // namespace condor
