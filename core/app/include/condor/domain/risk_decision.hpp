#pragma once

#include <variant>

namespace condor {
namespace domain {

// Why a Position is (or would be) forced out. The first group comes from the
// RiskManager, the second from the strategy's own exit rules.
enum class ExitReason {
  StopLossBreached,
  MaxLossBreached,
  PremiumStop,
  OrderRejected,
  MaxPositionsExceeded,
  FeedStale,
  TimeExit,
  TakeProfit,
  RollFailed,
};

const char* toString(ExitReason reason);

// MaxPositionsExceeded and FeedStale block new risk only; every other reason
// closes the Position.
bool closesPosition(ExitReason reason);

struct Continue {};

// Roll the short leg at leg_index. delta is its current delta; breach is how
// far |delta| is past the hedge trigger.
struct Hedge {
  int leg_index{0};
  double delta{0.0};
  double breach{0.0};
};

struct ForceExit {
  ExitReason reason{ExitReason::StopLossBreached};
  double observed{0.0};
  double limit{0.0};
};

using RiskDecision = std::variant<Continue, Hedge, ForceExit>;

}  // namespace domain
}  // namespace condor
