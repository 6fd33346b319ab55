#include "condor/market/black_scholes.hpp"

#include <algorithm>
#include <cmath>

namespace condor {
namespace pricing {

namespace {

constexpr double kMinVol = 1e-4;
constexpr double kMaxVol = 5.0;
constexpr double kInitialVol = 0.20;
constexpr double kPriceTolerance = 1e-8;
constexpr int kNewtonIterations = 50;
constexpr int kBisectionIterations = 200;
constexpr double kDaysPerYear = 365.0;
constexpr double kPi = 3.14159265358979323846;

double intrinsic(domain::OptionType type, double spot, double strike) {
  return type == domain::OptionType::Call ? std::max(spot - strike, 0.0)
                                          : std::max(strike - spot, 0.0);
}

}  // namespace

double normalCdf(double x) { return 0.5 * std::erfc(-x / std::sqrt(2.0)); }

double normalPdf(double x) {
  static const double kInvSqrt2Pi = 1.0 / std::sqrt(2.0 * kPi);
  return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

Greeks blackScholes(domain::OptionType type, const ModelInputs& in,
                    double sigma) {
  Greeks g;
  const double S = in.spot;
  const double K = in.strike;
  const double t = in.time_years;

  if (t <= 0.0 || sigma <= 0.0 || S <= 0.0 || K <= 0.0) {
    g.price = intrinsic(type, S, K);
    if (type == domain::OptionType::Call) {
      g.delta = S > K ? 1.0 : 0.0;
    } else {
      g.delta = S < K ? -1.0 : 0.0;
    }
    return g;
  }

  const double sqrt_t = std::sqrt(t);
  const double df_r = std::exp(-in.rate * t);
  const double df_q = std::exp(-in.dividend_yield * t);
  const double d1 = (std::log(S / K) +
                     (in.rate - in.dividend_yield + 0.5 * sigma * sigma) * t) /
                    (sigma * sqrt_t);
  const double d2 = d1 - sigma * sqrt_t;
  const double pdf_d1 = normalPdf(d1);

  g.gamma = df_q * pdf_d1 / (S * sigma * sqrt_t);
  g.vega = S * df_q * pdf_d1 * sqrt_t / 100.0;

  const double decay = -S * df_q * pdf_d1 * sigma / (2.0 * sqrt_t);
  if (type == domain::OptionType::Call) {
    g.price = S * df_q * normalCdf(d1) - K * df_r * normalCdf(d2);
    g.delta = df_q * normalCdf(d1);
    g.theta = (decay - in.rate * K * df_r * normalCdf(d2) +
               in.dividend_yield * S * df_q * normalCdf(d1)) /
              kDaysPerYear;
  } else {
    g.price = K * df_r * normalCdf(-d2) - S * df_q * normalCdf(-d1);
    g.delta = -df_q * normalCdf(-d1);
    g.theta = (decay + in.rate * K * df_r * normalCdf(-d2) -
               in.dividend_yield * S * df_q * normalCdf(-d1)) /
              kDaysPerYear;
  }
  return g;
}

std::optional<double> impliedVolatility(domain::OptionType type,
                                        const ModelInputs& in, double price) {
  if (in.time_years <= 0.0 || in.spot <= 0.0 || in.strike <= 0.0 ||
      price <= 0.0) {
    return std::nullopt;
  }

  const double fwd_spot = in.spot * std::exp(-in.dividend_yield * in.time_years);
  const double pv_strike = in.strike * std::exp(-in.rate * in.time_years);
  const double lower = type == domain::OptionType::Call
                           ? std::max(fwd_spot - pv_strike, 0.0)
                           : std::max(pv_strike - fwd_spot, 0.0);
  const double upper =
      type == domain::OptionType::Call ? fwd_spot : pv_strike;
  if (price <= lower || price >= upper) {
    return std::nullopt;
  }

  // --- Newton ---------------------------------------------------------------
  double sigma = kInitialVol;
  for (int i = 0; i < kNewtonIterations; ++i) {
    const Greeks g = blackScholes(type, in, sigma);
    const double diff = g.price - price;
    if (std::fabs(diff) < kPriceTolerance) {
      return sigma;
    }
    const double vega_per_unit = g.vega * 100.0;
    if (vega_per_unit < 1e-12) {
      break;
    }
    const double next = sigma - diff / vega_per_unit;
    if (!(next > kMinVol && next < kMaxVol)) {
      break;
    }
    sigma = next;
  }

  // --- Bisection --------------------------------------------------------------
  double lo = kMinVol;
  double hi = kMaxVol;
  if (blackScholes(type, in, lo).price > price ||
      blackScholes(type, in, hi).price < price) {
    return std::nullopt;
  }
  for (int i = 0; i < kBisectionIterations; ++i) {
    const double mid = 0.5 * (lo + hi);
    const double diff = blackScholes(type, in, mid).price - price;
    if (std::fabs(diff) < kPriceTolerance) {
      return mid;
    }
    if (diff > 0.0) {
      hi = mid;
    } else {
      lo = mid;
    }
  }
  return 0.5 * (lo + hi);
}

}  // namespace pricing
}  // namespace condor
