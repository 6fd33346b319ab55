#pragma once

#include "condor/domain/instrument.hpp"

#include <optional>

namespace condor {
namespace pricing {

// -----------------------------------------------------------------------------
// Black-Scholes-Merton for European index options
// -----------------------------------------------------------------------------
// Inputs: spot S, strike K, time to expiry t in years, continuously
// compounded risk-free rate r and dividend yield q, volatility sigma.
//
// Outputs follow desk conventions:
//   theta  per calendar day
//   vega   per 1 volatility point (0.01)
//
// All functions are pure and deterministic (fixed iteration counts, no
// randomness, no global state) so that a backtest and a live session price
// the same inputs identically.
// -----------------------------------------------------------------------------

struct Greeks {
  double price{0.0};
  double delta{0.0};
  double gamma{0.0};
  double theta{0.0};
  double vega{0.0};
};

struct ModelInputs {
  double spot{0.0};
  double strike{0.0};
  double time_years{0.0};
  double rate{0.0};
  double dividend_yield{0.0};
};

double normalCdf(double x);
double normalPdf(double x);

// Price and Greeks at volatility sigma. When t <= 0 or sigma <= 0 the
// intrinsic value is returned with a step delta and zero higher Greeks.
Greeks blackScholes(domain::OptionType type, const ModelInputs& in,
                    double sigma);

// Implied volatility that reproduces `price`, or std::nullopt when the price
// lies outside the no-arbitrage bounds or t <= 0.
//
// Safeguarded Newton from 20% vol; falls back to bisection on [1e-4, 5.0]
// when a Newton step leaves the bracket or vega vanishes.
std::optional<double> impliedVolatility(domain::OptionType type,
                                        const ModelInputs& in, double price);

}  // namespace pricing
}  // namespace condor
