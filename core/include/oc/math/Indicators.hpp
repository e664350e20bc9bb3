#pragma once
#include "oc/data/Candle.hpp"

#include <cstddef>

namespace oc {

// Window helpers over candle closes. `window` points at `count` consecutive
// candles, oldest first.

double windowSma(const OhlcCandle* window, std::size_t count);

// One EMA step: (close - prev) * 2/(period+1) + prev.
double emaStep(double close, double prevEma, int period);

// RSI over `count` candles (count-1 price changes).
// No losses in the window gives exactly 100.
double windowRsi(const OhlcCandle* window, std::size_t count);

struct BollingerValue {
  double upper, middle, lower;
};

// SMA +/- multiplier * population standard deviation of closes.
BollingerValue windowBollinger(const OhlcCandle* window, std::size_t count,
                               double multiplier);

} // namespace oc
