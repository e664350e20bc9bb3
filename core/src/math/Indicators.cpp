#include "oc/math/Indicators.hpp"
#include <cmath>
#include <limits>

namespace oc {

double windowSma(const OhlcCandle* window, std::size_t count) {
  if (count == 0) return std::numeric_limits<double>::quiet_NaN();
  double sum = 0.0;
  for (std::size_t i = 0; i < count; i++) sum += window[i].close;
  return sum / static_cast<double>(count);
}

double emaStep(double close, double prevEma, int period) {
  double k = 2.0 / (static_cast<double>(period) + 1.0);
  return (close - prevEma) * k + prevEma;
}

double windowRsi(const OhlcCandle* window, std::size_t count) {
  if (count < 2) return std::numeric_limits<double>::quiet_NaN();

  double gain = 0.0, loss = 0.0;
  for (std::size_t i = 1; i < count; i++) {
    double change = window[i].close - window[i - 1].close;
    if (change > 0) gain += change;
    else loss -= change;
  }

  double n = static_cast<double>(count - 1);
  double avgGain = gain / n;
  double avgLoss = loss / n;

  if (avgLoss == 0.0) return 100.0;
  double rs = avgGain / avgLoss;
  return 100.0 - 100.0 / (1.0 + rs);
}

BollingerValue windowBollinger(const OhlcCandle* window, std::size_t count,
                               double multiplier) {
  double mean = windowSma(window, count);
  double var = 0.0;
  for (std::size_t i = 0; i < count; i++) {
    double d = window[i].close - mean;
    var += d * d;
  }
  double sd = count > 0 ? std::sqrt(var / static_cast<double>(count)) : 0.0;
  return {mean + multiplier * sd, mean, mean - multiplier * sd};
}

} // namespace oc
