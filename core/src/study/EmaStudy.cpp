#include "oc/study/EmaStudy.hpp"
#include "oc/math/Indicators.hpp"

namespace oc {

EmaStudy::EmaStudy(int period, Color color)
    : WindowedStudy("ema", "EMA(" + std::to_string(period) + ")", windowForPeriod(period)),
      period_(period) {
  batch_.color = color;
  batch_.lineWidth = 2.0f;
}

bool EmaStudy::calculate(const OhlcCandle* window, std::size_t index, const double* previous,
                         double& out) const {
  (void)index;
  const std::size_t n = windowSize();
  if (!previous) {
    out = windowSma(window, n);
    return true;
  }
  out = emaStep(window[n - 1].close, *previous, period_);
  return true;
}

bool EmaStudy::priceBounds(const double& value, DomainRange& out) const {
  out = {value, value};
  return true;
}

Point EmaStudy::valueToPoint(const double& value, std::size_t index,
                             const CommonScaleManager& scales) const {
  return {scales.timeScale().scaledValueFromIndex(static_cast<double>(index)),
          scales.priceScale().scaledValue(value)};
}

} // namespace oc
