#include "oc/study/SmaStudy.hpp"
#include "oc/math/Indicators.hpp"

namespace oc {

SmaStudy::SmaStudy(int period, Color color)
    : WindowedStudy("sma", "SMA(" + std::to_string(period) + ")", windowForPeriod(period)),
      period_(period) {
  batch_.color = color;
  batch_.lineWidth = 2.0f;
}

bool SmaStudy::calculate(const OhlcCandle* window, std::size_t index, const double* previous,
                         double& out) const {
  (void)index;
  (void)previous;
  out = windowSma(window, windowSize());
  return true;
}

bool SmaStudy::priceBounds(const double& value, DomainRange& out) const {
  out = {value, value};
  return true;
}

Point SmaStudy::valueToPoint(const double& value, std::size_t index,
                             const CommonScaleManager& scales) const {
  return {scales.timeScale().scaledValueFromIndex(static_cast<double>(index)),
          scales.priceScale().scaledValue(value)};
}

} // namespace oc
