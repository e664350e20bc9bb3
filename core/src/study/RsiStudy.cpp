#include "oc/study/RsiStudy.hpp"
#include "oc/math/Indicators.hpp"

#include <cmath>

namespace oc {

RsiStudy::RsiStudy(int period, Color color)
    : WindowedStudy("rsi", "RSI(" + std::to_string(period) + ")", windowForPeriod(period)),
      period_(period),
      scale_(0.0, 100.0, 0.0, 100.0, true) {
  batch_.color = color;
  batch_.lineWidth = 2.0f;
}

void RsiStudy::updateScaleBounds(const Bounds& bounds) {
  scale_.updateRange(bounds.y, bounds.bottom());
}

bool RsiStudy::calculate(const OhlcCandle* window, std::size_t index, const double* previous,
                         double& out) const {
  (void)index;
  (void)previous;
  out = windowRsi(window, windowSize());
  return std::isfinite(out);
}

bool RsiStudy::priceBounds(const double& value, DomainRange& out) const {
  (void)value;
  (void)out;
  return false;
}

Point RsiStudy::valueToPoint(const double& value, std::size_t index,
                             const CommonScaleManager& scales) const {
  return {scales.timeScale().scaledValueFromIndex(static_cast<double>(index)),
          scale_.scaledValue(value)};
}

const NumericScale& RsiStudy::valueScale(const CommonScaleManager& scales) const {
  (void)scales;
  return scale_;
}

} // namespace oc
