#include "oc/study/BollingerStudy.hpp"

#include <cstdio>
#include <stdexcept>

namespace oc {

static std::string bollingerName(int period, double multiplier) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "BB(%d,%g)", period, multiplier);
  return buf;
}

BollingerStudy::BollingerStudy(int period, double multiplier, Color fill, Color border)
    : WindowedStudy("bb", bollingerName(period, multiplier), windowForPeriod(period)),
      period_(period),
      multiplier_(multiplier) {
  if (!(multiplier_ > 0.0)) {
    throw std::invalid_argument("BollingerStudy: multiplier must be positive");
  }
  batch_.fillColor = fill;
  batch_.fillOpacity = 0.1f;
  batch_.borderColor = border;
  batch_.borderWidth = 1.0f;
  batch_.showBorders = true;
}

bool BollingerStudy::calculate(const OhlcCandle* window, std::size_t index,
                               const BollingerValue* previous, BollingerValue& out) const {
  (void)index;
  (void)previous;
  out = windowBollinger(window, windowSize(), multiplier_);
  return true;
}

bool BollingerStudy::priceBounds(const BollingerValue& value, DomainRange& out) const {
  out = {value.lower, value.upper};
  return true;
}

BandFillPoint BollingerStudy::valueToPoint(const BollingerValue& value, std::size_t index,
                                           const CommonScaleManager& scales) const {
  const double x = scales.timeScale().scaledValueFromIndex(static_cast<double>(index));
  const auto& ps = scales.priceScale();
  return {{x, ps.scaledValue(value.upper)},
          {x, ps.scaledValue(value.middle)},
          {x, ps.scaledValue(value.lower)}};
}

} // namespace oc
