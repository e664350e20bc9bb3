#include "oc/study/CandleStudy.hpp"
#include "oc/style/Theme.hpp"

#include <algorithm>
#include <cmath>

namespace oc {

static constexpr double kCandleWidthRatio = 0.7;

CandleStudy::CandleStudy() : InstantStudy("candles", "Candles") {}

void CandleStudy::applyTheme(const Theme& theme) {
  batch_.upColor = theme.candlePositive;
  batch_.downColor = theme.candleNegative;
}

OhlcCandle CandleStudy::calculate(const OhlcCandle& candle) const {
  return candle;
}

bool CandleStudy::priceBounds(const OhlcCandle& value, DomainRange& out) const {
  out = {value.low, value.high};
  return true;
}

CandlePoint CandleStudy::valueToPoint(const OhlcCandle& value, std::size_t index,
                                      const CommonScaleManager& scales) const {
  const auto& ts = scales.timeScale();
  const auto& ps = scales.priceScale();

  const double bodyTop = std::max(value.open, value.close);
  const double bodyBottom = std::min(value.open, value.close);
  const double yTop = ps.scaledValue(bodyTop);
  const double yBottom = ps.scaledValue(bodyBottom);

  CandlePoint p;
  p.x = ts.scaledValueFromIndex(static_cast<double>(index));
  p.upperWick = {yTop, ps.scaledValue(value.high)};
  p.lowerWick = {ps.scaledValue(value.low), yBottom};
  p.body = {yTop, std::fabs(yTop - yBottom), ts.boxWidth() * kCandleWidthRatio};
  p.isPositive = value.close >= value.open;
  return p;
}

} // namespace oc
