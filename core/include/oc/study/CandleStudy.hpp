#pragma once
#include "oc/shapes/ShapeBatch.hpp"
#include "oc/study/InstantStudy.hpp"

namespace oc {

// The candles themselves. Each candle's low/high feeds the price bounds.
class CandleStudy : public InstantStudy<OhlcCandle, CandleBatch> {
public:
  CandleStudy();

  void applyTheme(const Theme& theme) override;

protected:
  OhlcCandle calculate(const OhlcCandle& candle) const override;
  bool priceBounds(const OhlcCandle& value, DomainRange& out) const override;
  CandlePoint valueToPoint(const OhlcCandle& value, std::size_t index,
                           const CommonScaleManager& scales) const override;
};

} // namespace oc
