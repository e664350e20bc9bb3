#pragma once
#include "oc/math/Indicators.hpp"
#include "oc/shapes/ShapeBatch.hpp"
#include "oc/study/WindowedStudy.hpp"

namespace oc {

// SMA middle band with upper/lower bands at +/- multiplier population
// standard deviations. The band extent feeds the price bounds.
class BollingerStudy : public WindowedStudy<BollingerValue, BandFillBatch> {
public:
  explicit BollingerStudy(int period = 20, double multiplier = 2.0,
                          Color fill = colorFromHex(0x2196F3),
                          Color border = colorFromHex(0x2196F3));

  int period() const { return period_; }
  double multiplier() const { return multiplier_; }

protected:
  bool calculate(const OhlcCandle* window, std::size_t index, const BollingerValue* previous,
                 BollingerValue& out) const override;
  bool priceBounds(const BollingerValue& value, DomainRange& out) const override;
  BandFillPoint valueToPoint(const BollingerValue& value, std::size_t index,
                             const CommonScaleManager& scales) const override;

private:
  int period_;
  double multiplier_;
};

} // namespace oc
