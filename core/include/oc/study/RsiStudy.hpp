#pragma once
#include "oc/scale/NumericScale.hpp"
#include "oc/shapes/ShapeBatch.hpp"
#include "oc/study/WindowedStudy.hpp"

namespace oc {

// Simple-average RSI over a window of `period` candles (period-1 closing-price
// changes). RSI(1) has no changes and produces no values. Drawn on a private
// inverted 0..100 scale.
class RsiStudy : public WindowedStudy<double, PolylineBatch> {
public:
  explicit RsiStudy(int period = 14, Color color = colorFromHex(0x9C27B0));

  int period() const { return period_; }

  void updateScaleBounds(const Bounds& bounds) override;
  const NumericScale* yScale() const override { return &scale_; }

protected:
  bool calculate(const OhlcCandle* window, std::size_t index, const double* previous,
                 double& out) const override;
  bool priceBounds(const double& value, DomainRange& out) const override;
  Point valueToPoint(const double& value, std::size_t index,
                     const CommonScaleManager& scales) const override;
  const NumericScale& valueScale(const CommonScaleManager& scales) const override;

private:
  int period_;
  NumericScale scale_;
};

} // namespace oc
