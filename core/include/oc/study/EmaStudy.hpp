#pragma once
#include "oc/shapes/ShapeBatch.hpp"
#include "oc/study/WindowedStudy.hpp"

namespace oc {

// Seeded with the SMA of the first full window, then one EMA step per
// candle. Re-ticking the last candle recomputes from the EMA committed at
// the previous candle, so repeated updates never compound.
class EmaStudy : public WindowedStudy<double, PolylineBatch> {
public:
  explicit EmaStudy(int period = 12, Color color = colorFromHex(0xFF6B6B));

  int period() const { return period_; }

protected:
  bool calculate(const OhlcCandle* window, std::size_t index, const double* previous,
                 double& out) const override;
  bool priceBounds(const double& value, DomainRange& out) const override;
  Point valueToPoint(const double& value, std::size_t index,
                     const CommonScaleManager& scales) const override;

private:
  int period_;
};

} // namespace oc
