#pragma once
#include "oc/shapes/ShapeBatch.hpp"
#include "oc/study/WindowedStudy.hpp"

namespace oc {

class SmaStudy : public WindowedStudy<double, PolylineBatch> {
public:
  explicit SmaStudy(int period = 20, Color color = colorFromHex(0x4285F4));

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
