#pragma once
#include "oc/axis/Axis.hpp"

#include <string>

namespace oc {

class NumericScale;

// B/M/K suffixes with one decimal from 1000 up; whole numbers from 100;
// four decimals below 1 (except 0); two decimals otherwise.
std::string formatPriceLabel(double value);

// Ticks at every multiple of a nice spacing sized for about `tickCount`
// ticks across the scale's domain.
class NumericAxis : public Axis {
public:
  NumericAxis(const NumericScale& scale, AxisPosition position, int tickCount,
              const AxisOptions& options = {});

  std::vector<TickInfo> ticks() const override;

  void setScale(const NumericScale& scale) { scale_ = &scale; }
  const NumericScale& scale() const { return *scale_; }
  int tickCount() const { return tickCount_; }

private:
  const NumericScale* scale_;
  int tickCount_;
};

} // namespace oc
