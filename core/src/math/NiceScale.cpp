#include "oc/math/NiceScale.hpp"
#include <cmath>

namespace oc {

double niceNum(double range, bool round) {
  if (!std::isfinite(range) || range <= 0.0) return 1.0;

  double exponent = std::floor(std::log10(range));
  double mag = std::pow(10.0, exponent);
  double fraction = range / mag;

  double nice;
  if (round) {
    if (fraction < 1.5)      nice = 1.0;
    else if (fraction < 3.0) nice = 2.0;
    else if (fraction < 7.0) nice = 5.0;
    else                     nice = 10.0;
  } else {
    if (fraction <= 1.0)      nice = 1.0;
    else if (fraction <= 2.0) nice = 2.0;
    else if (fraction <= 5.0) nice = 5.0;
    else                      nice = 10.0;
  }
  return nice * mag;
}

NiceDomain scaleNice(double lo, double hi, int tickCount) {
  if (tickCount < 2) tickCount = 2;

  double range = niceNum(hi - lo, false);
  double spacing = niceNum(range / static_cast<double>(tickCount - 1), true);

  NiceDomain d;
  d.tickSpacing = spacing;
  d.min = std::floor(lo / spacing) * spacing;
  d.max = std::ceil(hi / spacing) * spacing;
  return d;
}

} // namespace oc
