#pragma once

namespace oc {

struct NiceDomain {
  double min, max, tickSpacing;
};

// Round `range` to {1, 2, 5, 10} x 10^n. With `round` the nearest such value,
// otherwise the smallest one >= range. Degenerate input yields 1.
double niceNum(double range, bool round);

// Expand [lo, hi] outward to multiples of a nice tick spacing.
NiceDomain scaleNice(double lo, double hi, int tickCount = 10);

} // namespace oc
