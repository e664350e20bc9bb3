#include "oc/axis/NumericAxis.hpp"
#include "oc/math/NiceScale.hpp"
#include "oc/scale/NumericScale.hpp"

#include <cmath>
#include <cstdio>

namespace oc {

static constexpr int kMaxTicks = 1000;

std::string formatPriceLabel(double value) {
  const double a = std::fabs(value);
  char buf[64];
  if (a >= 1e9) {
    std::snprintf(buf, sizeof(buf), "%.1fB", value / 1e9);
  } else if (a >= 1e6) {
    std::snprintf(buf, sizeof(buf), "%.1fM", value / 1e6);
  } else if (a >= 1e3) {
    std::snprintf(buf, sizeof(buf), "%.1fK", value / 1e3);
  } else if (a >= 100.0) {
    std::snprintf(buf, sizeof(buf), "%.0f", std::round(value));
  } else if (a < 1.0 && value != 0.0) {
    std::snprintf(buf, sizeof(buf), "%.4f", value);
  } else {
    std::snprintf(buf, sizeof(buf), "%.2f", value);
  }
  return buf;
}

NumericAxis::NumericAxis(const NumericScale& scale, AxisPosition position, int tickCount,
                         const AxisOptions& options)
    : Axis(position, options), scale_(&scale), tickCount_(tickCount) {}

std::vector<TickInfo> NumericAxis::ticks() const {
  std::vector<TickInfo> out;
  const auto& d = scale_->domain();
  if (!std::isfinite(d.min) || !std::isfinite(d.max) || !(d.max > d.min)) return out;

  // The scale's spacing is sized for its own tick count; re-nice for ours.
  const double spacing = scaleNice(d.min, d.max, tickCount_).tickSpacing;
  if (!(spacing > 0.0)) return out;

  const double eps = spacing * 1e-9;
  const double first = std::ceil(d.min / spacing - 1e-9) * spacing;
  for (int i = 0; i < kMaxTicks; ++i) {
    const double v = first + spacing * i;
    if (v > d.max + eps) break;
    const double pos = scale_->scaledValue(v);
    if (!std::isfinite(pos)) continue;
    out.push_back({v, pos, formatPriceLabel(v)});
  }
  return out;
}

} // namespace oc
