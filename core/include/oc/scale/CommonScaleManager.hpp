#pragma once
#include "oc/scale/NumericScale.hpp"
#include "oc/scale/OrdinalTimeScale.hpp"

#include <cstdint>
#include <vector>

namespace oc {

// Single owner of the shared time scale and the shared (inverted) price
// scale. Everything else reads them through const references.
class CommonScaleManager {
public:
  CommonScaleManager(std::vector<std::int64_t> timeData,
                     double canvasWidth, double canvasHeight,
                     double priceMin, double priceMax,
                     double visibleStart = 0.0, double visibleEnd = -1.0);

  const OrdinalTimeScale& timeScale() const { return timeScale_; }
  const NumericScale& priceScale() const { return priceScale_; }

  void updateTimeScale(double startIndex, double endIndex);
  void updatePriceScale(double min, double max);
  void updateTimeScaleDomain(std::vector<std::int64_t> timestamps);
  void appendTimeScaleDomain(std::int64_t timestamp);
  void updateTimeRange(double rangeMin, double rangeMax);
  void updatePriceRange(double rangeMin, double rangeMax);
  void updateCanvasDimensions(double width, double height);

  VisibleIndices visibleDomainIndices() const { return timeScale_.visibleDomainIndices(); }

  // True when the visible window reaches the newest candle.
  bool isRightEdgeVisible() const;

private:
  OrdinalTimeScale timeScale_;
  NumericScale priceScale_;
};

} // namespace oc
