#include "oc/scale/CommonScaleManager.hpp"

#include <cmath>
#include <utility>

namespace oc {

CommonScaleManager::CommonScaleManager(std::vector<std::int64_t> timeData,
                                       double canvasWidth, double canvasHeight,
                                       double priceMin, double priceMax,
                                       double visibleStart, double visibleEnd)
    : timeScale_(std::move(timeData), 0.0, canvasWidth, visibleStart, visibleEnd),
      priceScale_(priceMin, priceMax, 0.0, canvasHeight, true) {}

void CommonScaleManager::updateTimeScale(double startIndex, double endIndex) {
  timeScale_.updateVisibleDomainIndices(startIndex, endIndex);
}

void CommonScaleManager::updatePriceScale(double min, double max) {
  priceScale_.updateDomain(min, max);
}

void CommonScaleManager::updateTimeScaleDomain(std::vector<std::int64_t> timestamps) {
  timeScale_.updateFullDomain(std::move(timestamps));
}

void CommonScaleManager::appendTimeScaleDomain(std::int64_t timestamp) {
  timeScale_.appendDomainValue(timestamp);
}

void CommonScaleManager::updateTimeRange(double rangeMin, double rangeMax) {
  timeScale_.updateRange(rangeMin, rangeMax);
}

void CommonScaleManager::updatePriceRange(double rangeMin, double rangeMax) {
  priceScale_.updateRange(rangeMin, rangeMax);
}

void CommonScaleManager::updateCanvasDimensions(double width, double height) {
  timeScale_.updateRange(0.0, width);
  priceScale_.updateRange(0.0, height);
}

bool CommonScaleManager::isRightEdgeVisible() const {
  std::size_t n = timeScale_.size();
  if (n == 0) return true;
  double end = timeScale_.visibleDomainIndices().endIndex;
  if (!std::isfinite(end)) return false;
  return end >= static_cast<double>(n - 1) - 1e-9;
}

} // namespace oc
