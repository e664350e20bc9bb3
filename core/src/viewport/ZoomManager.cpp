#include "oc/viewport/ZoomManager.hpp"
#include "oc/scale/CommonScaleManager.hpp"

#include <algorithm>
#include <cmath>

namespace oc {

ZoomManager::ZoomManager(CommonScaleManager& scales) : scales_(scales) {}

bool ZoomManager::apply(double start, double end) {
  auto before = scales_.visibleDomainIndices();
  if (start == before.startIndex && end == before.endIndex) return false;
  scales_.updateTimeScale(start, end);
  auto after = scales_.visibleDomainIndices();
  return after.startIndex != before.startIndex || after.endIndex != before.endIndex;
}

bool ZoomManager::zoomIn(double factor) {
  if (!(factor > 0.0)) return false;
  auto vi = scales_.visibleDomainIndices();
  double range = vi.endIndex - vi.startIndex;
  double newRange = std::max(config_.minVisibleCandles, range / factor);
  return apply(vi.endIndex - newRange, vi.endIndex);
}

bool ZoomManager::zoomOut(double factor) {
  if (!(factor > 0.0)) return false;
  auto vi = scales_.visibleDomainIndices();
  double range = vi.endIndex - vi.startIndex;
  double newRange = std::min(config_.maxVisibleCandles, range * factor);
  return apply(std::max(0.0, vi.endIndex - newRange), vi.endIndex);
}

bool ZoomManager::pan(double deltaCandles) {
  if (!std::isfinite(deltaCandles)) return false;

  auto vi = scales_.visibleDomainIndices();
  double length = static_cast<double>(scales_.timeScale().size());
  double range = vi.endIndex - vi.startIndex;

  double start = vi.startIndex + deltaCandles;
  double end = vi.endIndex + deltaCandles;

  if (start < 0.0) {
    start = 0.0;
    end = range;
  }
  if (end >= length) {
    end = length - 1.0;
    start = std::max(0.0, end - range);
  }

  return apply(start, end);
}

bool ZoomManager::resetZoom() {
  double length = static_cast<double>(scales_.timeScale().size());
  return apply(0.0, length - 1.0);
}

double ZoomManager::zoomLevel() const {
  std::size_t n = scales_.timeScale().size();
  if (n == 0) return 0.0;
  auto vi = scales_.visibleDomainIndices();
  return (vi.endIndex - vi.startIndex) / static_cast<double>(n) * 100.0;
}

bool ZoomManager::canZoomIn() const {
  auto vi = scales_.visibleDomainIndices();
  return vi.endIndex - vi.startIndex > config_.minVisibleCandles;
}

bool ZoomManager::canZoomOut() const {
  auto vi = scales_.visibleDomainIndices();
  return vi.endIndex - vi.startIndex < config_.maxVisibleCandles;
}

bool ZoomManager::canPanLeft() const {
  return scales_.visibleDomainIndices().startIndex > 0.0;
}

bool ZoomManager::canPanRight() const {
  double length = static_cast<double>(scales_.timeScale().size());
  return scales_.visibleDomainIndices().endIndex < length - 1.0;
}

} // namespace oc
