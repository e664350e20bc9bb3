#include "oc/study/VolumeStudy.hpp"
#include "oc/style/Theme.hpp"

#include <algorithm>
#include <cmath>

namespace oc {

VolumeStudy::VolumeStudy()
    : InstantStudy("volume", "Volume"), scale_(0.0, 1.0, 0.0, 100.0, true) {}

ScaleDomainUpdate VolumeStudy::updateLastCandle(const std::vector<OhlcCandle>& candles) {
  const bool replacing = replacesLast(candles);
  const double replaced = replacing ? data_.back().value.volume : 0.0;
  InstantStudy::updateLastCandle(candles);
  trackLatest(replacing, replaced);
  return {};
}

ScaleDomainUpdate VolumeStudy::appendNewCandle(const std::vector<OhlcCandle>& candles) {
  const bool replacing = replacesLast(candles);
  const double replaced = replacing ? data_.back().value.volume : 0.0;
  InstantStudy::appendNewCandle(candles);
  trackLatest(replacing, replaced);
  return {};
}

ScaleDomainUpdate VolumeStudy::prependHistoricalCandles(const std::vector<OhlcCandle>& candles) {
  InstantStudy::prependHistoricalCandles(candles);
  rescanMaxVolume();
  return {};
}

ScaleDomainUpdate VolumeStudy::resetCandles(const std::vector<OhlcCandle>& candles) {
  InstantStudy::resetCandles(candles);
  rescanMaxVolume();
  return {};
}

bool VolumeStudy::replacesLast(const std::vector<OhlcCandle>& candles) const {
  return !candles.empty() && !data_.empty() &&
         data_.back().timestamp == candles.back().timestamp;
}

// O(1) unless the replaced value held the maximum and shrank.
void VolumeStudy::trackLatest(bool replacing, double replaced) {
  if (data_.empty()) return;
  const double v = data_.back().value.volume;
  if (replacing && replaced == maxVolume_ && v < replaced) {
    rescanMaxVolume();
  } else if (v > maxVolume_) {
    setMaxVolume(v);
  }
}

void VolumeStudy::rescanMaxVolume() {
  ++rescans_;
  double maxV = 0.0;
  for (const auto& dp : data_) maxV = std::max(maxV, dp.value.volume);
  setMaxVolume(maxV);
}

void VolumeStudy::setMaxVolume(double maxV) {
  if (maxV == maxVolume_) return;
  maxVolume_ = maxV;
  // A flat zero series still needs a non-degenerate domain.
  scale_.updateDomain(0.0, maxVolume_ > 0.0 ? maxVolume_ : 1.0);
}

void VolumeStudy::updateScaleBounds(const Bounds& bounds) {
  scale_.updateRange(bounds.y, bounds.bottom());
}

void VolumeStudy::applyTheme(const Theme& theme) {
  batch_.upColor = theme.candlePositive;
  batch_.upColor[3] = theme.volumeAlpha;
  batch_.downColor = theme.candleNegative;
  batch_.downColor[3] = theme.volumeAlpha;
}

VolumeValue VolumeStudy::calculate(const OhlcCandle& candle) const {
  return {candle.volume, candle.close >= candle.open};
}

bool VolumeStudy::priceBounds(const VolumeValue& value, DomainRange& out) const {
  (void)value;
  (void)out;
  return false;
}

BarPoint VolumeStudy::valueToPoint(const VolumeValue& value, std::size_t index,
                                   const CommonScaleManager& scales) const {
  const auto& ts = scales.timeScale();
  const double width = ts.boxWidth() * 0.7;
  const double center = ts.scaledValueFromIndex(static_cast<double>(index));
  const double y0 = scale_.scaledValue(0.0);
  const double y1 = scale_.scaledValue(value.volume);

  BarPoint p;
  p.x = center - width / 2.0;
  p.y = std::min(y0, y1);
  p.width = width;
  p.height = std::fabs(y1 - y0);
  p.isPositive = value.isPositive;
  return p;
}

const NumericScale& VolumeStudy::valueScale(const CommonScaleManager& scales) const {
  (void)scales;
  return scale_;
}

} // namespace oc
