#pragma once
#include "oc/scale/NumericScale.hpp"
#include "oc/shapes/ShapeBatch.hpp"
#include "oc/study/InstantStudy.hpp"

namespace oc {

struct VolumeValue {
  double volume{0};
  bool isPositive{true};
};

// Volume bars on a private inverted 0..maxVolume scale. Never touches the
// shared price scale.
class VolumeStudy : public InstantStudy<VolumeValue, BarBatch> {
public:
  VolumeStudy();

  ScaleDomainUpdate updateLastCandle(const std::vector<OhlcCandle>& candles) override;
  ScaleDomainUpdate appendNewCandle(const std::vector<OhlcCandle>& candles) override;
  ScaleDomainUpdate prependHistoricalCandles(const std::vector<OhlcCandle>& candles) override;
  ScaleDomainUpdate resetCandles(const std::vector<OhlcCandle>& candles) override;

  void updateScaleBounds(const Bounds& bounds) override;
  const NumericScale* yScale() const override { return &scale_; }
  void applyTheme(const Theme& theme) override;

  double maxVolume() const { return maxVolume_; }
  // Full passes over the computed data to find the maximum.
  std::uint64_t maxVolumeRescans() const { return rescans_; }

protected:
  VolumeValue calculate(const OhlcCandle& candle) const override;
  bool priceBounds(const VolumeValue& value, DomainRange& out) const override;
  BarPoint valueToPoint(const VolumeValue& value, std::size_t index,
                        const CommonScaleManager& scales) const override;
  const NumericScale& valueScale(const CommonScaleManager& scales) const override;

private:
  bool replacesLast(const std::vector<OhlcCandle>& candles) const;
  void trackLatest(bool replacing, double replaced);
  void rescanMaxVolume();
  void setMaxVolume(double maxV);

  NumericScale scale_;
  double maxVolume_{0};
  std::uint64_t rescans_{0};
};

} // namespace oc
