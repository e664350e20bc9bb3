#pragma once
#include "oc/study/Study.hpp"
#include "oc/style/Color.hpp"

namespace oc {

// Dashed horizontal line at the latest close plus a boxed price label over
// the price axis. Does not contribute to price bounds.
class LastPriceLineStudy : public Study {
public:
  explicit LastPriceLineStudy(Color color = colorFromHex(0x2962FF));

  ScaleDomainUpdate updateLastCandle(const std::vector<OhlcCandle>& candles) override;
  ScaleDomainUpdate appendNewCandle(const std::vector<OhlcCandle>& candles) override;
  ScaleDomainUpdate prependHistoricalCandles(const std::vector<OhlcCandle>& candles) override;
  ScaleDomainUpdate resetCandles(const std::vector<OhlcCandle>& candles) override;

  void updateScales(bool timeChanged, bool priceChanged) override;
  void applyTheme(const Theme& theme) override;

  void renderTo(Compositor& compositor, const CommonScaleManager& scales,
                const Bounds& bounds) override;
  void renderInfrastructureTo(Compositor& compositor, const CommonScaleManager& scales,
                              const Bounds& bounds) override;

  bool hasPrice() const { return hasPrice_; }
  double lastPrice() const { return lastPrice_; }

private:
  ScaleDomainUpdate track(const std::vector<OhlcCandle>& candles);
  // False when there is nothing to draw (no price, or price off-scale).
  bool refresh(const CommonScaleManager& scales, const Bounds& bounds);

  Color color_;
  double lastPrice_{0};
  bool hasPrice_{false};

  ShapeList line_;
  ShapeList label_;
  RenderCache cache_;
  Bounds cachedBounds_;
  std::uint64_t priceEpoch_{0};
};

} // namespace oc
