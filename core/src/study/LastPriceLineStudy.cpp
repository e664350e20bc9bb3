#include "oc/study/LastPriceLineStudy.hpp"
#include "oc/render/Compositor.hpp"
#include "oc/scale/CommonScaleManager.hpp"
#include "oc/style/Theme.hpp"

#include <cstdio>

namespace oc {

LastPriceLineStudy::LastPriceLineStudy(Color color)
    : Study("lastPriceLine", "Last Price"), color_(color) {}

ScaleDomainUpdate LastPriceLineStudy::track(const std::vector<OhlcCandle>& candles) {
  ++priceEpoch_;
  if (candles.empty()) {
    hasPrice_ = false;
    return {};
  }
  lastPrice_ = candles.back().close;
  hasPrice_ = true;
  return {};
}

ScaleDomainUpdate LastPriceLineStudy::updateLastCandle(const std::vector<OhlcCandle>& candles) {
  return track(candles);
}

ScaleDomainUpdate LastPriceLineStudy::appendNewCandle(const std::vector<OhlcCandle>& candles) {
  return track(candles);
}

ScaleDomainUpdate LastPriceLineStudy::prependHistoricalCandles(
    const std::vector<OhlcCandle>& candles) {
  return track(candles);
}

ScaleDomainUpdate LastPriceLineStudy::resetCandles(const std::vector<OhlcCandle>& candles) {
  return track(candles);
}

void LastPriceLineStudy::updateScales(bool timeChanged, bool priceChanged) {
  if (timeChanged || priceChanged) cache_.invalidate();
}

void LastPriceLineStudy::applyTheme(const Theme& theme) {
  color_ = theme.lastPriceLine;
  cache_.invalidate();
}

bool LastPriceLineStudy::refresh(const CommonScaleManager& scales, const Bounds& bounds) {
  if (!hasPrice_) return false;

  const auto& ps = scales.priceScale();
  const auto& dom = ps.domain();
  if (lastPrice_ < dom.min || lastPrice_ > dom.max) return false;

  RenderKey key;
  key.dataEpoch = priceEpoch_;
  key.timeVersion = scales.timeScale().version();
  key.valueVersion = ps.version();
  if (!cache_.needsRebuild(key) && cachedBounds_ == bounds) {
    ++reuses_;
    return true;
  }

  const double y = ps.scaledValue(lastPrice_);

  line_.clear();
  LineShape line;
  line.start = {bounds.x, y};
  line.end = {bounds.right(), y};
  line.color = color_;
  line.lineWidth = 1.0f;
  line.dash = {5.0f, 5.0f};
  line_.lines.push_back(line);

  char text[32];
  std::snprintf(text, sizeof(text), "%.1f", lastPrice_);

  label_.clear();
  BoxedTextShape box;
  box.label.position = {bounds.right() + 2.0, y};
  box.label.text = text;
  box.label.color = colorFromHex(0xFFFFFF);
  box.label.fontSize = 11.0f;
  box.label.align = TextAlign::Left;
  box.label.baseline = TextBaseline::Middle;
  box.background = color_;
  box.padding = 3.0f;
  label_.boxedTexts.push_back(box);

  cache_.store(key);
  cachedBounds_ = bounds;
  ++rebuilds_;
  return true;
}

void LastPriceLineStudy::renderTo(Compositor& compositor, const CommonScaleManager& scales,
                                  const Bounds& bounds) {
  if (!refresh(scales, bounds)) return;
  compositor.renderShapes(line_);
}

void LastPriceLineStudy::renderInfrastructureTo(Compositor& compositor,
                                                const CommonScaleManager& scales,
                                                const Bounds& bounds) {
  if (!refresh(scales, bounds)) return;
  compositor.renderShapes(label_);
}

} // namespace oc
