#include "oc/layout/Pane.hpp"
#include "oc/render/Compositor.hpp"
#include "oc/scale/CommonScaleManager.hpp"
#include "oc/style/Theme.hpp"

#include <algorithm>
#include <stdexcept>

namespace oc {

std::vector<std::unique_ptr<Study>> Pane::primaryList(std::unique_ptr<Study> primary) {
  if (!primary) throw std::invalid_argument("Pane: primary study is null");
  std::vector<std::unique_ptr<Study>> v;
  v.push_back(std::move(primary));
  return v;
}

const NumericScale& Pane::axisScaleFor(const Study& primary, const NumericScale* axisScale) {
  if (axisScale) return *axisScale;
  const NumericScale* own = primary.yScale();
  if (!own) {
    throw std::invalid_argument("Pane: primary study '" + primary.id() +
                                "' must have a Y scale");
  }
  return *own;
}

Pane::Pane(std::unique_ptr<Study> primary, const NumericScale* axisScale, int axisTicks)
    : studies_(primaryList(std::move(primary))),
      axis_(axisScaleFor(*studies_.front(), axisScale), AxisPosition::Right, axisTicks) {}

void Pane::addStudy(std::unique_ptr<Study> study) {
  if (!study) throw std::invalid_argument("Pane: study is null");
  studies_.push_back(std::move(study));
}

bool Pane::removeStudy(const std::string& id) {
  auto it = std::find_if(studies_.begin() + 1, studies_.end(),
                         [&](const std::unique_ptr<Study>& s) { return s->id() == id; });
  if (it == studies_.end()) return false;
  studies_.erase(it);
  return true;
}

ScaleDomainUpdate Pane::updateLastCandle(const std::vector<OhlcCandle>& candles) {
  ScaleDomainUpdate merged;
  for (auto& s : studies_) merged = mergeDomainUpdates(merged, s->updateLastCandle(candles));
  return merged;
}

ScaleDomainUpdate Pane::appendNewCandle(const std::vector<OhlcCandle>& candles) {
  ScaleDomainUpdate merged;
  for (auto& s : studies_) merged = mergeDomainUpdates(merged, s->appendNewCandle(candles));
  return merged;
}

ScaleDomainUpdate Pane::prependHistoricalCandles(const std::vector<OhlcCandle>& candles) {
  ScaleDomainUpdate merged;
  for (auto& s : studies_) {
    merged = mergeDomainUpdates(merged, s->prependHistoricalCandles(candles));
  }
  return merged;
}

ScaleDomainUpdate Pane::resetCandles(const std::vector<OhlcCandle>& candles) {
  ScaleDomainUpdate merged;
  for (auto& s : studies_) merged = mergeDomainUpdates(merged, s->resetCandles(candles));
  return merged;
}

void Pane::updateScales(bool timeChanged, bool priceChanged) {
  for (auto& s : studies_) s->updateScales(timeChanged, priceChanged);
}

void Pane::renderTo(Compositor& compositor, const CommonScaleManager& scales) {
  for (auto& s : studies_) {
    if (s->enabled()) s->renderTo(compositor, scales, bounds_);
  }
}

void Pane::renderInfrastructureTo(Compositor& compositor, const CommonScaleManager& scales) {
  for (auto& s : studies_) {
    if (s->enabled()) s->renderInfrastructureTo(compositor, scales, bounds_);
  }
}

void Pane::applyTheme(const Theme& theme) {
  axis_.setStyle(axisStyleFromTheme(theme));
  for (auto& s : studies_) s->applyTheme(theme);
}

std::vector<Study*> Pane::allStudies() const {
  std::vector<Study*> out;
  out.reserve(studies_.size());
  for (const auto& s : studies_) out.push_back(s.get());
  return out;
}

Study* Pane::findStudy(const std::string& id) const {
  for (const auto& s : studies_) {
    if (s->id() == id) return s.get();
  }
  return nullptr;
}

} // namespace oc
