#include "oc/layout/PaneManager.hpp"

#include <algorithm>
#include <stdexcept>

namespace oc {

PaneManager::PaneManager(std::unique_ptr<MainPane> mainPane) : main_(std::move(mainPane)) {
  if (!main_) throw std::invalid_argument("PaneManager: main pane is null");
}

SubPane& PaneManager::addSubPane(std::unique_ptr<SubPane> pane) {
  if (!pane) throw std::invalid_argument("PaneManager: sub-pane is null");
  if (findSubPane(pane->id())) {
    throw std::invalid_argument("PaneManager: duplicate sub-pane id '" + pane->id() + "'");
  }
  subs_.push_back(std::move(pane));
  return *subs_.back();
}

bool PaneManager::removeSubPane(const std::string& id) {
  auto it = std::find_if(subs_.begin(), subs_.end(),
                         [&](const std::unique_ptr<SubPane>& p) { return p->id() == id; });
  if (it == subs_.end()) return false;
  subs_.erase(it);
  return true;
}

SubPane* PaneManager::findSubPane(const std::string& id) const {
  for (const auto& p : subs_) {
    if (p->id() == id) return p.get();
  }
  return nullptr;
}

template <typename Fn>
PaneUpdates PaneManager::collect(Fn fn) {
  PaneUpdates out;
  ScaleDomainUpdate u = fn(static_cast<Pane&>(*main_));
  if (!u.empty()) out["main"] = u;
  for (std::size_t i = 0; i < subs_.size(); ++i) {
    u = fn(static_cast<Pane&>(*subs_[i]));
    if (!u.empty()) out["subpane-" + std::to_string(i)] = u;
  }
  return out;
}

PaneUpdates PaneManager::updateLastCandle(const std::vector<OhlcCandle>& candles) {
  return collect([&](Pane& p) { return p.updateLastCandle(candles); });
}

PaneUpdates PaneManager::appendNewCandle(const std::vector<OhlcCandle>& candles) {
  return collect([&](Pane& p) { return p.appendNewCandle(candles); });
}

PaneUpdates PaneManager::prependHistoricalCandles(const std::vector<OhlcCandle>& candles) {
  return collect([&](Pane& p) { return p.prependHistoricalCandles(candles); });
}

PaneUpdates PaneManager::resetCandles(const std::vector<OhlcCandle>& candles) {
  return collect([&](Pane& p) { return p.resetCandles(candles); });
}

void PaneManager::updateScales(bool timeChanged, bool priceChanged) {
  main_->updateScales(timeChanged, priceChanged);
  for (auto& p : subs_) p->updateScales(timeChanged, priceChanged);
}

void PaneManager::applyTheme(const Theme& theme) {
  main_->applyTheme(theme);
  for (auto& p : subs_) p->applyTheme(theme);
}

std::vector<Study*> PaneManager::allStudies() const {
  std::vector<Study*> out = main_->allStudies();
  for (const auto& p : subs_) {
    auto s = p->allStudies();
    out.insert(out.end(), s.begin(), s.end());
  }
  return out;
}

Study* PaneManager::findStudy(const std::string& id) const {
  if (Study* s = main_->findStudy(id)) return s;
  for (const auto& p : subs_) {
    if (Study* s = p->findStudy(id)) return s;
  }
  return nullptr;
}

} // namespace oc
