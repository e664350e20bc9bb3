#include "oc/chart/Chart.hpp"
#include "oc/data/DataManager.hpp"
#include "oc/study/CandleStudy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace oc {

static Theme resolveTheme(const std::string& name) {
  Theme t;
  if (!themeByName(name, t)) {
    throw std::invalid_argument("Chart: unknown theme '" + name + "'");
  }
  return t;
}

static std::unique_ptr<MainPane> makeMainPane(const CommonScaleManager& scales) {
  return std::make_unique<MainPane>(std::make_unique<CandleStudy>(), scales.priceScale());
}

Chart::Chart(DataManager& dataManager, Compositor& compositor, const ChartConfig& config)
    : data_(dataManager),
      config_(config),
      theme_(resolveTheme(config.theme)),
      scales_({}, config.width - config.padding.left - config.padding.right,
              config.height - config.padding.top - config.padding.bottom, 0.0, 100.0),
      panes_(makeMainPane(scales_)),
      timeAxis_(scales_.timeScale(), AxisPosition::Bottom, AxisOptions{}, config.tzOffsetMs),
      controller_(store_, panes_, scales_),
      renderer_(compositor, panes_, scales_, timeAxis_, config.width, config.height,
                config.padding),
      zoom_(scales_),
      alive_(std::make_shared<bool>(true)) {
  zoom_.setConfig(config_.zoom);
  panes_.applyTheme(theme_);
  timeAxis_.setStyle(axisStyleFromTheme(theme_));
  attachStudies(config_.studies);

  controller_.setOnRender([this]() { renderer_.render(); });

  std::weak_ptr<bool> weak = alive_;
  data_.onRealtimeUpdate([this, weak](const OhlcCandle& candle) {
    if (weak.expired()) return;
    controller_.handleRealtimeUpdate(candle);
  });
}

Chart::~Chart() { destroy(); }

void Chart::attachStudies(const std::vector<StudySpec>& specs) {
  std::vector<std::pair<std::string, std::vector<const StudySpec*>>> groups;
  for (const auto& spec : specs) {
    if (spec.pane == "main") {
      addOverlayStudy(makeStudy(spec));
      continue;
    }
    auto it = std::find_if(groups.begin(), groups.end(),
                           [&](const std::pair<std::string, std::vector<const StudySpec*>>& g) {
                             return g.first == spec.pane;
                           });
    if (it == groups.end()) {
      groups.push_back({spec.pane, {&spec}});
    } else {
      it->second.push_back(&spec);
    }
  }

  for (const auto& g : groups) {
    std::vector<std::unique_ptr<Study>> others;
    for (std::size_t i = 1; i < g.second.size(); ++i) others.push_back(makeStudy(*g.second[i]));
    createSubPane(g.first, makeStudy(*g.second.front()), g.second.front()->heightPercent,
                  std::move(others));
  }
}

void Chart::initialize() {
  std::weak_ptr<bool> weak = alive_;
  data_.loadHistorical([this, weak](const HistoricalBatch& batch) {
    if (weak.expired()) return;
    if (!batch.ok) {
      std::fprintf(stderr, "[Chart] initial load failed: %s\n", batch.error.c_str());
      return;
    }
    hasMoreHistorical_ = batch.hasMore;
    controller_.loadInitialData(batch.candles);

    const std::size_t total = store_.size();
    if (total == 0) return;
    const std::size_t want = static_cast<std::size_t>(config_.visibleCandles);
    const double start = total > want ? static_cast<double>(total - want) : 0.0;
    scales_.updateTimeScale(start, static_cast<double>(total - 1));
    controller_.recalculatePriceScalesFromVisibleCandles();
  });
}

void Chart::addOverlayStudy(std::unique_ptr<Study> study) {
  if (!study) throw std::invalid_argument("Chart: overlay study is null");
  study->applyTheme(theme_);
  if (!store_.empty()) study->resetCandles(store_.getAll());
  panes_.mainPane().addOverlayStudy(std::move(study));
  controller_.requestRender();
}

SubPane& Chart::createSubPane(const std::string& id, std::unique_ptr<Study> primaryStudy,
                              double heightPercent,
                              std::vector<std::unique_ptr<Study>> otherStudies) {
  SubPane& pane = panes_.addSubPane(std::make_unique<SubPane>(
      id, std::move(primaryStudy), heightPercent, std::move(otherStudies)));
  try {
    renderer_.recalculateLayout();
  } catch (const std::invalid_argument&) {
    panes_.removeSubPane(id);
    throw;
  }

  pane.applyTheme(theme_);
  if (!store_.empty()) {
    pane.resetCandles(store_.getAll());
    pane.updateScales(true, true);
  }
  controller_.requestRender();
  return pane;
}

bool Chart::removeSubPane(const std::string& id) {
  if (!panes_.removeSubPane(id)) return false;
  renderer_.recalculateLayout();
  controller_.requestRender();
  return true;
}

void Chart::updateTheme(const Theme& theme) {
  theme_ = theme;
  panes_.applyTheme(theme_);
  timeAxis_.setStyle(axisStyleFromTheme(theme_));
  panes_.updateScales(true, true);
  controller_.requestRender();
}

void Chart::resize(double width, double height) {
  config_.width = width;
  config_.height = height;
  renderer_.setSize(width, height);
  controller_.recalculatePriceScalesFromVisibleCandles();
}

void Chart::updatePadding(const Padding& padding) {
  config_.padding = padding;
  renderer_.setPadding(padding);
  controller_.recalculatePriceScalesFromVisibleCandles();
}

void Chart::recalcAndRender() { controller_.recalculatePriceScalesFromVisibleCandles(); }

void Chart::zoomIn() {
  zoom_.zoomIn();
  recalcAndRender();
}

void Chart::zoomIn(double factor) {
  zoom_.zoomIn(factor);
  recalcAndRender();
}

void Chart::zoomOut() {
  zoom_.zoomOut();
  recalcAndRender();
}

void Chart::zoomOut(double factor) {
  zoom_.zoomOut(factor);
  recalcAndRender();
}

void Chart::pan(double deltaCandles) {
  zoom_.pan(deltaCandles);
  recalcAndRender();
  checkAndLoadMore();
}

void Chart::resetZoom() {
  zoom_.resetZoom();
  recalcAndRender();
}

CandleRange Chart::visibleIndices() const {
  const auto vi = scales_.visibleDomainIndices();
  if (!std::isfinite(vi.startIndex) || !std::isfinite(vi.endIndex)) return {};
  return {static_cast<long>(std::floor(vi.startIndex)),
          static_cast<long>(std::ceil(vi.endIndex))};
}

void Chart::checkAndLoadMore() {
  if (loadingMore_ || !hasMoreHistorical_ || destroyed_) return;
  if (visibleIndices().startIndex < config_.loadMoreThreshold) loadMoreHistorical();
}

void Chart::loadMoreHistorical() {
  if (loadingMore_) return;
  loadingMore_ = true;

  std::weak_ptr<bool> weak = alive_;
  data_.loadHistorical([this, weak](const HistoricalBatch& batch) {
    if (weak.expired()) return;
    loadingMore_ = false;
    if (!batch.ok) {
      std::fprintf(stderr, "[Chart] historical load failed: %s\n", batch.error.c_str());
      return;
    }
    hasMoreHistorical_ = batch.hasMore;
    if (!batch.candles.empty()) controller_.loadMoreHistorical(batch.candles);
  });
}

ChartState Chart::state() const {
  ChartState s;
  const auto vi = scales_.visibleDomainIndices();
  s.view.startIndex = vi.startIndex;
  s.view.endIndex = vi.endIndex;
  s.zoomLevel = zoom_.zoomLevel();
  s.themeName = theme_.name;
  s.symbol = symbol_;
  s.timeframe = timeframe_;
  return s;
}

bool Chart::applyState(const ChartState& state) {
  Theme t;
  if (!state.themeName.empty() && !themeByName(state.themeName, t)) return false;

  symbol_ = state.symbol;
  timeframe_ = state.timeframe;
  if (!state.themeName.empty()) updateTheme(t);

  if (!store_.empty() && std::isfinite(state.view.startIndex) &&
      std::isfinite(state.view.endIndex) && state.view.endIndex > state.view.startIndex) {
    scales_.updateTimeScale(state.view.startIndex, state.view.endIndex);
  }
  recalcAndRender();
  return true;
}

void Chart::setMetadata(const std::string& symbol, const std::string& timeframe) {
  symbol_ = symbol;
  timeframe_ = timeframe;
}

Stats Chart::stats() const {
  Stats s = renderer_.stats();
  s.renderRequests = controller_.renderBatcher().requestCount();
  return s;
}

void Chart::destroy() {
  if (destroyed_) return;
  destroyed_ = true;
  alive_.reset();
  controller_.destroy();
}

} // namespace oc
