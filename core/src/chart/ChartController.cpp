#include "oc/chart/ChartController.hpp"
#include "oc/layout/PaneManager.hpp"
#include "oc/scale/CommonScaleManager.hpp"

#include <algorithm>
#include <cmath>

namespace oc {

static constexpr double kPricePadding = 0.02;

ChartController::ChartController(TimeSeriesStore& store, PaneManager& panes,
                                 CommonScaleManager& scales)
    : store_(store), panes_(panes), scales_(scales) {
  store_.setOnChange([this](const StoreChange& change) { handleDataChange(change); });
}

ChartController::~ChartController() { destroy(); }

void ChartController::destroy() {
  if (destroyed_) return;
  destroyed_ = true;
  store_.setOnChange(nullptr);
  batcher_.destroy();
}

void ChartController::loadInitialData(const std::vector<OhlcCandle>& candles) {
  store_.reset(candles);
}

void ChartController::handleRealtimeUpdate(const OhlcCandle& candle) {
  store_.add(candle);
}

void ChartController::loadMoreHistorical(const std::vector<OhlcCandle>& candles) {
  store_.prepend(candles);
}

void ChartController::handleDataChange(const StoreChange& change) {
  switch (change.kind) {
    case ChangeKind::Append:  onAppend(change.count); break;
    case ChangeKind::Prepend: onPrepend(change.count); break;
    case ChangeKind::Update:  onUpdate(); break;
    case ChangeKind::Reset:   onReset(); break;
  }
}

void ChartController::syncTimeDomain() {
  const auto& candles = store_.getAll();
  std::vector<std::int64_t> ts;
  ts.reserve(candles.size());
  for (const auto& c : candles) ts.push_back(c.timestamp);
  scales_.updateTimeScaleDomain(std::move(ts));
}

void ChartController::onAppend(std::size_t count) {
  const auto& candles = store_.getAll();
  const std::size_t oldSize = scales_.timeScale().size();
  // Decided against the old domain, before it grows.
  const bool follow = scales_.isRightEdgeVisible();

  if (count == 1 && oldSize + 1 == candles.size()) {
    scales_.appendTimeScaleDomain(candles.back().timestamp);
  } else {
    syncTimeDomain();
  }

  panes_.appendNewCandle(candles);

  if (!follow) {
    batcher_.requestRender();
    return;
  }

  if (oldSize == 0) {
    scales_.updateTimeScale(0.0, static_cast<double>(candles.size()) - 1.0);
  } else {
    const auto vi = scales_.visibleDomainIndices();
    const double shift = static_cast<double>(count);
    scales_.updateTimeScale(vi.startIndex + shift, vi.endIndex + shift);
  }
  recalculatePriceScalesFromVisibleCandles();
}

void ChartController::onPrepend(std::size_t count) {
  const auto vi = scales_.visibleDomainIndices();
  const bool hadData = scales_.timeScale().size() > 0;
  syncTimeDomain();

  const double shift = static_cast<double>(count);
  if (hadData) {
    scales_.updateTimeScale(vi.startIndex + shift, vi.endIndex + shift);
  } else {
    scales_.updateTimeScale(0.0, static_cast<double>(store_.size()) - 1.0);
  }

  panes_.prependHistoricalCandles(store_.getAll());
  recalculatePriceScalesFromVisibleCandles();
}

void ChartController::onUpdate() {
  const auto& candles = store_.getAll();
  if (candles.empty()) return;

  // Studies always see the tick; the last-price line tracks it off-screen too.
  panes_.updateLastCandle(candles);

  const auto vi = scales_.visibleDomainIndices();
  const double last = static_cast<double>(candles.size() - 1);
  const bool visible = last >= std::floor(vi.startIndex) && last <= std::ceil(vi.endIndex);
  if (visible) {
    recalculatePriceScalesFromVisibleCandles();
  } else {
    batcher_.requestRender();
  }
}

void ChartController::onReset() {
  syncTimeDomain();

  const double n = static_cast<double>(store_.size());
  const auto vi = scales_.visibleDomainIndices();
  if (n > 0.0 && !(vi.endIndex >= vi.startIndex && vi.startIndex <= n - 1.0)) {
    scales_.updateTimeScale(0.0, n - 1.0);
  }

  panes_.resetCandles(store_.getAll());
  recalculatePriceScalesFromVisibleCandles();
}

void ChartController::recalculatePriceScalesFromVisibleCandles() {
  const auto& candles = store_.getAll();
  if (candles.empty()) {
    panes_.updateScales(true, true);
    batcher_.requestRender();
    return;
  }

  const auto vi = scales_.visibleDomainIndices();
  if (!std::isfinite(vi.startIndex) || !std::isfinite(vi.endIndex)) return;

  const double lastIndex = static_cast<double>(candles.size() - 1);
  const double start = std::min(std::max(std::floor(vi.startIndex), 0.0), lastIndex);
  const double end = std::min(std::max(std::ceil(vi.endIndex), start), lastIndex);

  double lo = candles[static_cast<std::size_t>(start)].low;
  double hi = candles[static_cast<std::size_t>(start)].high;
  for (auto i = static_cast<std::size_t>(start) + 1; i <= static_cast<std::size_t>(end); ++i) {
    lo = std::min(lo, candles[i].low);
    hi = std::max(hi, candles[i].high);
  }

  const double pad = (hi - lo) * kPricePadding;
  scales_.updatePriceScale(lo - pad, hi + pad);
  panes_.updateScales(true, true);
  batcher_.requestRender();
}

} // namespace oc
