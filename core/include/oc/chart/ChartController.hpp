#pragma once
#include "oc/data/RenderBatcher.hpp"
#include "oc/data/TimeSeriesStore.hpp"

#include <vector>

namespace oc {

class CommonScaleManager;
class PaneManager;

// Reacts to store changes and decides how much work each one needs: which
// study lifecycle call to broadcast, whether the visible window moves, and
// whether the price scale is recomputed. Every path ends in one coalesced
// render request.
class ChartController {
public:
  ChartController(TimeSeriesStore& store, PaneManager& panes, CommonScaleManager& scales);
  ~ChartController();

  ChartController(const ChartController&) = delete;
  ChartController& operator=(const ChartController&) = delete;

  void setOnRender(RenderBatcher::Task callback) { batcher_.setOnRender(std::move(callback)); }
  RenderBatcher& renderBatcher() { return batcher_; }
  const RenderBatcher& renderBatcher() const { return batcher_; }

  void loadInitialData(const std::vector<OhlcCandle>& candles);
  void handleRealtimeUpdate(const OhlcCandle& candle);
  void loadMoreHistorical(const std::vector<OhlcCandle>& candles);

  // Fit the shared price scale to the visible candles' low/high plus 2%
  // padding, invalidate every study cache and request a render.
  void recalculatePriceScalesFromVisibleCandles();

  void requestRender() { batcher_.requestRender(); }

  // Detaches from the store and stops rendering.
  void destroy();

private:
  void handleDataChange(const StoreChange& change);
  void onAppend(std::size_t count);
  void onPrepend(std::size_t count);
  void onUpdate();
  void onReset();
  void syncTimeDomain();

  TimeSeriesStore& store_;
  PaneManager& panes_;
  CommonScaleManager& scales_;
  RenderBatcher batcher_;
  bool destroyed_{false};
};

} // namespace oc
