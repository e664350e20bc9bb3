// C5.2 - Chart: initialize, load-more on pan, realtime follow, sub-panes,
// state snapshot, destroy

#include "oc/chart/Chart.hpp"
#include "oc/data/DataManager.hpp"
#include "oc/render/CommandCompositor.hpp"
#include "oc/study/RsiStudy.hpp"
#include "oc/study/SmaStudy.hpp"
#include "oc/study/VolumeStudy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%.6f vs %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static constexpr std::int64_t kNewest = 1700000000000;
static constexpr std::int64_t kMinute = 60000;

// Serves `total` candles newest-first in batches. Callbacks run immediately
// unless `deferred` is set, in which case deliver() runs the last one.
class ScriptedDataManager : public oc::DataManager {
public:
  ScriptedDataManager(int total, int batch) : total_(total), batch_(batch) {}

  void loadHistorical(HistoricalCallback done) override {
    calls++;
    if (deferred) {
      pending_ = std::move(done);
      return;
    }
    done(nextBatch());
  }

  void onRealtimeUpdate(RealtimeCallback cb) override { realtime_ = std::move(cb); }

  void deliver() {
    HistoricalCallback cb = std::move(pending_);
    pending_ = nullptr;
    if (cb) cb(nextBatch());
  }

  void push(const oc::OhlcCandle& c) {
    if (realtime_) realtime_(c);
  }

  static oc::OhlcCandle candleAt(std::int64_t back) {
    oc::OhlcCandle c;
    c.timestamp = kNewest - back * kMinute;
    c.open = 100.0 + static_cast<double>(back % 10);
    c.close = c.open + 0.5;
    c.high = c.close + 1.0;
    c.low = c.open - 1.0;
    c.volume = 1000.0 + static_cast<double>(back);
    return c;
  }

  int calls = 0;
  bool deferred = false;
  bool failNext = false;

private:
  oc::HistoricalBatch nextBatch() {
    oc::HistoricalBatch b;
    if (failNext) {
      failNext = false;
      b.ok = false;
      b.error = "scripted failure";
      return b;
    }
    int count = std::min(batch_, total_ - served_);
    for (int i = count - 1; i >= 0; i--) b.candles.push_back(candleAt(served_ + i));
    served_ += count;
    b.hasMore = served_ < total_;
    return b;
  }

  int total_;
  int batch_;
  int served_ = 0;
  HistoricalCallback pending_;
  RealtimeCallback realtime_;
};

int main() {
  // ---- Test 1: initialize shows the newest 120 candles ----
  {
    ScriptedDataManager dm(400, 150);
    oc::CommandCompositor comp;
    oc::Chart chart(dm, comp);
    chart.initialize();

    requireTrue(chart.store().size() == 150, "first batch loaded");
    requireTrue(chart.hasMoreHistorical(), "more available");
    requireTrue(chart.visibleIndices().startIndex == 30, "start = n - 120");
    requireTrue(chart.visibleIndices().endIndex == 149, "end = n - 1");
    requireTrue(chart.boxWidth() > 0.0, "box width");

    requireTrue(chart.renderBatcher().flush(), "render pending");
    requireTrue(comp.frameNumber() == 1, "one frame drawn");
    requireTrue(chart.stats().frameCount == 1, "stats frame");
    requireTrue(chart.stats().renderRequests >= 1, "requests counted");
    std::printf("  Test 1 (initialize): PASS\n");
  }

  // ---- Test 2: Panning near the oldest candle loads more ----
  {
    ScriptedDataManager dm(400, 150);
    oc::CommandCompositor comp;
    oc::Chart chart(dm, comp);
    chart.initialize();

    chart.pan(-5);
    requireTrue(dm.calls == 1, "start 25 is above the threshold");

    chart.pan(-15);
    requireTrue(dm.calls == 2, "start 10 triggers a load");
    requireTrue(chart.store().size() == 300, "batch prepended");
    requireTrue(chart.visibleIndices().startIndex == 160, "window shifted by 150");
    requireTrue(chart.visibleIndices().endIndex == 279, "range preserved");

    chart.pan(-150);
    requireTrue(chart.store().size() == 400, "last batch");
    requireTrue(!chart.hasMoreHistorical(), "history exhausted");

    chart.pan(-500);
    requireTrue(chart.visibleIndices().startIndex == 0, "clamped at oldest");
    requireTrue(dm.calls == 3, "no load once exhausted");
    std::printf("  Test 2 (load more): PASS\n");
  }

  // ---- Test 3: One load in flight at a time ----
  {
    ScriptedDataManager dm(400, 150);
    oc::CommandCompositor comp;
    oc::Chart chart(dm, comp);
    chart.initialize();

    dm.deferred = true;
    chart.pan(-20);
    requireTrue(chart.isLoadingMore(), "loading");
    chart.pan(-5);
    chart.pan(1);
    requireTrue(dm.calls == 2, "guard blocks concurrent loads");

    dm.deliver();
    requireTrue(!chart.isLoadingMore(), "load finished");
    requireTrue(chart.store().size() == 300, "late batch applied");
    std::printf("  Test 3 (loading guard): PASS\n");
  }

  // ---- Test 4: Failed load is logged and ignored ----
  {
    ScriptedDataManager dm(400, 150);
    oc::CommandCompositor comp;
    oc::Chart chart(dm, comp);
    chart.initialize();

    dm.failNext = true;
    chart.pan(-20);
    requireTrue(chart.store().size() == 150, "store unchanged");
    requireTrue(!chart.isLoadingMore(), "guard released");
    requireTrue(chart.hasMoreHistorical(), "still more to fetch");

    chart.pan(-1);
    requireTrue(chart.store().size() == 300, "retry succeeds");
    std::printf("  Test 4 (failed load): PASS\n");
  }

  // ---- Test 5: Realtime candles follow the right edge ----
  {
    ScriptedDataManager dm(400, 150);
    oc::CommandCompositor comp;
    oc::Chart chart(dm, comp);
    chart.initialize();

    dm.push(ScriptedDataManager::candleAt(-1));
    requireTrue(chart.store().size() == 151, "appended");
    requireTrue(chart.visibleIndices().startIndex == 31, "followed start");
    requireTrue(chart.visibleIndices().endIndex == 150, "followed end");

    oc::OhlcCandle tick = ScriptedDataManager::candleAt(-1);
    tick.close += 2.0;
    dm.push(tick);
    requireTrue(chart.store().size() == 151, "same candle updated");
    requireClose(chart.store().last().close, tick.close, 1e-9, "tick applied");
    std::printf("  Test 5 (realtime): PASS\n");
  }

  // ---- Test 6: Zoom passthroughs ----
  {
    ScriptedDataManager dm(400, 150);
    oc::CommandCompositor comp;
    oc::Chart chart(dm, comp);
    chart.initialize();

    chart.zoomIn(2.0);
    requireTrue(chart.visibleIndices().startIndex == 89, "floor of 89.5");
    requireTrue(chart.visibleIndices().endIndex == 149, "right edge kept");
    requireTrue(chart.canZoomIn() && chart.canZoomOut(), "room both ways");
    requireTrue(chart.canPanLeft() && !chart.canPanRight(), "at right edge");

    chart.resetZoom();
    requireTrue(chart.visibleIndices().startIndex == 0, "reset start");
    requireClose(chart.zoomLevel(), 149.0 / 150.0 * 100.0, 1e-9, "zoom level");
    std::printf("  Test 6 (zoom): PASS\n");
  }

  // ---- Test 7: Studies and sub-panes ----
  {
    ScriptedDataManager dm(400, 150);
    oc::CommandCompositor comp;
    oc::Chart chart(dm, comp);
    chart.initialize();

    auto sma = std::make_unique<oc::SmaStudy>(10);
    oc::SmaStudy* smaPtr = sma.get();
    chart.addOverlayStudy(std::move(sma));
    requireTrue(smaPtr->computedData().size() == 141, "late overlay computed at once");

    oc::SubPane& vol = chart.createSubPane("volume", std::make_unique<oc::VolumeStudy>(), 0.5);
    requireTrue(vol.bounds().height > 0.0, "laid out");

    bool threw = false;
    try {
      chart.createSubPane("rsi", std::make_unique<oc::RsiStudy>(), 0.6);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "overfull layout rejected");
    requireTrue(chart.paneManager().subPanes().size() == 1, "rejected pane removed");

    threw = false;
    try {
      chart.createSubPane("sma", std::make_unique<oc::SmaStudy>(5), 0.2);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "primary without y scale rejected");

    requireTrue(chart.removeSubPane("volume"), "removed");
    requireTrue(chart.paneManager().subPanes().empty(), "no sub-panes");
    std::printf("  Test 7 (studies + sub-panes): PASS\n");
  }

  // ---- Test 8: Config builds studies; theme and state ----
  {
    ScriptedDataManager dm(400, 150);
    oc::CommandCompositor comp;
    oc::ChartConfig cfg;
    cfg.visibleCandles = 50;
    oc::StudySpec sma;
    sma.type = "sma";
    sma.period = 5;
    cfg.studies.push_back(sma);
    oc::StudySpec vol;
    vol.type = "volume";
    vol.pane = "volume";
    cfg.studies.push_back(vol);

    oc::Chart chart(dm, comp, cfg);
    chart.initialize();
    requireTrue(chart.mainPane().overlayCount() == 1, "overlay from config");
    requireTrue(chart.paneManager().findSubPane("volume") != nullptr, "sub-pane from config");
    requireTrue(chart.visibleIndices().startIndex == 100, "visible candle count from config");

    chart.setMetadata("SIM", "1m");
    oc::ChartState s = chart.state();
    requireTrue(s.themeName == "dark", "default theme");
    requireClose(s.view.startIndex, 100.0, 1e-9, "state view");
    requireTrue(s.symbol == "SIM", "metadata");

    s.themeName = "light";
    s.view.startIndex = 10.0;
    s.view.endIndex = 40.0;
    requireTrue(chart.applyState(s), "state applied");
    requireTrue(chart.theme().name == "light", "theme switched");
    requireTrue(chart.visibleIndices().startIndex == 10, "view restored");

    s.themeName = "neon";
    requireTrue(!chart.applyState(s), "unknown theme rejected");
    requireTrue(chart.theme().name == "light", "theme unchanged");

    oc::ChartConfig bad;
    bad.theme = "neon";
    bool threw = false;
    try {
      oc::Chart c(dm, comp, bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "unknown config theme rejected");
    std::printf("  Test 8 (config + state): PASS\n");
  }

  // ---- Test 9: destroy stops rendering and data handling ----
  {
    ScriptedDataManager dm(400, 150);
    oc::CommandCompositor comp;
    oc::Chart chart(dm, comp);
    chart.initialize();
    chart.renderBatcher().flush();

    chart.destroy();
    dm.push(ScriptedDataManager::candleAt(-1));
    requireTrue(chart.store().size() == 150, "realtime ignored");
    chart.zoomIn();
    requireTrue(!chart.renderBatcher().flush(), "no renders after destroy");
    requireTrue(comp.frameNumber() == 1, "frame count frozen");
    std::printf("  Test 9 (destroy): PASS\n");
  }

  std::printf("C5.2 chart: ALL PASS\n");
  return 0;
}
