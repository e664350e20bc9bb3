// C5.1 - ChartController: auto-follow, scrolled-back append, prepend shift,
// off-screen updates, price-scale fit

#include "oc/chart/ChartController.hpp"
#include "oc/layout/PaneManager.hpp"
#include "oc/scale/CommonScaleManager.hpp"
#include "oc/study/CandleStudy.hpp"
#include "oc/study/LastPriceLineStudy.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
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

static constexpr std::int64_t kBase = 1700000000000;
static constexpr std::int64_t kMinute = 60000;

static oc::OhlcCandle candleAt(long i, double low = 95.0, double high = 105.0) {
  oc::OhlcCandle c;
  c.timestamp = kBase + i * kMinute;
  c.open = (low + high) / 2.0;
  c.close = c.open + 0.5;
  c.high = high;
  c.low = low;
  c.volume = 100.0;
  return c;
}

static std::vector<oc::OhlcCandle> range(long from, long to) {
  std::vector<oc::OhlcCandle> out;
  for (long i = from; i < to; i++) out.push_back(candleAt(i));
  return out;
}

struct Fixture {
  Fixture()
      : scales({}, 800.0, 500.0, 0.0, 100.0),
        panes(std::make_unique<oc::MainPane>(std::make_unique<oc::CandleStudy>(),
                                             scales.priceScale())),
        controller(store, panes, scales) {
    auto line = std::make_unique<oc::LastPriceLineStudy>();
    lastPrice = line.get();
    panes.mainPane().addOverlayStudy(std::move(line));
    controller.setOnRender([this]() { renders++; });
  }

  double start() const { return scales.visibleDomainIndices().startIndex; }
  double end() const { return scales.visibleDomainIndices().endIndex; }
  bool flush() { return controller.renderBatcher().flush(); }

  oc::TimeSeriesStore store;
  oc::CommonScaleManager scales;
  oc::PaneManager panes;
  oc::ChartController controller;
  oc::LastPriceLineStudy* lastPrice = nullptr;
  int renders = 0;
};

int main() {
  // ---- Test 1: Initial load shows everything and fits prices ----
  {
    Fixture f;
    f.controller.loadInitialData(range(0, 100));
    requireTrue(f.scales.timeScale().size() == 100, "time domain synced");
    requireClose(f.start(), 0.0, 1e-9, "start 0");
    requireClose(f.end(), 99.0, 1e-9, "end n-1");
    requireTrue(f.flush() && f.renders == 1, "one coalesced render");
    requireTrue(f.scales.priceScale().domain().min <= 95.0 - 0.2, "padded min");
    requireTrue(f.scales.priceScale().domain().max >= 105.0 + 0.2, "padded max");
    requireTrue(f.lastPrice->hasPrice(), "studies saw the reset");
    std::printf("  Test 1 (initial load): PASS\n");
  }

  // ---- Test 2: Append while at the right edge follows ----
  {
    Fixture f;
    f.controller.loadInitialData(range(0, 100));
    f.scales.updateTimeScale(80.0, 99.0);

    f.controller.handleRealtimeUpdate(candleAt(100));
    requireTrue(f.store.size() == 101, "appended");
    requireTrue(f.scales.timeScale().size() == 101, "domain grew");
    requireClose(f.start(), 81.0, 1e-9, "window shifted start");
    requireClose(f.end(), 100.0, 1e-9, "window shifted end");
    std::printf("  Test 2 (auto-follow): PASS\n");
  }

  // ---- Test 3: Append while scrolled back leaves the window alone ----
  {
    Fixture f;
    f.controller.loadInitialData(range(0, 100));
    f.scales.updateTimeScale(40.0, 60.0);
    f.controller.recalculatePriceScalesFromVisibleCandles();
    f.flush();
    const std::uint64_t priceVersion = f.scales.priceScale().version();

    f.controller.handleRealtimeUpdate(candleAt(100, 10.0, 500.0));
    requireClose(f.start(), 40.0, 1e-9, "start kept");
    requireClose(f.end(), 60.0, 1e-9, "end kept");
    requireTrue(f.scales.priceScale().version() == priceVersion, "price scale untouched");
    requireTrue(f.controller.renderBatcher().isPending(), "render still requested");
    std::printf("  Test 3 (scrolled-back append): PASS\n");
  }

  // ---- Test 4: Live update of an off-screen candle ----
  {
    Fixture f;
    f.controller.loadInitialData(range(0, 100));
    f.scales.updateTimeScale(10.0, 30.0);
    f.controller.recalculatePriceScalesFromVisibleCandles();
    f.flush();
    const std::uint64_t priceVersion = f.scales.priceScale().version();

    oc::OhlcCandle tick = candleAt(99);
    tick.close = 103.25;
    f.controller.handleRealtimeUpdate(tick);
    requireTrue(f.store.size() == 100, "update, not append");
    requireTrue(f.scales.priceScale().version() == priceVersion, "no refit off-screen");
    requireClose(f.lastPrice->lastPrice(), 103.25, 1e-9, "last price still tracked");
    requireTrue(f.flush(), "render requested");

    f.scales.updateTimeScale(80.0, 99.0);
    tick.close = 104.0;
    f.controller.handleRealtimeUpdate(tick);
    requireTrue(f.scales.priceScale().version() != priceVersion, "visible update refits");
    std::printf("  Test 4 (update visibility): PASS\n");
  }

  // ---- Test 5: Prepend shifts the window by the number of new candles ----
  {
    Fixture f;
    f.controller.loadInitialData(range(100, 200));
    f.scales.updateTimeScale(40.0, 60.0);

    std::vector<oc::OhlcCandle> older = range(50, 100);
    older.push_back(candleAt(100));  // duplicate of the current oldest
    f.controller.loadMoreHistorical(older);
    requireTrue(f.store.size() == 150, "50 new candles");
    requireClose(f.start(), 90.0, 1e-9, "start shifted by 50");
    requireClose(f.end(), 110.0, 1e-9, "end shifted by 50");
    requireTrue(f.scales.timeScale().fullDomain().front() == kBase + 50 * kMinute,
                "domain starts at the oldest");
    std::printf("  Test 5 (prepend shift): PASS\n");
  }

  // ---- Test 6: Price fit uses only the visible candles ----
  {
    Fixture f;
    std::vector<oc::OhlcCandle> data = range(0, 50);
    data[5] = candleAt(5, 1.0, 1000.0);  // far outside the window
    for (long i = 30; i < 50; i++) data[static_cast<std::size_t>(i)] = candleAt(i, 90.0, 110.0);
    f.controller.loadInitialData(data);
    f.scales.updateTimeScale(30.0, 49.0);
    f.controller.recalculatePriceScalesFromVisibleCandles();

    const auto& d = f.scales.priceScale().domain();
    requireTrue(d.min <= 89.6 && d.max >= 110.4, "covers padded visible range");
    requireTrue(d.min > 1.0 && d.max < 1000.0, "ignores off-screen extremes");
    std::printf("  Test 6 (visible price fit): PASS\n");
  }

  // ---- Test 7: Empty store and destroy ----
  {
    Fixture f;
    f.controller.recalculatePriceScalesFromVisibleCandles();
    requireTrue(f.flush(), "empty chart still renders");

    f.controller.loadInitialData(range(0, 10));
    f.flush();
    const int before = f.renders;
    f.controller.destroy();
    f.store.add(candleAt(10));
    requireTrue(!f.flush(), "nothing pending after destroy");
    requireTrue(f.renders == before, "no renders after destroy");
    requireTrue(f.scales.timeScale().size() == 10, "store changes no longer observed");
    std::printf("  Test 7 (empty + destroy): PASS\n");
  }

  std::printf("C5.1 chart_controller: ALL PASS\n");
  return 0;
}
