// C2.1 - Studies: SMA / EMA / RSI / Bollinger values, volume scale, candle geometry

#include "oc/scale/CommonScaleManager.hpp"
#include "oc/study/BollingerStudy.hpp"
#include "oc/study/CandleStudy.hpp"
#include "oc/study/EmaStudy.hpp"
#include "oc/study/RsiStudy.hpp"
#include "oc/study/SmaStudy.hpp"
#include "oc/study/VolumeStudy.hpp"
#include "oc/style/Theme.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
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

static std::vector<oc::OhlcCandle> fromCloses(const std::vector<double>& closes) {
  std::vector<oc::OhlcCandle> out;
  for (std::size_t i = 0; i < closes.size(); i++) {
    oc::OhlcCandle c;
    c.timestamp = static_cast<std::int64_t>(i + 1) * 60000;
    c.open = closes[i];
    c.high = closes[i] + 1.0;
    c.low = closes[i] - 1.0;
    c.close = closes[i];
    c.volume = 100.0;
    out.push_back(c);
  }
  return out;
}

int main() {
  // ---- Test 1: SMA(3) values and indices ----
  {
    oc::SmaStudy sma(3);
    auto candles = fromCloses({10, 12, 11, 13, 15});
    auto u = sma.resetCandles(candles);

    const auto& data = sma.computedData();
    requireTrue(data.size() == 3, "N-P+1 points");
    requireTrue(data[0].index == 2 && data[2].index == 4, "first point at P-1");
    requireClose(data[0].value, 11.0, 1e-9, "sma[2]");
    requireClose(data[1].value, 12.0, 1e-9, "sma[3]");
    requireClose(data[2].value, 13.0, 1e-9, "sma[4]");
    requireTrue(u.hasY, "reset reports bounds");
    requireClose(u.yDomain.min, 11.0, 1e-9, "bounds min");
    requireClose(u.yDomain.max, 13.0, 1e-9, "bounds max");
    requireTrue(sma.name() == "SMA(3)", "name carries period");
    std::printf("  Test 1 (sma values): PASS\n");
  }

  // ---- Test 2: Insufficient data yields nothing ----
  {
    oc::SmaStudy sma(5);
    auto candles = fromCloses({1, 2, 3});
    requireTrue(sma.resetCandles(candles).empty(), "reset below window is empty");
    requireTrue(sma.appendNewCandle(candles).empty(), "append below window is empty");
    requireTrue(sma.computedData().empty(), "no points");

    bool threw = false;
    try {
      oc::SmaStudy bad(0);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "period 0 rejected");
    std::printf("  Test 2 (insufficient data): PASS\n");
  }

  // ---- Test 3: Append then live update of the same candle ----
  {
    oc::SmaStudy sma(2);
    auto candles = fromCloses({10, 20});
    sma.resetCandles(candles);
    requireTrue(sma.computedData().size() == 1, "one point");

    candles.push_back(fromCloses({10, 20, 40})[2]);
    auto u = sma.appendNewCandle(candles);
    requireTrue(sma.computedData().size() == 2, "append adds point");
    requireTrue(u.hasY && u.yDomain.max == 30.0, "append extends max");

    candles.back().close = 24.0;
    u = sma.updateLastCandle(candles);
    requireTrue(sma.computedData().size() == 2, "update replaces point");
    requireClose(sma.computedData().back().value, 22.0, 1e-9, "updated value");
    requireTrue(u.hasY && u.yDomain.max == 22.0, "shrunk extreme reported");
    std::printf("  Test 3 (append/update): PASS\n");
  }

  // ---- Test 4: EMA seeds with SMA and updates without compounding ----
  {
    oc::EmaStudy ema(3);
    auto candles = fromCloses({1, 2, 3, 4});
    ema.resetCandles(candles);
    const auto& data = ema.computedData();
    requireTrue(data.size() == 2, "two points");
    requireClose(data[0].value, 2.0, 1e-9, "seed is sma");
    requireClose(data[1].value, 3.0, 1e-9, "ema step k=0.5");

    candles.back().close = 6.0;
    ema.updateLastCandle(candles);
    requireClose(ema.computedData().back().value, 4.0, 1e-9, "first tick");
    ema.updateLastCandle(candles);
    ema.updateLastCandle(candles);
    requireClose(ema.computedData().back().value, 4.0, 1e-9, "repeated ticks do not compound");
    std::printf("  Test 4 (ema): PASS\n");
  }

  // ---- Test 5: RSI ----
  {
    std::vector<double> rising;
    for (int i = 1; i <= 20; i++) rising.push_back(static_cast<double>(i));
    oc::RsiStudy rsi(14);
    auto u = rsi.resetCandles(fromCloses(rising));
    requireTrue(rsi.computedData().size() == 7, "window of period candles");
    requireTrue(rsi.computedData().front().index == 13, "first at index period-1");
    requireClose(rsi.computedData().front().value, 100.0, 1e-9, "all gains -> 100");
    requireTrue(u.empty(), "rsi never touches price bounds");
    requireTrue(rsi.yScale() != nullptr, "rsi owns a y scale");

    oc::RsiStudy mixed(3);
    mixed.resetCandles(fromCloses({10, 12, 11}));
    requireTrue(mixed.computedData().size() == 1, "three candles, one value");
    requireClose(mixed.computedData().front().value, 100.0 - 100.0 / 3.0, 1e-9, "rs = 2");

    oc::RsiStudy single(1);
    single.resetCandles(fromCloses({10, 12, 11}));
    requireTrue(single.computedData().empty(), "no changes, no values");

    oc::Bounds b{0, 300, 800, 100};
    rsi.updateScaleBounds(b);
    requireClose(rsi.yScale()->scaledValue(100.0), 300.0, 1e-9, "100 at pane top");
    requireClose(rsi.yScale()->scaledValue(0.0), 400.0, 1e-9, "0 at pane bottom");
    std::printf("  Test 5 (rsi): PASS\n");
  }

  // ---- Test 6: Bollinger bands ----
  {
    oc::BollingerStudy bb(8, 2.0);
    auto u = bb.resetCandles(fromCloses({2, 4, 4, 4, 5, 5, 7, 9}));
    requireTrue(bb.computedData().size() == 1, "one band");
    const auto& v = bb.computedData().front().value;
    requireClose(v.middle, 5.0, 1e-9, "middle is mean");
    requireClose(v.upper, 9.0, 1e-9, "upper = mean + 2sd");
    requireClose(v.lower, 1.0, 1e-9, "lower = mean - 2sd");
    requireTrue(u.hasY && u.yDomain.min == 1.0 && u.yDomain.max == 9.0, "bounds are the bands");
    requireTrue(bb.name() == "BB(8,2)", "name");

    bool threw = false;
    try {
      oc::BollingerStudy bad(20, 0.0);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "non-positive multiplier rejected");
    std::printf("  Test 6 (bollinger): PASS\n");
  }

  // ---- Test 7: Volume keeps its own scale ----
  {
    oc::VolumeStudy vol;
    auto candles = fromCloses({10, 11, 12});
    candles[0].volume = 100.0;
    candles[1].volume = 300.0;
    candles[2].volume = 200.0;

    requireTrue(vol.resetCandles(candles).empty(), "volume reports no price bounds");
    requireClose(vol.maxVolume(), 300.0, 1e-9, "max volume");
    requireClose(vol.yScale()->domain().max, 300.0, 1e-9, "scale domain follows max");

    candles[2].volume = 450.0;
    vol.updateLastCandle(candles);
    requireClose(vol.maxVolume(), 450.0, 1e-9, "live volume grows max");
    requireClose(vol.yScale()->domain().max, 450.0, 1e-9, "scale grows");
    const std::uint64_t rescans = vol.maxVolumeRescans();

    candles[2].volume = 500.0;
    vol.updateLastCandle(candles);
    candles.push_back(candles[2]);
    candles[3].timestamp += 60000;
    candles[3].volume = 50.0;
    vol.appendNewCandle(candles);
    requireClose(vol.maxVolume(), 500.0, 1e-9, "append below max keeps max");
    requireTrue(vol.maxVolumeRescans() == rescans, "growth and append need no rescan");

    candles[3].volume = 80.0;
    vol.updateLastCandle(candles);
    requireTrue(vol.maxVolumeRescans() == rescans, "non-max tick needs no rescan");

    // Shrink the candle holding the max: the domain falls back to the next one.
    candles.pop_back();
    vol.resetCandles(candles);
    const std::uint64_t afterReset = vol.maxVolumeRescans();
    candles[2].volume = 120.0;
    vol.updateLastCandle(candles);
    requireClose(vol.maxVolume(), 300.0, 1e-9, "max shrinks to next largest");
    requireClose(vol.yScale()->domain().max, 300.0, 1e-9, "scale shrinks");
    requireTrue(vol.maxVolumeRescans() == afterReset + 1, "one rescan on shrink");

    oc::Theme t = oc::darkTheme();
    vol.applyTheme(t);
    requireClose(vol.batch().upColor[3], t.volumeAlpha, 1e-6, "volume alpha");
    std::printf("  Test 7 (volume scale): PASS\n");
  }

  // ---- Test 8: Candle geometry ----
  {
    oc::CommonScaleManager scales({60000, 120000, 180000, 240000, 300000},
                                  500.0, 400.0, 0.0, 100.0, 0.0, 4.0);
    oc::OhlcCandle c;
    c.timestamp = 60000;
    c.open = 40.0;
    c.close = 60.0;
    c.high = 70.0;
    c.low = 30.0;

    oc::CandleStudy study;
    auto u = study.resetCandles({c});
    requireTrue(u.hasY && u.yDomain.min == 30.0 && u.yDomain.max == 70.0, "low..high bounds");

    class NullCompositor : public oc::Compositor {
    public:
      void setupHighDPI(double, double) override {}
      void clear() override {}
      void render(const oc::ShapeBatch&) override {}
      void renderShapes(const oc::ShapeList&) override {}
      void setClipRegion(const oc::Bounds&) override {}
      void clearClipRegion() override {}
      void drawBorder(const oc::Bounds&) override {}
    } comp;

    study.renderTo(comp, scales, oc::Bounds{0, 0, 500, 400});
    const auto& pts = study.batch().points();
    requireTrue(pts.size() == 1, "one candle drawn");
    const auto& p = pts[0];
    requireClose(p.x, 50.0, 1e-9, "x at center");
    requireClose(p.body.y, 160.0, 1e-9, "body top");
    requireClose(p.body.height, 80.0, 1e-9, "body height");
    requireClose(p.body.width, 70.0, 1e-9, "70% of box");
    requireClose(p.upperWick.y2, 120.0, 1e-9, "high");
    requireClose(p.lowerWick.y1, 280.0, 1e-9, "low");
    requireTrue(p.isPositive, "close >= open");
    std::printf("  Test 8 (candle geometry): PASS\n");
  }

  std::printf("C2.1 studies: ALL PASS\n");
  return 0;
}
