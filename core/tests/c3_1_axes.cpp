// C3.1 - Price/time axes: label formats, tick generation, shapes

#include "oc/axis/NumericAxis.hpp"
#include "oc/axis/TimeAxis.hpp"
#include "oc/math/TimeFormat.hpp"
#include "oc/scale/NumericScale.hpp"
#include "oc/scale/OrdinalTimeScale.hpp"
#include "oc/style/Theme.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
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

// 2023-11-14 22:00:00 UTC
static constexpr std::int64_t kHourAligned = 1699999200000;

int main() {
  // ---- Test 1: Price label formats ----
  {
    requireTrue(oc::formatPriceLabel(1.5e9) == "1.5B", "billions");
    requireTrue(oc::formatPriceLabel(2.5e6) == "2.5M", "millions");
    requireTrue(oc::formatPriceLabel(1234.0) == "1.2K", "thousands");
    requireTrue(oc::formatPriceLabel(150.4) == "150", "whole from 100");
    requireTrue(oc::formatPriceLabel(42.123) == "42.12", "two decimals");
    requireTrue(oc::formatPriceLabel(0.5) == "0.5000", "four decimals below 1");
    requireTrue(oc::formatPriceLabel(0.0) == "0.00", "zero");
    requireTrue(oc::formatPriceLabel(-2500.0) == "-2.5K", "negative");
    std::printf("  Test 1 (price labels): PASS\n");
  }

  // ---- Test 2: Numeric ticks on the nice spacing ----
  {
    oc::NumericScale scale(0.0, 100.0, 0.0, 400.0, true);
    oc::NumericAxis axis(scale, oc::AxisPosition::Right, 8);
    auto ticks = axis.ticks();
    requireTrue(ticks.size() == 11, "0..100 step 10");
    requireClose(ticks[0].position, 400.0, 1e-9, "0 at bottom");
    requireClose(ticks[10].position, 0.0, 1e-9, "100 at top");
    requireTrue(ticks[5].label == "50.00", "label 50");
    requireTrue(ticks[10].label == "100", "label 100");

    oc::ShapeList shapes;
    oc::Bounds b{0, 0, 800, 400};
    axis.gridShapes(b, shapes);
    requireTrue(shapes.lines.size() == 11, "one grid line per tick");
    requireClose(shapes.lines[0].end.x, 800.0, 1e-9, "grid spans pane");

    shapes.clear();
    axis.labelShapes(b, shapes);
    requireTrue(shapes.texts.size() == 11, "all labels in pane");
    requireClose(shapes.texts[0].position.x, 814.0, 1e-9, "tick length + offset");
    requireTrue(shapes.texts[0].align == oc::TextAlign::Left, "right axis aligns left");

    shapes.clear();
    axis.labelShapes(oc::Bounds{0, 100, 800, 200}, shapes);
    requireTrue(shapes.texts.size() == 5, "off-pane labels skipped");

    oc::AxisOptions opts;
    opts.showGrid = false;
    axis.setOptions(opts);
    shapes.clear();
    axis.gridShapes(b, shapes);
    requireTrue(shapes.lines.empty(), "grid disabled");

    oc::NumericAxis sub(scale, oc::AxisPosition::Right, 6);
    auto subTicks = sub.ticks();
    requireTrue(subTicks.size() == 6, "six-tick axis steps by 20");
    requireClose(subTicks[1].value, 20.0, 1e-9, "second tick at 20");
    requireClose(subTicks.back().value, 100.0, 1e-9, "ends at domain max");

    oc::NumericAxis coarse(scale, oc::AxisPosition::Right, 3);
    requireTrue(coarse.ticks().size() == 3, "0, 50, 100");

    oc::NumericScale offset(85.0, 115.0, 0.0, 300.0, true);
    oc::NumericAxis price(offset, oc::AxisPosition::Right, 8);
    auto priceTicks = price.ticks();
    requireTrue(priceTicks.size() == 3, "step 10 inside 85..115");
    requireClose(priceTicks.front().value, 90.0, 1e-9, "first multiple above the min");
    requireClose(priceTicks.back().value, 110.0, 1e-9, "last multiple below the max");
    std::printf("  Test 2 (numeric ticks): PASS\n");
  }

  // ---- Test 3: Calendar helpers ----
  {
    oc::CalendarTime c = oc::toCalendar(kHourAligned, 0);
    requireTrue(c.year == 2023 && c.month == 11 && c.day == 14, "date");
    requireTrue(c.hour == 22 && c.minute == 0, "time");

    oc::CalendarTime ist = oc::toCalendar(kHourAligned, oc::TimeAxis::kDefaultTzOffsetMs);
    requireTrue(ist.day == 15 && ist.hour == 3 && ist.minute == 30, "UTC+5:30");

    requireTrue(oc::formatTimeLabel(0, oc::TimeLabelKind::Full, 0) == "1/1 00:00", "full");
    requireTrue(oc::formatTimeLabel(5000, oc::TimeLabelKind::Time, 0) == "00:00:05", "seconds");
    requireTrue(oc::formatTimeLabel(kHourAligned, oc::TimeLabelKind::Month, 0) == "Nov", "month");
    requireTrue(oc::formatTimeLabel(kHourAligned, oc::TimeLabelKind::Year, 0) == "2023", "year");
    requireTrue(oc::formatTimeLabel(kHourAligned, oc::TimeLabelKind::Day, 0) == "14", "day");
    std::printf("  Test 3 (calendar): PASS\n");
  }

  // ---- Test 4: Pivot selection ----
  {
    oc::TimePivot p = oc::choosePivotLevel(2.0 * 3600.0, 10);
    requireTrue(p.level == oc::TimeLevel::Minute && p.subdivision == 10, "2h -> 10 minutes");
    p = oc::choosePivotLevel(5.0 * 86400.0, 10);
    requireTrue(p.level == oc::TimeLevel::Hour && p.subdivision == 12, "5d -> 12 hours");
    p = oc::choosePivotLevel(10.0 * 365.0 * 86400.0, 5);
    requireTrue(p.level == oc::TimeLevel::Year && p.subdivision == 2, "10y -> 2 years");

    oc::TimePivot sixHours{oc::TimeLevel::Hour, 6};
    requireTrue(!oc::isPivotTime(kHourAligned, sixHours, 0), "22:00 not a 6h pivot");
    requireTrue(oc::isPivotTime(kHourAligned + 2 * 3600000, sixHours, 0), "00:00 is");
    std::printf("  Test 4 (pivots): PASS\n");
  }

  // ---- Test 5: Time ticks over an hour of minute candles ----
  {
    std::vector<std::int64_t> ts;
    for (int i = 0; i < 60; i++) ts.push_back(kHourAligned + i * 60000);
    oc::OrdinalTimeScale scale(ts, 0.0, 600.0, 0.0, 59.0);
    oc::TimeAxis axis(scale, oc::AxisPosition::Bottom, {}, 0);

    auto ticks = axis.ticks();
    requireTrue(ticks.size() >= 5 && ticks.size() <= 12, "about ten ticks");
    requireTrue(ticks.front().label == "22:00", "first label");
    requireTrue(static_cast<std::int64_t>(ticks.back().value) == ts.back(), "last candle included");
    requireClose(ticks.back().position, 595.0, 1e-9, "last candle center");
    for (std::size_t i = 1; i < ticks.size(); i++) {
      requireTrue(ticks[i].position > ticks[i - 1].position, "positions increase");
      requireTrue(!ticks[i].label.empty(), "labelled");
    }

    oc::ShapeList shapes;
    axis.labelShapes(oc::Bounds{0, 0, 600, 300}, shapes);
    requireTrue(shapes.texts.size() == ticks.size(), "all time labels inside");
    requireClose(shapes.texts[0].position.y, 314.0, 1e-9, "below the pane");
    requireTrue(shapes.texts[0].align == oc::TextAlign::Center, "centered");

    oc::OrdinalTimeScale empty({}, 0.0, 600.0);
    oc::TimeAxis none(empty, oc::AxisPosition::Bottom);
    requireTrue(none.ticks().empty(), "empty scale -> no ticks");
    std::printf("  Test 5 (time ticks): PASS\n");
  }

  // ---- Test 6: Theme drives axis style ----
  {
    oc::Theme t = oc::lightTheme();
    oc::AxisStyle s = oc::axisStyleFromTheme(t);
    requireTrue(s.gridColor == t.gridColor, "grid color");
    requireTrue(s.labelColor == t.tickLabelColor, "label color");
    std::printf("  Test 6 (axis style): PASS\n");
  }

  // ---- Test 7: Fractional window keeps labels on their candles ----
  {
    std::vector<std::int64_t> ts;
    for (int i = 0; i < 100; i++) ts.push_back(kHourAligned + i * 60000);
    oc::OrdinalTimeScale scale(ts, 0.0, 1000.0, 50.5, 98.5);
    oc::TimeAxis axis(scale, oc::AxisPosition::Bottom, {}, 0);

    auto ticks = axis.ticks();
    requireTrue(!ticks.empty(), "ticks produced");
    requireTrue(static_cast<std::int64_t>(ticks.back().value) == ts[99],
                "last tick names the ceil(end) candle");
    requireClose(ticks.back().position, scale.scaledValueFromIndex(99.0), 1e-9,
                 "last tick drawn at that candle");
    requireClose(ticks.back().position, 1000.0, 1e-6, "which is the right edge");
    for (const auto& t : ticks) {
      const double index =
          static_cast<double>(static_cast<std::int64_t>(t.value) - kHourAligned) / 60000.0;
      requireClose(t.position, scale.scaledValueFromIndex(index), 1e-9, "label over its candle");
    }
    std::printf("  Test 7 (fractional window): PASS\n");
  }

  std::printf("C3.1 axes: ALL PASS\n");
  return 0;
}
