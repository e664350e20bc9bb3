#pragma once
#include "oc/render/MultiPaneRenderer.hpp"
#include "oc/viewport/ZoomManager.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace oc {

class Study;

// One study to attach at construction. pane == "main" makes it an overlay;
// any other value names a sub-pane, whose first study becomes its primary.
struct StudySpec {
  std::string type;            // candles, volume, lastPrice, sma, ema, rsi, bollinger
  std::string pane{"main"};
  int period{0};               // 0 = the study's default
  double multiplier{2.0};      // bollinger only
  double heightPercent{0.2};   // sub-pane height, read from the pane's first study
};

struct ChartConfig {
  double width{800.0};
  double height{600.0};
  Padding padding;
  std::string theme{"dark"};
  int visibleCandles{120};
  int loadMoreThreshold{20};
  ZoomManagerConfig zoom;
  std::int64_t tzOffsetMs{19800000};
  std::vector<StudySpec> studies;
};

// Missing keys keep their defaults. Returns false with a message in `err`
// for malformed JSON, wrong types or out-of-range values.
bool parseChartConfig(const std::string& json, ChartConfig& out, std::string& err);

std::string serializeChartConfig(const ChartConfig& config);

// Throws std::invalid_argument for an unknown type or a bad period.
std::unique_ptr<Study> makeStudy(const StudySpec& spec);

} // namespace oc
