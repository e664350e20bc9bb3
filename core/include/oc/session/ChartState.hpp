#pragma once
#include <string>

namespace oc {

// Visible window in candle indices.
struct ViewState {
  double startIndex{0};
  double endIndex{-1};
};

// Serializable snapshot of what the user is looking at.
struct ChartState {
  std::string version{"1.0"};
  ViewState view;
  double zoomLevel{100.0};   // informational; view wins on restore
  std::string themeName;     // "dark" or "light"

  // Optional metadata
  std::string symbol;        // e.g. "BTCUSD"
  std::string timeframe;     // e.g. "1m"
};

std::string serializeChartState(const ChartState& state);

// Deserialize a JSON string into ChartState. Returns false on error.
bool deserializeChartState(const std::string& json, ChartState& out);

} // namespace oc
