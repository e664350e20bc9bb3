#pragma once
#include "oc/style/Color.hpp"

#include <string>

namespace oc {

struct Theme {
  std::string name;

  // Background
  Color background{colorFromHex(0x000000)};
  Color chartArea{colorFromHex(0x16181C)};

  // Grid/axis
  Color gridColor{colorFromHex(0x2F3336)};
  Color tickColor{colorFromHex(0x71767B)};
  Color tickLabelColor{colorFromHex(0x8B98A5)};
  float gridLineWidth{1.0f};
  float tickLineWidth{1.0f};

  // Text
  Color titleColor{colorFromHex(0xE7E9EA)};
  Color textColor{colorFromHex(0xCFD2D6)};
  float axisFontSize{11.0f};

  // Candles and volume
  Color candlePositive{colorFromHex(0x00D084)};
  Color candleNegative{colorFromHex(0xF4212E)};
  float volumeAlpha{0.5f};

  Color lastPriceLine{colorFromHex(0x2962FF)};

  // Borders
  Color borderColor{colorFromHex(0x3E4144)};
  Color dividerColor{colorFromHex(0x2F3336)};
};

// Built-in presets
Theme darkTheme();
Theme lightTheme();

// "dark" / "light" (case-insensitive). Returns false for unknown names.
bool themeByName(const std::string& name, Theme& out);

} // namespace oc
