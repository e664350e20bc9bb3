#include "oc/style/Theme.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace oc {

// -------------------- Built-in presets --------------------

Theme darkTheme() {
  Theme t;
  t.name = "dark";
  // All fields already carry the dark-theme defaults from the struct initializers.
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "light";

  t.background = colorFromHex(0xFFFFFF);
  t.chartArea = colorFromHex(0xFAFBFC);

  t.gridColor = colorFromHex(0xE1E8ED);
  t.tickColor = colorFromHex(0x8899A6);
  t.tickLabelColor = colorFromHex(0x657786);

  t.titleColor = colorFromHex(0x14171A);
  t.textColor = colorFromHex(0x536471);

  t.candlePositive = colorFromHex(0x00BA7C);
  t.candleNegative = colorFromHex(0xFA533D);

  t.borderColor = colorFromHex(0xCFD9DE);
  t.dividerColor = colorFromHex(0xEFF3F4);
  return t;
}

bool themeByName(const std::string& name, Theme& out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "dark") {
    out = darkTheme();
    return true;
  }
  if (lower == "light") {
    out = lightTheme();
    return true;
  }
  return false;
}

} // namespace oc
