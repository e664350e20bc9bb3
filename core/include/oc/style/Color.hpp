#pragma once
#include <array>
#include <cstdint>

namespace oc {

// RGBA, each channel in [0, 1].
using Color = std::array<float, 4>;

inline Color colorFromHex(std::uint32_t rgb, float alpha = 1.0f) {
  return Color{static_cast<float>((rgb >> 16) & 0xFF) / 255.0f,
               static_cast<float>((rgb >> 8) & 0xFF) / 255.0f,
               static_cast<float>(rgb & 0xFF) / 255.0f,
               alpha};
}

} // namespace oc
