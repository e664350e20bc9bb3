#pragma once
#include "oc/style/Color.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace oc {

struct Point {
  double x{0}, y{0};
};

// Pixel rectangle, y grows downward.
struct Bounds {
  double x{0}, y{0}, width{0}, height{0};

  double right() const { return x + width; }
  double bottom() const { return y + height; }
};

inline bool operator==(const Bounds& a, const Bounds& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

enum class TextAlign : std::uint8_t { Left, Center, Right };
enum class TextBaseline : std::uint8_t { Top, Middle, Bottom };

struct LineShape {
  Point start, end;
  Color color{{1.0f, 1.0f, 1.0f, 1.0f}};
  float lineWidth{1.0f};
  std::vector<float> dash;  // empty = solid
};

struct TextShape {
  Point position;
  std::string text;
  Color color{{1.0f, 1.0f, 1.0f, 1.0f}};
  float fontSize{11.0f};
  TextAlign align{TextAlign::Left};
  TextBaseline baseline{TextBaseline::Middle};
};

struct BoxedTextShape {
  TextShape label;
  Color background{{0.0f, 0.0f, 0.0f, 1.0f}};
  float padding{3.0f};
};

// Loose primitives for one Compositor::renderShapes() call.
// Drawn in member order: lines, texts, boxed texts.
struct ShapeList {
  std::vector<LineShape> lines;
  std::vector<TextShape> texts;
  std::vector<BoxedTextShape> boxedTexts;

  bool empty() const { return lines.empty() && texts.empty() && boxedTexts.empty(); }
  void clear() {
    lines.clear();
    texts.clear();
    boxedTexts.clear();
  }
};

} // namespace oc
