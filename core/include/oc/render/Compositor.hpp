#pragma once
#include "oc/shapes/ShapeBatch.hpp"
#include "oc/shapes/Shapes.hpp"

namespace oc {

// Rendering backend. The engine only produces pixel-space primitives;
// how they turn into pixels is up to the implementation.
class Compositor {
public:
  virtual ~Compositor() = default;

  virtual void setupHighDPI(double width, double height) = 0;
  virtual void clear() = 0;
  virtual void render(const ShapeBatch& batch) = 0;
  virtual void renderShapes(const ShapeList& shapes) = 0;
  virtual void setClipRegion(const Bounds& bounds) = 0;
  virtual void clearClipRegion() = 0;
  virtual void drawBorder(const Bounds& bounds) = 0;
};

} // namespace oc
