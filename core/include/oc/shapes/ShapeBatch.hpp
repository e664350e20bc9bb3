#pragma once
#include "oc/shapes/Shapes.hpp"
#include "oc/style/Color.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace oc {

enum class BatchKind : std::uint8_t { Candle, Bar, Polyline, BandFill };

const char* batchKindName(BatchKind kind);

// Pixel-space primitives owned by a single study. Compositors switch on
// kind() and downcast to the concrete batch.
class ShapeBatch {
public:
  virtual ~ShapeBatch() = default;
  virtual BatchKind kind() const = 0;
  virtual std::size_t size() const = 0;
  bool empty() const { return size() == 0; }
};

template <typename TPoint, BatchKind K>
class PointBatch : public ShapeBatch {
public:
  using PointType = TPoint;

  BatchKind kind() const override { return K; }
  std::size_t size() const override { return points_.size(); }

  // Replace the last point; append when empty.
  void update(const TPoint& p) {
    if (points_.empty()) points_.push_back(p);
    else points_.back() = p;
  }
  void append(const TPoint& p) { points_.push_back(p); }

  // Bulk replace. Keeps capacity so steady-state rebuilds don't allocate.
  template <typename It>
  void reset(It first, It last) {
    points_.assign(first, last);
  }
  void reset(const std::vector<TPoint>& points) { points_ = points; }
  void clear() { points_.clear(); }

  // Rebuild in place: caller pushes points after clear().
  std::vector<TPoint>& mutablePoints() { return points_; }
  const std::vector<TPoint>& points() const { return points_; }

protected:
  std::vector<TPoint> points_;
};

struct WickSpan {
  double y1, y2;
};

struct CandleBody {
  double y, height, width;
};

struct CandlePoint {
  double x;
  WickSpan upperWick;  // body top -> high
  WickSpan lowerWick;  // low -> body bottom
  CandleBody body;
  bool isPositive;
};

class CandleBatch : public PointBatch<CandlePoint, BatchKind::Candle> {
public:
  Color upColor{colorFromHex(0x26A69A)};
  Color downColor{colorFromHex(0xEF5350)};
};

// x is the left edge.
struct BarPoint {
  double x, y, width, height;
  bool isPositive;
};

class BarBatch : public PointBatch<BarPoint, BatchKind::Bar> {
public:
  Color upColor{colorFromHex(0x26A69A, 0.5f)};
  Color downColor{colorFromHex(0xEF5350, 0.5f)};
};

class PolylineBatch : public PointBatch<Point, BatchKind::Polyline> {
public:
  PolylineBatch() = default;
  PolylineBatch(Color c, float width) : color(c), lineWidth(width) {}

  Color color{colorFromHex(0x4285F4)};
  float lineWidth{2.0f};
  std::vector<float> dash;
};

struct BandFillPoint {
  Point upper, middle, lower;
};

class BandFillBatch : public PointBatch<BandFillPoint, BatchKind::BandFill> {
public:
  Color fillColor{colorFromHex(0x2196F3)};
  float fillOpacity{0.1f};
  Color borderColor{colorFromHex(0x2196F3)};
  float borderWidth{1.0f};
  bool showBorders{true};
};

} // namespace oc
