#pragma once
#include <cstddef>
#include <cstdint>

namespace oc {

// One time bucket. Timestamps are milliseconds since the Unix epoch (UTC).
struct OhlcCandle {
  std::int64_t timestamp{0};
  double open{0}, high{0}, low{0}, close{0};
  double volume{0};
  double openInterest{0};
  bool hasOpenInterest{false};
};

// A study's output for one candle. `index` points back into the candle array.
template <typename T>
struct ComputedDataPoint {
  std::int64_t timestamp;
  T value;
  std::size_t index;
};

struct DomainRange {
  double min{0}, max{0};
};

// How a study's output extended the x / y bounds. Empty means "no change".
struct ScaleDomainUpdate {
  DomainRange xDomain;
  DomainRange yDomain;
  bool hasX{false};
  bool hasY{false};

  bool empty() const { return !hasX && !hasY; }

  static ScaleDomainUpdate y(double min, double max) {
    ScaleDomainUpdate u;
    u.yDomain = {min, max};
    u.hasY = true;
    return u;
  }
};

// Min-of-mins / max-of-maxes per axis.
inline ScaleDomainUpdate mergeDomainUpdates(const ScaleDomainUpdate& a,
                                            const ScaleDomainUpdate& b) {
  ScaleDomainUpdate r;
  if (a.hasX || b.hasX) {
    r.hasX = true;
    if (a.hasX && b.hasX) {
      r.xDomain.min = a.xDomain.min < b.xDomain.min ? a.xDomain.min : b.xDomain.min;
      r.xDomain.max = a.xDomain.max > b.xDomain.max ? a.xDomain.max : b.xDomain.max;
    } else {
      r.xDomain = a.hasX ? a.xDomain : b.xDomain;
    }
  }
  if (a.hasY || b.hasY) {
    r.hasY = true;
    if (a.hasY && b.hasY) {
      r.yDomain.min = a.yDomain.min < b.yDomain.min ? a.yDomain.min : b.yDomain.min;
      r.yDomain.max = a.yDomain.max > b.yDomain.max ? a.yDomain.max : b.yDomain.max;
    } else {
      r.yDomain = a.hasY ? a.yDomain : b.yDomain;
    }
  }
  return r;
}

} // namespace oc
