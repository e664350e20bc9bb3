#include "oc/shapes/ShapeBatch.hpp"

namespace oc {

const char* batchKindName(BatchKind kind) {
  switch (kind) {
    case BatchKind::Candle:   return "candle";
    case BatchKind::Bar:      return "bar";
    case BatchKind::Polyline: return "polyline";
    case BatchKind::BandFill: return "bandfill";
  }
  return "unknown";
}

} // namespace oc
