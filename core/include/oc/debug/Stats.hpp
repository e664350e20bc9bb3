#pragma once
#include <cstdint>

namespace oc {

struct DebugToggles {
  bool showPaneBounds = false;  // outline every pane after the chart border
};

struct Stats {
  // Timing
  double frameMs = 0.0;

  // Rendering
  std::uint64_t frameCount = 0;
  std::uint32_t drawCalls = 0;      // renderShapes calls in the last frame
  std::uint64_t renderRequests = 0;

  // Study shape-batch cache
  std::uint64_t batchRebuilds = 0;
  std::uint64_t batchReuses = 0;

  DebugToggles debug{};
};

} // namespace oc
