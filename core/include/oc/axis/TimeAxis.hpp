#pragma once
#include "oc/axis/Axis.hpp"

#include <cstdint>
#include <string>

namespace oc {

class OrdinalTimeScale;

enum class TimeLevel : std::uint8_t { Year, Month, Day, Hour, Minute, Second };

// Calendar level a tick should land on, and the step within that level
// (e.g. Hour/6 means 00:00, 06:00, 12:00, 18:00).
struct TimePivot {
  TimeLevel level{TimeLevel::Second};
  int subdivision{1};
};

enum class TimeLabelKind : std::uint8_t { Full, Time, Day, Month, Year };

TimePivot choosePivotLevel(double spanSeconds, int targetTicks);
bool isPivotTime(std::int64_t timestampMs, const TimePivot& pivot, std::int64_t tzOffsetMs);
std::string formatTimeLabel(std::int64_t timestampMs, TimeLabelKind kind,
                            std::int64_t tzOffsetMs);

// Labels visible candles on calendar-friendly positions. Samples at a regular
// candle interval and snaps each sample to a nearby pivot or calendar boundary.
class TimeAxis : public Axis {
public:
  static constexpr std::int64_t kDefaultTzOffsetMs = 19800000;  // UTC+5:30

  TimeAxis(const OrdinalTimeScale& scale, AxisPosition position,
           const AxisOptions& options = {},
           std::int64_t tzOffsetMs = kDefaultTzOffsetMs);

  std::vector<TickInfo> ticks() const override;

  std::int64_t tzOffsetMs() const { return tzOffsetMs_; }
  void setTzOffsetMs(std::int64_t offset) { tzOffsetMs_ = offset; }

private:
  const OrdinalTimeScale* scale_;
  std::int64_t tzOffsetMs_;
};

} // namespace oc
