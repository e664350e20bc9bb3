#include "oc/axis/TimeAxis.hpp"
#include "oc/math/TimeFormat.hpp"
#include "oc/scale/OrdinalTimeScale.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace oc {

static int stepFor(double perTick, const int* steps, int count, int fallback) {
  for (int i = 0; i < count; ++i) {
    if (perTick >= steps[i]) return steps[i];
  }
  return fallback;
}

TimePivot choosePivotLevel(double spanSeconds, int targetTicks) {
  const double minutes = spanSeconds / 60.0;
  const double hours = minutes / 60.0;
  const double days = hours / 24.0;
  const double months = days / 30.0;
  const double years = days / 365.0;
  const double target = std::max(1, targetTicks);

  if (years > 3.0) {
    const double perYear = target / years;
    if (perYear < 1.0) {
      return {TimeLevel::Year, std::max(1, static_cast<int>(std::ceil(1.0 / perYear)))};
    }
    return {TimeLevel::Month, std::max(1, static_cast<int>(std::ceil(12.0 / perYear)))};
  }

  if (months > 2.0) {
    const double perMonth = target / months;
    if (perMonth < 1.0) {
      return {TimeLevel::Month, std::max(1, static_cast<int>(std::ceil(1.0 / perMonth)))};
    }
    static const int kDaySteps[] = {15, 10, 5, 3, 2};
    return {TimeLevel::Day, stepFor(30.0 / perMonth, kDaySteps, 5, 1)};
  }

  if (days > 1.0) {
    static const int kHourSteps[] = {12, 6, 4, 3, 2};
    return {TimeLevel::Hour, stepFor(24.0 / (target / days), kHourSteps, 5, 1)};
  }

  if (hours > 1.0) {
    static const int kMinuteSteps[] = {30, 20, 15, 10, 5};
    return {TimeLevel::Minute, stepFor(60.0 / (target / hours), kMinuteSteps, 5, 2)};
  }

  if (minutes > 1.0) {
    static const int kSecondSteps[] = {30, 20, 15, 10, 5};
    return {TimeLevel::Second, stepFor(60.0 / (target / minutes), kSecondSteps, 5, 2)};
  }

  return {TimeLevel::Second, 1};
}

bool isPivotTime(std::int64_t timestampMs, const TimePivot& pivot, std::int64_t tzOffsetMs) {
  const CalendarTime c = toCalendar(timestampMs, tzOffsetMs);
  const int sub = std::max(1, pivot.subdivision);
  switch (pivot.level) {
    case TimeLevel::Year:   return c.month == 1 && c.day == 1 && c.year % sub == 0;
    case TimeLevel::Month:  return c.day == 1 && (c.month - 1) % sub == 0;
    case TimeLevel::Day:    return (c.day - 1) % sub == 0;
    case TimeLevel::Hour:   return c.hour % sub == 0 && c.minute < 10;
    case TimeLevel::Minute: return c.minute % sub == 0;
    case TimeLevel::Second: return c.second % sub == 0;
  }
  return false;
}

std::string formatTimeLabel(std::int64_t timestampMs, TimeLabelKind kind,
                            std::int64_t tzOffsetMs) {
  const CalendarTime c = toCalendar(timestampMs, tzOffsetMs);
  char buf[32];
  switch (kind) {
    case TimeLabelKind::Full:
      std::snprintf(buf, sizeof(buf), "%d/%d %02d:%02d", c.month, c.day, c.hour, c.minute);
      break;
    case TimeLabelKind::Time:
      if (c.second != 0) {
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", c.hour, c.minute, c.second);
      } else {
        std::snprintf(buf, sizeof(buf), "%02d:%02d", c.hour, c.minute);
      }
      break;
    case TimeLabelKind::Day:
      std::snprintf(buf, sizeof(buf), "%d", c.day);
      break;
    case TimeLabelKind::Month:
      return monthName(c.month);
    case TimeLabelKind::Year:
      std::snprintf(buf, sizeof(buf), "%d", c.year);
      break;
  }
  return buf;
}

TimeAxis::TimeAxis(const OrdinalTimeScale& scale, AxisPosition position,
                   const AxisOptions& options, std::int64_t tzOffsetMs)
    : Axis(position, options), scale_(&scale), tzOffsetMs_(tzOffsetMs) {}

std::vector<TickInfo> TimeAxis::ticks() const {
  std::vector<TickInfo> out;
  const std::vector<std::int64_t> domain = scale_->visibleDomain();
  if (domain.empty()) return out;

  const auto vi = scale_->visibleDomainIndices();
  if (!std::isfinite(vi.startIndex) || !std::isfinite(vi.endIndex)) return out;

  const std::size_t len = domain.size();
  const double spanSeconds = static_cast<double>(domain.back() - domain.front()) / 1000.0;

  int target = 10;
  if (len <= 5) target = static_cast<int>(len);
  else if (len <= 15) target = static_cast<int>((len + 1) / 2);

  const TimePivot pivot = choosePivotLevel(spanSeconds, target);
  const double startFloor = std::floor(vi.startIndex);
  // Index of domain.back(); the domain runs from floor(start) to ceil(end).
  const double lastIndex = startFloor + static_cast<double>(len - 1);

  const std::size_t interval = std::max<std::size_t>(1, len / static_cast<std::size_t>(target));
  const std::size_t half = interval / 2;

  bool havePrev = false;
  CalendarTime prev;

  for (std::size_t i = 0; i < len; i += interval) {
    const std::size_t lo = i >= half ? i - half : 0;
    const std::size_t hi = std::min(len - 1, i + half);

    std::size_t best = i;
    bool found = false;
    for (std::size_t j = lo; j <= hi; ++j) {
      if (isPivotTime(domain[j], pivot, tzOffsetMs_)) {
        best = j;
        found = true;
        break;
      }
    }
    if (!found && havePrev) {
      for (std::size_t j = lo; j <= hi; ++j) {
        const CalendarTime c = toCalendar(domain[j], tzOffsetMs_);
        const bool dayChange = c.day != prev.day && spanSeconds < 86400.0 * 7.0;
        if (c.year != prev.year || c.month != prev.month || dayChange) {
          best = j;
          break;
        }
      }
    }

    const double px = scale_->scaledValueFromIndex(startFloor + static_cast<double>(best));
    if (std::isnan(px)) continue;

    const std::int64_t ts = domain[best];
    const CalendarTime c = toCalendar(ts, tzOffsetMs_);

    TimeLabelKind kind = TimeLabelKind::Time;
    if (pivot.level == TimeLevel::Year || (havePrev && c.year != prev.year)) {
      kind = TimeLabelKind::Year;
    } else if (pivot.level == TimeLevel::Month || (havePrev && c.month != prev.month)) {
      kind = TimeLabelKind::Month;
    } else if (pivot.level == TimeLevel::Day || (havePrev && c.day != prev.day)) {
      kind = TimeLabelKind::Day;
    }

    out.push_back({static_cast<double>(ts), px, formatTimeLabel(ts, kind, tzOffsetMs_)});
    prev = c;
    havePrev = true;
  }

  if (out.empty()) {
    // Everything was NaN; fall back to the two ends with full labels.
    out.push_back({static_cast<double>(domain.front()), scale_->scaledValueFromIndex(startFloor),
                   formatTimeLabel(domain.front(), TimeLabelKind::Full, tzOffsetMs_)});
    out.push_back({static_cast<double>(domain.back()), scale_->scaledValueFromIndex(lastIndex),
                   formatTimeLabel(domain.back(), TimeLabelKind::Full, tzOffsetMs_)});
    return out;
  }

  if (static_cast<std::int64_t>(out.back().value) != domain.back()) {
    const double px = scale_->scaledValueFromIndex(lastIndex);
    if (!std::isnan(px)) {
      const TimeLabelKind kind = spanSeconds > 86400.0 ? TimeLabelKind::Day : TimeLabelKind::Time;
      out.push_back({static_cast<double>(domain.back()), px,
                     formatTimeLabel(domain.back(), kind, tzOffsetMs_)});
    }
  }
  return out;
}

} // namespace oc
