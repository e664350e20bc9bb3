#pragma once
#include "oc/data/Candle.hpp"
#include "oc/shapes/Shapes.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace oc {

class CommonScaleManager;
class Compositor;
class NumericScale;
struct Theme;

// Identifies what a cached shape batch was built from. Any component moving
// forward (new data, scale mutation) forces a rebuild.
struct RenderKey {
  std::uint64_t dataEpoch{0};
  std::uint64_t timeVersion{0};
  std::uint64_t valueVersion{0};
};

inline bool operator==(const RenderKey& a, const RenderKey& b) {
  return a.dataEpoch == b.dataEpoch && a.timeVersion == b.timeVersion &&
         a.valueVersion == b.valueVersion;
}

class RenderCache {
public:
  bool needsRebuild(const RenderKey& key) const { return !valid_ || !(key == key_); }
  void store(const RenderKey& key) {
    key_ = key;
    valid_ = true;
  }
  void invalidate() { valid_ = false; }

private:
  RenderKey key_;
  bool valid_{false};
};

// A pluggable indicator. Lifecycle calls receive the full candle array
// (read-only) and report how the study's output moved the price bounds;
// an empty update means nothing to report.
class Study {
public:
  Study(std::string id, std::string name)
      : id_(std::move(id)), name_(std::move(name)) {}
  virtual ~Study() = default;

  Study(const Study&) = delete;
  Study& operator=(const Study&) = delete;

  const std::string& id() const { return id_; }
  const std::string& name() const { return name_; }

  bool enabled() const { return enabled_; }
  void setEnabled(bool on) { enabled_ = on; }

  virtual ScaleDomainUpdate updateLastCandle(const std::vector<OhlcCandle>& candles) = 0;
  virtual ScaleDomainUpdate appendNewCandle(const std::vector<OhlcCandle>& candles) = 0;
  virtual ScaleDomainUpdate prependHistoricalCandles(const std::vector<OhlcCandle>& candles) = 0;
  virtual ScaleDomainUpdate resetCandles(const std::vector<OhlcCandle>& candles) = 0;

  // Scales changed; drop cached geometry.
  virtual void updateScales(bool timeChanged, bool priceChanged) = 0;

  // Pane pixel bounds, for studies that own a Y scale.
  virtual void updateScaleBounds(const Bounds& bounds) { (void)bounds; }

  // Private value scale, nullptr when the study uses the shared price scale.
  virtual const NumericScale* yScale() const { return nullptr; }

  virtual void applyTheme(const Theme& theme) { (void)theme; }

  // Clipped pane content.
  virtual void renderTo(Compositor& compositor, const CommonScaleManager& scales,
                        const Bounds& bounds) = 0;

  // Unclipped overlays drawn above the axis area (price labels).
  virtual void renderInfrastructureTo(Compositor& compositor,
                                      const CommonScaleManager& scales,
                                      const Bounds& bounds) {
    (void)compositor;
    (void)scales;
    (void)bounds;
  }

  std::uint64_t rebuildCount() const { return rebuilds_; }
  std::uint64_t reuseCount() const { return reuses_; }

protected:
  std::uint64_t rebuilds_{0};
  std::uint64_t reuses_{0};

private:
  std::string id_;
  std::string name_;
  bool enabled_{true};
};

} // namespace oc
