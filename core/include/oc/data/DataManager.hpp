#pragma once
#include "oc/data/Candle.hpp"

#include <functional>
#include <string>
#include <vector>

namespace oc {

struct HistoricalBatch {
  std::vector<OhlcCandle> candles;
  bool hasMore{false};
  bool ok{true};
  std::string error;
};

// Source of candles. Each loadHistorical() call returns the next older batch.
// The callback may run before loadHistorical() returns or later, but always
// on the engine thread.
class DataManager {
public:
  using HistoricalCallback = std::function<void(const HistoricalBatch&)>;
  using RealtimeCallback = std::function<void(const OhlcCandle&)>;

  virtual ~DataManager() = default;
  virtual void loadHistorical(HistoricalCallback done) = 0;
  virtual void onRealtimeUpdate(RealtimeCallback cb) = 0;
};

} // namespace oc
