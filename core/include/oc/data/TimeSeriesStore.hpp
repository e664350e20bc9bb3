#pragma once
#include "oc/data/Candle.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace oc {

enum class ChangeKind : std::uint8_t { Append, Prepend, Update, Reset };

struct StoreChange {
  ChangeKind kind;
  std::size_t count; // candles added (Append/Prepend), 1 for Update, size for Reset
};

// Ordered candle storage: strictly ascending, unique timestamps.
class TimeSeriesStore {
public:
  using ChangeCallback = std::function<void(const StoreChange&)>;

  void setOnChange(ChangeCallback cb) { onChange_ = std::move(cb); }

  // Equal to the last timestamp replaces it (Update); newer appends (Append).
  // Anything older lands in sorted position and is reported as Reset, since
  // the indices of later candles move.
  void add(const OhlcCandle& candle);

  // Older candles. Existing timestamps win over incoming duplicates.
  void prepend(const std::vector<OhlcCandle>& candles);

  void reset(const std::vector<OhlcCandle>& candles);

  const std::vector<OhlcCandle>& getAll() const { return candles_; }
  std::size_t size() const { return candles_.size(); }
  bool empty() const { return candles_.empty(); }
  const OhlcCandle& last() const { return candles_.back(); }

  std::uint64_t revision() const { return revision_; }

private:
  void emit(ChangeKind kind, std::size_t count);

  std::vector<OhlcCandle> candles_;
  ChangeCallback onChange_;
  std::uint64_t revision_{0};
};

} // namespace oc
