#pragma once
#include "order_book.hpp"
#include "trade.hpp"
#include <vector>

namespace mmsim {

// Size differences at or below this are treated as equal when crossing.
constexpr double kSizeEpsilon = 1e-9;

struct MatchingEngine {
  // Crosses the book in place and returns the resulting trades.
  virtual std::vector<Trade> match(OrderBook &book) = 0;

  virtual ~MatchingEngine() = default;
};

// Greedy best-against-best crossing. Each trade executes at the midpoint of
// the crossing bid and ask for the smaller of the two sizes. Fully filled
// orders leave the book; a partially filled order is amended in place with
// its remaining size.
class MidpointMatchingEngine : public MatchingEngine {
public:
  std::vector<Trade> match(OrderBook &book) override;
};

} // namespace mmsim
