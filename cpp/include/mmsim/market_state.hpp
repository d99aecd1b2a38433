#pragma once
#include "order_book.hpp"
#include <cstdint>

namespace mmsim {

// What a trader sees when asked for orders. Read only.
struct MarketState {
  const OrderBook &book;
  double true_price;
  int64_t tick;
};

} // namespace mmsim
