#pragma once
#include <cstdint>
#include <ostream>
#include <stdexcept>

namespace mmsim {

using OrderId = int64_t;
using TraderId = int64_t;

enum class Side { Bid, Ask };

struct InvalidSide : std::logic_error {
  explicit InvalidSide(Side side);
};

// Process-wide unique id, shared by orders and traders.
int64_t next_id();

struct Order {
  OrderId id;
  double price;
  double size;
  Side side;
  TraderId owner;

  // Throws std::invalid_argument when size is not positive.
  Order(double price, double size, Side side, TraderId owner);
};

std::ostream &operator<<(std::ostream &os, const Order &order);

} // namespace mmsim
