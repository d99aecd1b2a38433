#pragma once
#include "order.hpp"

namespace mmsim {

struct Trade {
  TraderId buyer;
  TraderId seller;
  double size;
  double price;
};

} // namespace mmsim
