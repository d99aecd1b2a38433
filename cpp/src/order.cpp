#include "mmsim/order.hpp"
#include <atomic>
#include <iomanip>
#include <ios>
#include <string>

namespace mmsim {

namespace {
std::atomic<int64_t> id_sequence{1};
}

int64_t next_id() { return id_sequence.fetch_add(1, std::memory_order_relaxed); }

InvalidSide::InvalidSide(Side side)
    : std::logic_error("Invalid order side " +
                       std::to_string(static_cast<int>(side))) {}

Order::Order(double price, double size, Side side, TraderId owner)
    : id(next_id()), price(price), size(size), side(side), owner(owner) {
  if (!(size > 0.0)) {
    throw std::invalid_argument("Order size must be positive, got " +
                                std::to_string(size));
  }
}

std::ostream &operator<<(std::ostream &os, const Order &order) {
  std::ios_base::fmtflags flags = os.flags();
  std::streamsize precision = os.precision();
  os << std::fixed << std::setprecision(3) << order.price;
  os.flags(flags);
  os.precision(precision);
  return os << " (" << order.size << " lots)";
}

} // namespace mmsim
