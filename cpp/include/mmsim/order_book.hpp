#pragma once
#include "order.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mmsim {

// Resting bids and asks for a single instrument, in insertion order.
// Best-price queries resolve ties in favour of the earliest insert.
class OrderBook {
public:
  // Throws std::invalid_argument if an order with the same id is resting.
  void insert(const Order &order);

  bool contains(OrderId id) const;

  std::optional<Order> best_bid() const;
  std::optional<Order> best_ask() const;

  // Midpoint of the best quotes, or the only quote present.
  std::optional<double> mid_price() const;

  // Both are no-ops when the id is not resting.
  void cancel(OrderId id);
  void cancel(const Order &order);

  // Replaces the resting order carrying order.id.
  void amend(const Order &order);

  void clear();

  const std::vector<Order> &bids() const { return bids_; }
  const std::vector<Order> &asks() const { return asks_; }
  bool empty() const { return bids_.empty() && asks_.empty(); }
  std::size_t size() const { return bids_.size() + asks_.size(); }

  std::string to_string() const;

private:
  std::vector<Order> &side_orders(Side side);

  std::vector<Order> bids_;
  std::vector<Order> asks_;
};

} // namespace mmsim
