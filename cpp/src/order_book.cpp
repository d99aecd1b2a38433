#include "mmsim/order_book.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mmsim {

namespace {

bool lower_price(const Order &a, const Order &b) { return a.price < b.price; }

void erase_id(std::vector<Order> &orders, OrderId id) {
  orders.erase(std::remove_if(orders.begin(), orders.end(),
                              [id](const Order &o) { return o.id == id; }),
               orders.end());
}

} // namespace

std::vector<Order> &OrderBook::side_orders(Side side) {
  switch (side) {
  case Side::Bid:
    return bids_;
  case Side::Ask:
    return asks_;
  }
  throw InvalidSide(side);
}

void OrderBook::insert(const Order &order) {
  std::vector<Order> &orders = side_orders(order.side);
  if (contains(order.id)) {
    throw std::invalid_argument("Order " + std::to_string(order.id) +
                                " is already in the book");
  }
  orders.push_back(order);
}

bool OrderBook::contains(OrderId id) const {
  auto same_id = [id](const Order &o) { return o.id == id; };
  return std::any_of(bids_.begin(), bids_.end(), same_id) ||
         std::any_of(asks_.begin(), asks_.end(), same_id);
}

std::optional<Order> OrderBook::best_bid() const {
  if (bids_.empty()) {
    return std::nullopt;
  }
  // max_element keeps the first of equal maxima.
  return *std::max_element(bids_.begin(), bids_.end(), lower_price);
}

std::optional<Order> OrderBook::best_ask() const {
  if (asks_.empty()) {
    return std::nullopt;
  }
  return *std::min_element(asks_.begin(), asks_.end(), lower_price);
}

std::optional<double> OrderBook::mid_price() const {
  auto bid = best_bid();
  auto ask = best_ask();
  if (bid && ask) {
    return (bid->price + ask->price) / 2.0;
  }
  if (bid) {
    return bid->price;
  }
  if (ask) {
    return ask->price;
  }
  return std::nullopt;
}

void OrderBook::cancel(OrderId id) {
  erase_id(bids_, id);
  erase_id(asks_, id);
}

void OrderBook::cancel(const Order &order) {
  erase_id(side_orders(order.side), order.id);
}

void OrderBook::amend(const Order &order) {
  std::vector<Order> &orders = side_orders(order.side);
  erase_id(orders, order.id);
  orders.push_back(order);
}

void OrderBook::clear() {
  bids_.clear();
  asks_.clear();
}

std::string OrderBook::to_string() const {
  std::ostringstream out;
  auto bid = best_bid();
  auto ask = best_ask();
  out << "Best bid is ";
  if (bid) {
    out << *bid;
  } else {
    out << "none";
  }
  out << " and best ask is ";
  if (ask) {
    out << *ask;
  } else {
    out << "none";
  }
  return out.str();
}

} // namespace mmsim
