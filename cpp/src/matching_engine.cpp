#include "mmsim/matching_engine.hpp"
#include <algorithm>

namespace mmsim {

namespace {

Trade cross(const Order &bid, const Order &ask) {
  return Trade{bid.owner, ask.owner, std::min(bid.size, ask.size),
               (bid.price + ask.price) / 2.0};
}

} // namespace

std::vector<Trade> MidpointMatchingEngine::match(OrderBook &book) {
  std::vector<Trade> trades;
  if (book.bids().empty() || book.asks().empty()) {
    return trades;
  }

  // Working copies, best price first. Stable so that equal prices keep
  // insertion order, matching OrderBook::best_bid/best_ask.
  std::vector<Order> bids = book.bids();
  std::vector<Order> asks = book.asks();
  std::stable_sort(bids.begin(), bids.end(),
                   [](const Order &a, const Order &b) { return a.price > b.price; });
  std::stable_sort(asks.begin(), asks.end(),
                   [](const Order &a, const Order &b) { return a.price < b.price; });

  auto bid = bids.begin();
  auto ask = asks.begin();
  bool bid_partial = false;
  bool ask_partial = false;

  while (bid != bids.end() && ask != asks.end() && bid->price >= ask->price) {
    const Trade trade = cross(*bid, *ask);
    trades.push_back(trade);

    // Remainders within kSizeEpsilon count as fully filled.
    const double diff = bid->size - ask->size;
    if (diff > kSizeEpsilon) {
      book.cancel(*ask);
      ++ask;
      ask_partial = false;
      bid->size -= trade.size;
      bid_partial = true;
    } else if (diff < -kSizeEpsilon) {
      book.cancel(*bid);
      ++bid;
      bid_partial = false;
      ask->size -= trade.size;
      ask_partial = true;
    } else {
      book.cancel(*bid);
      book.cancel(*ask);
      ++bid;
      ++ask;
      bid_partial = false;
      ask_partial = false;
    }
  }

  // Push the reduced sizes back; fully filled orders are already gone.
  if (bid_partial) {
    book.amend(*bid);
  }
  if (ask_partial) {
    book.amend(*ask);
  }

  return trades;
}

} // namespace mmsim
