#include "mmsim/trader.hpp"
#include <stdexcept>

namespace mmsim {

Trader::Trader(double cash, double lots) : id_(next_id()) {
  portfolio_.cash = cash;
  portfolio_.lots = lots;
}

MarketMaker::MarketMaker(double markup, double size, double cash, double lots)
    : Trader(cash, lots), markup_(markup), size_(size) {}

std::vector<Order> MarketMaker::generate_orders(const MarketState &market) {
  return {Order(market.true_price * (1.0 - markup_), size_, Side::Bid, id()),
          Order(market.true_price * (1.0 + markup_), size_, Side::Ask, id())};
}

NoiseTrader::NoiseTrader(double size, double volatility, double cash,
                         double lots, uint64_t seed)
    : Trader(cash, lots), size_(size), volatility_(volatility), rng_(seed) {
  if (!(volatility > 0.0)) {
    throw std::invalid_argument("NoiseTrader volatility must be positive");
  }
}

std::vector<Order> NoiseTrader::generate_orders(const MarketState &market) {
  // No quotes, no information: sit out.
  auto mid = market.book.mid_price();
  if (!mid) {
    return {};
  }

  std::normal_distribution<double> coin(0.0, 1.0);
  const Side side = coin(rng_) > 0.0 ? Side::Bid : Side::Ask;

  std::normal_distribution<double> offer(*mid, volatility_);
  return {Order(offer(rng_), size_, side, id())};
}

} // namespace mmsim
