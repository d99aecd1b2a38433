#pragma once
#include "market_state.hpp"
#include "order.hpp"
#include "portfolio.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace mmsim {

class Trader {
public:
  Trader(double cash, double lots);

  // Orders to enter this tick. May be empty.
  virtual std::vector<Order> generate_orders(const MarketState &market) = 0;

  virtual std::string name() const = 0;

  TraderId id() const { return id_; }

  Portfolio &portfolio() { return portfolio_; }
  const Portfolio &portfolio() const { return portfolio_; }

  double portfolio_value(double price) const { return portfolio_.value(price); }

  virtual ~Trader() = default;

private:
  TraderId id_;
  Portfolio portfolio_;
};

// Quotes both sides around the reference price every tick.
class MarketMaker : public Trader {
public:
  MarketMaker(double markup, double size, double cash, double lots);

  std::vector<Order> generate_orders(const MarketState &market) override;
  std::string name() const override { return "market_maker"; }

  double markup() const { return markup_; }
  double size() const { return size_; }

private:
  double markup_;
  double size_;
};

// Enters one order per tick on a random side, priced around the book mid.
// Abstains while the book has no quotes.
class NoiseTrader : public Trader {
public:
  NoiseTrader(double size, double volatility, double cash, double lots,
              uint64_t seed);

  std::vector<Order> generate_orders(const MarketState &market) override;
  std::string name() const override { return "noise_trader"; }

  double size() const { return size_; }
  double volatility() const { return volatility_; }

private:
  double size_;
  double volatility_;
  std::mt19937_64 rng_;
};

} // namespace mmsim
