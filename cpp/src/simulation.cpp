#include "mmsim/simulation.hpp"
#include "mmsim/market_state.hpp"
#include "mmsim/postgres_prices.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace mmsim {

void settle(const std::vector<Trade> &trades,
            const std::unordered_map<TraderId, Trader *> &traders) {
  for (const auto &trade : trades) {
    traders.at(trade.buyer)->portfolio().buy(trade.size, trade.price);
    traders.at(trade.seller)->portfolio().sell(trade.size, trade.price);
  }
}

Simulation::Simulation(std::unique_ptr<PriceProcess> prices,
                       std::vector<std::unique_ptr<Trader>> traders,
                       std::size_t tracked_trader,
                       std::unique_ptr<MatchingEngine> engine)
    : prices_(std::move(prices)), traders_(std::move(traders)),
      tracked_(tracked_trader), engine_(std::move(engine)) {
  if (!prices_ || !engine_) {
    throw std::invalid_argument("Simulation needs a price process and engine");
  }
  if (tracked_ >= traders_.size()) {
    throw std::invalid_argument("Tracked trader " + std::to_string(tracked_) +
                                " out of range");
  }
  for (const auto &trader : traders_) {
    by_id_[trader->id()] = trader.get();
  }
  initial_value_ = traders_[tracked_]->portfolio_value(prices_->price());
  peak_value_ = initial_value_;
}

bool Simulation::step() {
  if (finished_) {
    return false;
  }
  if (!prices_->next()) {
    finished_ = true;
    return false;
  }
  ++tick_;
  const double price = prices_->price();

  // Each trader sees the quotes of those before it.
  for (auto &trader : traders_) {
    const MarketState market{book_, price, tick_};
    for (const auto &order : trader->generate_orders(market)) {
      book_.insert(order);
    }
  }

  last_trades_ = engine_->match(book_);
  settle(last_trades_, by_id_);
  for (const auto &trade : last_trades_) {
    result_.volume += trade.size;
  }
  result_.trades += static_cast<int64_t>(last_trades_.size());

  const double value = traders_[tracked_]->portfolio_value(price);
  peak_value_ = std::max(peak_value_, value);
  result_.ticks.push_back(tick_);
  result_.prices.push_back(price);
  result_.portfolio_value.push_back(value);
  result_.pnl.push_back(value - initial_value_);
  result_.drawdown.push_back(peak_value_ - value);

  if (value < 0.0) {
    result_.bankrupt = true;
    result_.bankruptcy_tick = tick_;
    finished_ = true;
    return false;
  }

  book_.clear();
  return true;
}

SimulationResult Simulation::run(int64_t ticks) {
  for (int64_t t = 0; t < ticks; ++t) {
    if (!step()) {
      break;
    }
  }
  return result_;
}

std::vector<std::unique_ptr<Trader>>
make_traders(const SimulationConfig &config) {
  std::vector<std::unique_ptr<Trader>> traders;
  const MarketMakerConfig &mm = config.market_maker;
  traders.push_back(
      std::make_unique<MarketMaker>(mm.markup, mm.size, mm.cash, mm.lots));

  uint64_t seed = config.seed;
  for (const auto &nt : config.noise_traders) {
    traders.push_back(std::make_unique<NoiseTrader>(
        nt.size, nt.volatility, nt.cash, nt.lots, ++seed));
  }
  return traders;
}

namespace {

SimulationResult run_config(const SimulationConfig &config,
                            std::unique_ptr<PriceProcess> prices) {
  if (config.tracked_trader >= config.noise_traders.size()) {
    throw std::invalid_argument("tracked_trader must index a noise trader");
  }
  // Slot 0 is the market maker.
  Simulation sim(std::move(prices), make_traders(config),
                 config.tracked_trader + 1);
  return sim.run(config.ticks);
}

} // namespace

SimulationResult simulate(const SimulationConfig &config) {
  return run_config(config, std::make_unique<RandomWalk>(
                                config.initial_price, config.drift,
                                config.volatility, config.seed));
}

SimulationResult simulate_replay(const SimulationConfig &config,
                                 const ReplayConfig &replay) {
  return run_config(config, std::make_unique<PostgresPriceReplay>(replay));
}

} // namespace mmsim
