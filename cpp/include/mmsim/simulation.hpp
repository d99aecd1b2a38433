#pragma once
#include "config.hpp"
#include "matching_engine.hpp"
#include "order_book.hpp"
#include "price_process.hpp"
#include "simulation_result.hpp"
#include "trade.hpp"
#include "trader.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace mmsim {

// Applies every trade to the buyer's and seller's portfolios.
// Throws std::out_of_range if a trade names a trader not in the map.
void settle(const std::vector<Trade> &trades,
            const std::unordered_map<TraderId, Trader *> &traders);

class Simulation {
public:
  // Traders act in the given order each tick. The tracked trader's
  // portfolio is sampled and checked for bankruptcy.
  Simulation(std::unique_ptr<PriceProcess> prices,
             std::vector<std::unique_ptr<Trader>> traders,
             std::size_t tracked_trader,
             std::unique_ptr<MatchingEngine> engine =
                 std::make_unique<MidpointMatchingEngine>());

  // Runs one tick. Returns false when the run is over (bankruptcy or the
  // price process ran out).
  bool step();

  SimulationResult run(int64_t ticks);

  const OrderBook &book() const { return book_; }
  const Trader &tracked() const { return *traders_[tracked_]; }
  const std::vector<std::unique_ptr<Trader>> &traders() const {
    return traders_;
  }
  const std::vector<Trade> &last_trades() const { return last_trades_; }
  const SimulationResult &result() const { return result_; }
  int64_t tick() const { return tick_; }
  bool finished() const { return finished_; }

private:
  std::unique_ptr<PriceProcess> prices_;
  std::vector<std::unique_ptr<Trader>> traders_;
  std::unordered_map<TraderId, Trader *> by_id_;
  std::size_t tracked_;
  std::unique_ptr<MatchingEngine> engine_;

  OrderBook book_;
  std::vector<Trade> last_trades_;
  SimulationResult result_;
  int64_t tick_ = 0;
  double initial_value_ = 0.0;
  double peak_value_ = 0.0;
  bool finished_ = false;
};

// Builds the configured traders: the market maker first, then the noise
// traders in order, each seeded from config.seed.
std::vector<std::unique_ptr<Trader>>
make_traders(const SimulationConfig &config);

SimulationResult simulate(const SimulationConfig &config);

// Same as simulate() but prices come from stored history.
SimulationResult simulate_replay(const SimulationConfig &config,
                                 const ReplayConfig &replay);

} // namespace mmsim
