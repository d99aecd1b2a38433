#pragma once
#include <cstdint>
#include <vector>

namespace mmsim {

struct SimulationResult {
  // One sample per completed tick.
  std::vector<int64_t> ticks;
  std::vector<double> prices;
  std::vector<double> portfolio_value;
  std::vector<double> pnl;
  std::vector<double> drawdown;

  int64_t trades = 0;
  double volume = 0.0;

  bool bankrupt = false;
  int64_t bankruptcy_tick = 0;
};

} // namespace mmsim
