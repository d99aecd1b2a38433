#include "mmsim/config.hpp"
#include "mmsim/simulation.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

namespace {

void print_usage(const char *argv0) {
  std::cerr << "usage: " << argv0 << " [ticks] [seed]\n"
            << "       " << argv0 << " --replay <start_ts> <end_ts>"
            << std::endl;
}

} // namespace

int main(int argc, char **argv) {
  mmsim::SimulationConfig config;
  mmsim::SimulationResult result;

  try {
    if (argc > 1 && std::strcmp(argv[1], "--replay") == 0) {
      if (argc != 4) {
        print_usage(argv[0]);
        return 1;
      }
      mmsim::ReplayConfig replay;
      replay.start_ts = std::stoll(argv[2]);
      replay.end_ts = std::stoll(argv[3]);
      config.ticks = INT64_MAX;
      result = mmsim::simulate_replay(config, replay);
    } else {
      if (argc > 3) {
        print_usage(argv[0]);
        return 1;
      }
      if (argc > 1) {
        config.ticks = std::stoll(argv[1]);
      }
      if (argc > 2) {
        config.seed = std::stoull(argv[2]);
      }
      if (config.ticks <= 0) {
        std::cerr << "ticks must be positive" << std::endl;
        return 1;
      }
      result = mmsim::simulate(config);
    }
  } catch (const std::exception &e) {
    std::cerr << "Simulation failed: " << e.what() << std::endl;
    return 1;
  }

  if (result.bankrupt) {
    std::cout << "Trader went bankrupt at time " << result.bankruptcy_tick
              << std::endl;
  }

  std::cout << "ticks " << result.ticks.size() << "\n"
            << "trades " << result.trades << "\n"
            << "volume " << result.volume << std::endl;
  if (!result.portfolio_value.empty()) {
    std::cout << "final value " << result.portfolio_value.back() << "\n"
              << "max drawdown "
              << *std::max_element(result.drawdown.begin(),
                                   result.drawdown.end())
              << std::endl;
  }
  return 0;
}
