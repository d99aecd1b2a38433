#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mmsim {

struct DatabaseConfig {
  std::string host = "localhost";
  int port = 5432;
  std::string database = "crypto";
  std::string user;
  std::string password;
};

// Historical closes to replay instead of a random walk.
struct ReplayConfig {
  DatabaseConfig db_config;
  std::string table = "btcusdt_1m";
  int64_t start_ts = 0;
  int64_t end_ts = 0;
};

struct MarketMakerConfig {
  double markup = 0.01;
  double size = 100.0;
  double cash = 10e10;
  double lots = 10e10;
};

struct NoiseTraderConfig {
  double size = 5.0;
  double volatility = 25.0;
  double cash = 50000.0;
  double lots = 100.0;
};

struct SimulationConfig {
  int64_t ticks = 100000;
  double initial_price = 100.0;
  double drift = 0.0;
  double volatility = 0.25;
  uint64_t seed = 42;

  MarketMakerConfig market_maker;
  std::vector<NoiseTraderConfig> noise_traders{NoiseTraderConfig{}};

  // Index into noise_traders of the trader whose portfolio is sampled.
  std::size_t tracked_trader = 0;
};

} // namespace mmsim
