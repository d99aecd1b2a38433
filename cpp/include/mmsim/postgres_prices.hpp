#pragma once
#include "config.hpp"
#include "price_process.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace mmsim {

std::string connection_string(const DatabaseConfig &config);

// Replays close prices from TimescaleDB/PostgreSQL in timestamp order.
// Rows are loaded once at construction; the table needs (ts, close) columns.
class PostgresPriceReplay : public PriceProcess {
public:
  explicit PostgresPriceReplay(const ReplayConfig &config);

  // Replays closes already fetched. Throws std::invalid_argument if empty.
  explicit PostgresPriceReplay(std::vector<double> closes);

  bool next() override;
  double price() const override;

  std::size_t size() const { return closes_.size(); }

private:
  std::vector<double> closes_;
  std::size_t index_ = 0;
  bool started_ = false;
};

} // namespace mmsim
