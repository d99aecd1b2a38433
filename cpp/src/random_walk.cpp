#include "mmsim/price_process.hpp"
#include <stdexcept>

namespace mmsim {

RandomWalk::RandomWalk(double initial_price, double drift, double volatility,
                       uint64_t seed)
    : price_(initial_price), rng_(seed), step_(drift, volatility) {
  if (!(volatility > 0.0)) {
    throw std::invalid_argument("RandomWalk volatility must be positive");
  }
}

bool RandomWalk::next() {
  price_ += step_(rng_);
  return true;
}

} // namespace mmsim
