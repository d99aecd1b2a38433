#pragma once
#include <cstdint>
#include <random>

namespace mmsim {

struct PriceProcess {
  // Advances to the next price. Returns false once the source is exhausted.
  virtual bool next() = 0;
  virtual double price() const = 0;
  virtual ~PriceProcess() = default;
};

// Additive Gaussian random walk: p' = p + N(drift, volatility).
class RandomWalk : public PriceProcess {
public:
  RandomWalk(double initial_price, double drift, double volatility,
             uint64_t seed);

  bool next() override;
  double price() const override { return price_; }

private:
  double price_;
  std::mt19937_64 rng_;
  std::normal_distribution<double> step_;
};

} // namespace mmsim
