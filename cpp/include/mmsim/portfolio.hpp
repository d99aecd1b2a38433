#pragma once

namespace mmsim {

struct Portfolio {
  double cash = 0.0;
  double lots = 0.0;

  // Cash moves by the per-unit price only, never price * size.
  void buy(double size, double price);
  void sell(double size, double price);

  double value(double price) const { return cash + lots * price; }
};

} // namespace mmsim
